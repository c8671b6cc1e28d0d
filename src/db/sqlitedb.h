// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_DB_SQLITEDB_H
#define FAIRWAY_DB_SQLITEDB_H

#include "fs.h"
#include "logging.h"
#include "serialize.h"
#include "streams.h"
#include "version.h"

#include <memory>
#include <string>
#include <vector>

#include <sqlite3.h>

static const char* const DEFAULT_DB_FILENAME = "leaderboard.sqlite";

class SQLiteBatch;

/**
 * An instance of this class represents one SQLite database.
 *
 * Layout is a single key/value table:
 *   main(key BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID
 * Keys and values are serialized with CDataStream(SER_DISK, CLIENT_VERSION).
 */
class SQLiteDatabase
{
    friend class SQLiteBatch;
public:
    /** Open (creating if needed) the database at path; a directory gets DEFAULT_DB_FILENAME.
     *  mock = true opens a private in-memory database instead. Throws std::runtime_error on failure. */
    explicit SQLiteDatabase(const fs::path& db_path, bool mock = false);

    ~SQLiteDatabase();

    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    /** Return object for accessing database at specified path. */
    static std::unique_ptr<SQLiteDatabase> Create(const fs::path& path)
    {
        return std::unique_ptr<SQLiteDatabase>(new SQLiteDatabase(path));
    }

    /** Return object for accessing temporary in-memory database. */
    static std::unique_ptr<SQLiteDatabase> CreateMock()
    {
        return std::unique_ptr<SQLiteDatabase>(new SQLiteDatabase("", true /* mock */));
    }

    /** Back up the entire database to a file. */
    bool Backup(const std::string& strDest);

    /** Make sure all changes are flushed to disk. */
    void Flush(bool shutdown);

    const fs::path& GetPathToFile() const { return m_path; }
    bool IsMock() const { return m_mock; }

    sqlite3* GetDb() { return m_db; }

    /* verifies the database file with PRAGMA integrity_check */
    static bool VerifyDatabaseFile(const fs::path& file_path, std::string& warningStr, std::string& errorStr);

private:
    // Note: Declaration order matters for initialization
    sqlite3* m_db{nullptr};
    fs::path m_path;
    fs::path m_dir;
    bool m_mock{false};

    bool SetupSchema();
    bool SetupPragmas();
};

/** RAII class that provides access to a SQLite database */
class SQLiteBatch
{
protected:
    sqlite3* m_db;
    bool fReadOnly;
    SQLiteDatabase* m_database;

    // Prepared statements for key-value operations
    sqlite3_stmt* m_read_stmt{nullptr};
    sqlite3_stmt* m_write_stmt{nullptr};
    sqlite3_stmt* m_overwrite_stmt{nullptr};
    sqlite3_stmt* m_delete_stmt{nullptr};
    sqlite3_stmt* m_exists_stmt{nullptr};
    sqlite3_stmt* m_cursor_stmt{nullptr};
    sqlite3_stmt* m_prefix_cursor_stmt{nullptr};

    bool SetupStatements();
    void FinalizeStatements();

    bool ExecStatement(const char* pszSql);

public:
    /** Throws std::runtime_error if the statements cannot be prepared. */
    explicit SQLiteBatch(SQLiteDatabase& database, const char* pszMode = "r+");
    ~SQLiteBatch() { Close(); }

    SQLiteBatch(const SQLiteBatch&) = delete;
    SQLiteBatch& operator=(const SQLiteBatch&) = delete;

    void Flush();
    void Close();

public:
    template <typename K, typename T>
    bool Read(const K& key, T& value)
    {
        if (!m_db)
            return false;

        // Serialize key
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(1000);
        ssKey << key;

        // Bind key and execute
        sqlite3_reset(m_read_stmt);
        sqlite3_bind_blob(m_read_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

        int res = sqlite3_step(m_read_stmt);
        if (res != SQLITE_ROW) {
            if (res != SQLITE_DONE) {
                LogPrintf("SQLiteBatch::Read: step failed: %s\n", sqlite3_errmsg(m_db));
            }
            sqlite3_reset(m_read_stmt);
            return false;
        }

        // Get value
        const void* data = sqlite3_column_blob(m_read_stmt, 0);
        int size = sqlite3_column_bytes(m_read_stmt, 0);
        if (!data || size == 0) {
            sqlite3_reset(m_read_stmt);
            return false;
        }

        bool fOk = true;
        try {
            CDataStream ssValue((const char*)data, (const char*)data + size, SER_DISK, CLIENT_VERSION);
            ssValue >> value;
        } catch (const std::exception& e) {
            LogPrintf("SQLiteBatch::Read: deserialize failed: %s\n", e.what());
            fOk = false;
        }
        sqlite3_reset(m_read_stmt);

        return fOk;
    }

    template <typename K, typename T>
    bool Write(const K& key, const T& value, bool fOverwrite = true)
    {
        if (!m_db)
            return false;
        if (fReadOnly) {
            LogPrintf("SQLiteBatch::Write: database opened read-only\n");
            return false;
        }

        // Serialize key
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(1000);
        ssKey << key;

        // Serialize value
        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        ssValue.reserve(10000);
        ssValue << value;

        sqlite3_stmt* stmt = fOverwrite ? m_overwrite_stmt : m_write_stmt;
        sqlite3_reset(stmt);
        sqlite3_bind_blob(stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);
        sqlite3_bind_blob(stmt, 2, ssValue.data(), ssValue.size(), SQLITE_STATIC);

        int res = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        if (res != SQLITE_DONE) {
            LogPrint(FWLog::DB, "SQLiteBatch::Write: step failed: %s\n", sqlite3_errmsg(m_db));
            return false;
        }
        return true;
    }

    template <typename K>
    bool Erase(const K& key)
    {
        if (!m_db)
            return false;
        if (fReadOnly) {
            LogPrintf("SQLiteBatch::Erase: database opened read-only\n");
            return false;
        }

        // Serialize key
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(1000);
        ssKey << key;

        sqlite3_reset(m_delete_stmt);
        sqlite3_bind_blob(m_delete_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

        int res = sqlite3_step(m_delete_stmt);
        sqlite3_reset(m_delete_stmt);
        return res == SQLITE_DONE;
    }

    template <typename K>
    bool Exists(const K& key)
    {
        if (!m_db)
            return false;

        // Serialize key
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(1000);
        ssKey << key;

        sqlite3_reset(m_exists_stmt);
        sqlite3_bind_blob(m_exists_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

        int res = sqlite3_step(m_exists_stmt);
        if (res != SQLITE_ROW) {
            sqlite3_reset(m_exists_stmt);
            return false;
        }

        bool fExists = sqlite3_column_int(m_exists_stmt, 0) > 0;
        sqlite3_reset(m_exists_stmt);
        return fExists;
    }

    // Cursor operations for iterating over all keys
    bool StartCursor();

    /** Iterate only over keys whose serialization starts with the serialization of prefix, in key order. */
    template <typename K>
    bool StartCursor(const K& prefix)
    {
        CDataStream ssPrefix(SER_DISK, CLIENT_VERSION);
        ssPrefix << prefix;
        return StartPrefixCursor(ssPrefix);
    }

    bool ReadAtCursor(CDataStream& ssKey, CDataStream& ssValue, bool& complete);
    void CloseCursor();

public:
    bool TxnBegin();
    bool TxnCommit();
    bool TxnAbort();
    bool IsInTransaction() const { return m_in_txn; }

    bool ReadVersion(int& nVersion)
    {
        nVersion = 0;
        return Read(std::string("version"), nVersion);
    }

    bool WriteVersion(int nVersion)
    {
        return Write(std::string("version"), nVersion);
    }

private:
    bool StartPrefixCursor(const CDataStream& ssPrefix);

    sqlite3_stmt* m_active_cursor{nullptr};
    std::vector<char> m_cursor_prefix;
    bool m_in_txn{false};
};

#endif // FAIRWAY_DB_SQLITEDB_H
