// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_LEADERBOARDDB_H
#define FAIRWAY_LEADERBOARD_LEADERBOARDDB_H

/**
 * Leaderboard Database Layer
 *
 * Provides persistence for courses, commitments and pars on top of a single
 * SQLite key/value table:
 * - WriteCourse / ReadCourse (by id), next id counter
 * - WriteCommitment / ReadCommitment (by commit key)
 * - WritePar / ReadPar (by course and player), ForEachPar (by course)
 *
 * Not thread-safe on its own; the submission engine serialises access.
 */

#include "commit/commitment.h"
#include "db/sqlitedb.h"
#include "leaderboard/leaderboard.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

class CLeaderboardDB
{
private:
    std::unique_ptr<SQLiteDatabase> db;
    std::unique_ptr<SQLiteBatch> batch;

public:
    /**
     * Open the database at path (directory or file), or a private in-memory
     * one when fMemory is set. Throws std::runtime_error if it cannot be
     * opened or was written by an incompatible schema version.
     */
    explicit CLeaderboardDB(const fs::path& path, bool fMemory = false);
    ~CLeaderboardDB();

    // === Course Operations ===

    bool WriteCourse(const CourseRecord& course);
    bool ReadCourse(uint32_t nCourseId, CourseRecord& course) const;
    bool ExistsCourse(uint32_t nCourseId) const;

    /**
     * ReadNextCourseId - Id the next registered course will receive
     * @param nDefault Returned when no course was ever registered
     */
    uint32_t ReadNextCourseId(uint32_t nDefault) const;
    bool WriteNextCourseId(uint32_t nCourseId);

    /**
     * ForEachCourse - Iterate over all courses in id order
     * @param func Callback (return false to stop)
     */
    void ForEachCourse(std::function<bool(const CourseRecord&)> func) const;

    // === Commitment Operations ===

    bool WriteCommitment(const CommitmentRecord& commitment);
    bool ReadCommitment(const uint256& commitKey, CommitmentRecord& commitment) const;
    bool ExistsCommitment(const uint256& commitKey) const;
    void ForEachCommitment(std::function<bool(const CommitmentRecord&)> func) const;

    // === Par Operations ===

    bool WritePar(const ParRecord& par);
    bool ReadPar(uint32_t nCourseId, const CPlayerID& player, ParRecord& par) const;

    /**
     * ForEachPar - Iterate over the pars of one course
     * @param nCourseId Course to scan
     * @param func Callback (return false to stop)
     */
    void ForEachPar(uint32_t nCourseId, std::function<bool(const ParRecord&)> func) const;

    /** Iterate over every par of every course */
    void ForEachPar(std::function<bool(const ParRecord&)> func) const;

    // === Transactions ===

    bool TxnBegin();
    bool TxnCommit();
    bool TxnAbort();

    // === Maintenance ===

    int GetVersion() const;

    /**
     * CheckConsistency - Cross-check stored records
     *
     * Every par must belong to a registered course with a leading cost not
     * above the par, course ids must be below the next id counter, and every
     * commitment must be stored under its own key.
     *
     * @param strError Output: first inconsistency found
     * @return true if consistent
     */
    bool CheckConsistency(std::string& strError) const;

    /** Copy the database to strDest (a file, or a directory to copy into). */
    bool Backup(const std::string& strDest);

    const fs::path& GetPath() const { return db->GetPathToFile(); }
};

#endif // FAIRWAY_LEADERBOARD_LEADERBOARDDB_H
