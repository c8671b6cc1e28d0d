// Copyright (c) 2017 The Bitcoin Core developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_FS_H
#define FAIRWAY_FS_H

#include <stdio.h>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

/** Filesystem operations and types */
namespace fs = boost::filesystem;

/** Bridge operations to C stdio */
namespace fsbridge {
    FILE *fopen(const fs::path& p, const char *mode);

    /** Create the directory and its parents; false if it still does not exist. */
    bool TryCreateDirectories(const fs::path& p);
};

#endif // FAIRWAY_FS_H
