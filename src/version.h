// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_VERSION_H
#define FAIRWAY_VERSION_H

/**
 * client versioning
 */

static const int CLIENT_VERSION_MAJOR = 1;
static const int CLIENT_VERSION_MINOR = 0;
static const int CLIENT_VERSION_REVISION = 0;

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR
    + 10000 * CLIENT_VERSION_MINOR
    + 100 * CLIENT_VERSION_REVISION;

/**
 * Leaderboard database schema version
 *
 * History:
 *   1 = Initial layout (courses, commitments, pars)
 */
static const int LEADERBOARD_DB_VERSION = 1;

//! Oldest schema this build can open
static const int MIN_LEADERBOARD_DB_VERSION = 1;

#endif // FAIRWAY_VERSION_H
