// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_SYNC_H
#define FAIRWAY_SYNC_H

#include <mutex>

/**
 * Leaderboard operations are serialised through a recursive mutex per
 * component. Use LOCK(cs) for a scoped lock and TRY_LOCK(cs, name) for a
 * non-blocking attempt.
 */

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex Mutex;

/** Wrapper around std::unique_lock */
template <typename MutexType>
class UniqueLock : public std::unique_lock<MutexType>
{
    typedef std::unique_lock<MutexType> Base;

public:
    explicit UniqueLock(MutexType& mutexIn) : Base(mutexIn) {}
    UniqueLock(MutexType& mutexIn, bool fTry) : Base(mutexIn, std::defer_lock)
    {
        if (fTry)
            Base::try_lock();
        else
            Base::lock();
    }

    operator bool()
    {
        return Base::owns_lock();
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)
#define TRY_LOCK(cs, name) UniqueLock<typename std::decay<decltype(cs)>::type> name(cs, true)

#endif // FAIRWAY_SYNC_H
