// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_SYNC_H
#define GIFTGUARD_SYNC_H

#include <mutex>

/////////////////////////////////////////////////
//                                             //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                             //
/////////////////////////////////////////////////

/*
CCriticalSection mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

LOCK2(mutex1, mutex2);
    std::unique_lock<std::recursive_mutex> criticalblock1(mutex1);
    std::unique_lock<std::recursive_mutex> criticalblock2(mutex2);

TRY_LOCK(mutex, name);
    std::unique_lock<std::recursive_mutex> name(mutex, std::try_to_lock_t);
 */

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 */
class CCriticalSection : public std::recursive_mutex
{
};

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex CWaitableCriticalSection;

typedef std::unique_lock<std::recursive_mutex> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2) CCriticalBlock criticalblock1(cs1), criticalblock2(cs2)
#define TRY_LOCK(cs, name) CCriticalBlock name(cs, std::try_to_lock)

#define WAIT_LOCK(cs, name) std::unique_lock<std::mutex> name(cs)

#endif // GIFTGUARD_SYNC_H
