// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_UTILTIME_H
#define GIFTGUARD_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTimeMicros() and GetTimeMillis() both return the system time, but in
 * different units. GetTime() returns the system time in seconds.
 *
 * All three honor the mock time set by SetMockTime()/SetMockTimeMillis(),
 * which is how tests drive window arithmetic deterministically.
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();

/** Steady clock in milliseconds, never mocked. Used for deadlines. */
int64_t GetSteadyTimeMillis();

/** Mock the clock in seconds. Zero disables mocking. */
void SetMockTime(int64_t nMockTimeIn);
/** Mock the clock in milliseconds. Zero disables mocking. */
void SetMockTimeMillis(int64_t nMockTimeMillisIn);
int64_t GetMockTimeMillis();

void MilliSleep(int64_t n);

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // GIFTGUARD_UTILTIME_H
