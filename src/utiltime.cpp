// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utiltime.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <locale>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread.hpp>

static std::atomic<int64_t> nMockTimeMillis(0); //!< For unit testing

int64_t GetTimeMillis()
{
    int64_t mocktime = nMockTimeMillis.load(std::memory_order_relaxed);
    if (mocktime) return mocktime;

    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetTime()
{
    return GetTimeMillis() / 1000;
}

int64_t GetTimeMicros()
{
    int64_t mocktime = nMockTimeMillis.load(std::memory_order_relaxed);
    if (mocktime) return mocktime * 1000;

    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetSteadyTimeMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t nMockTimeIn)
{
    nMockTimeMillis.store(nMockTimeIn * 1000, std::memory_order_relaxed);
}

void SetMockTimeMillis(int64_t nMockTimeMillisIn)
{
    nMockTimeMillis.store(nMockTimeMillisIn, std::memory_order_relaxed);
}

int64_t GetMockTimeMillis()
{
    return nMockTimeMillis.load(std::memory_order_relaxed);
}

void MilliSleep(int64_t n)
{
    boost::this_thread::sleep_for(boost::chrono::milliseconds(n));
}

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    static std::locale classic(std::locale::classic());
    // std::locale takes ownership of the pointer
    std::locale loc(classic, new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(nTime);
    return ss.str();
}
