/*
+------------------------------------------------------------------------------------+
File        : RetryPolicy.cpp

Description : RetryPolicy implementation

+------------------------------------------------------------------------------------+
*/
#include <boost/thread/thread.hpp>
#include <boost/chrono.hpp>

#include "RetryPolicy.h"
#include "logger.h"

namespace SanImportLib
{
    void ThreadSleeper(uint32_t delayMs)
    {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(delayMs));
    }

    uint32_t RetryPolicy::DelayForAttempt(uint32_t attempt) const
    {
        uint64_t delay = BaseDelayMs;
        for (uint32_t i = 1; i < attempt && delay < MaxDelayMs; i++)
        {
            delay *= 2;
        }
        return (delay > MaxDelayMs) ? MaxDelayMs : static_cast<uint32_t>(delay);
    }

    void RetryPolicy::Wait(uint32_t attempt) const
    {
        uint32_t delay = DelayForAttempt(attempt);
        DebugPrintf(SI_LOG_DEBUG, "%s: retry %u, waiting %u ms\n", FUNCTION_NAME, attempt, delay);
        if (m_sleeper)
        {
            m_sleeper(delay);
        }
    }
}
