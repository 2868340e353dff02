/*
+------------------------------------------------------------------------------------+
File        : RetryPolicy.h

Description : Bounded exponential backoff shared by the post-submission refresh and
              the lock contention retries.

+------------------------------------------------------------------------------------+
*/
#ifndef _RETRY_POLICY_H
#define _RETRY_POLICY_H

#include <boost/cstdint.hpp>
#include <boost/function.hpp>

namespace SanImportLib
{
    /// \brief waits for the given number of milliseconds
    typedef boost::function<void (uint32_t)> Sleeper_t;

    /// \brief sleeps the calling thread
    void ThreadSleeper(uint32_t delayMs);

    class RetryPolicy
    {
    public:
        RetryPolicy(uint32_t maxAttempts = 5, uint32_t baseDelayMs = 1000, uint32_t maxDelayMs = 10000)
            : MaxAttempts(maxAttempts),
            BaseDelayMs(baseDelayMs),
            MaxDelayMs(maxDelayMs),
            m_sleeper(ThreadSleeper)
        {}

        /// \brief total attempts, including the first one
        uint32_t MaxAttempts;

        uint32_t BaseDelayMs;
        uint32_t MaxDelayMs;

        /// \brief delay before retry number attempt (1-based), min(base * 2^(attempt-1), max)
        uint32_t DelayForAttempt(uint32_t attempt) const;

        /// \brief waits DelayForAttempt(attempt) through the sleeper
        void Wait(uint32_t attempt) const;

        /// \brief replaces the sleeper, tests install one that records the delays
        void SetSleeper(Sleeper_t sleeper) { m_sleeper = sleeper; }

    private:
        Sleeper_t m_sleeper;
    };
}

#endif
