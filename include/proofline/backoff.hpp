#pragma once

#include <chrono>
#include <cstddef>

namespace proofline
{

    /**
     * Exponential backoff for transient failures: initial, initial*m, ... capped at max.
     */
    struct BackoffPolicy
    {
        std::chrono::milliseconds initial{std::chrono::milliseconds(500)};
        std::chrono::milliseconds max{std::chrono::seconds(30)};
        double multiplier{2.0};
        std::size_t max_attempts{6}; // consecutive transient failures tolerated

        /** Delay before retry number `attempt` (1-based) */
        std::chrono::milliseconds delay_for(std::size_t attempt) const
        {
            double delay = static_cast<double>(initial.count());
            for (std::size_t i = 1; i < attempt; ++i)
            {
                delay *= multiplier;
                if (delay >= static_cast<double>(max.count()))
                    return max;
            }
            return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
        }

        bool exhausted(std::size_t attempt) const { return attempt >= max_attempts; }
    };

} // namespace proofline
