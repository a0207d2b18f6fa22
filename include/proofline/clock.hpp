#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proofline
{

    /** Wall-clock instant with millisecond resolution, the unit every artifact uses */
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    /** Format as ISO 8601 UTC, e.g. 2026-10-19T08:15:00.250Z */
    std::string format_timestamp(Timestamp ts);

    /** Parse the exact form produced by format_timestamp */
    Result<Timestamp> parse_timestamp(const std::string &iso);

    enum class WaitResult
    {
        Elapsed,
        Woken,
        Cancelled
    };

    /**
     * Cooperative cancellation shared between a caller and a polling loop.
     *
     * Copies share state. `child()` produces a token that is cancelled
     * whenever its parent is, but can also be cancelled on its own.
     * `wake()` interrupts one pending wait without cancelling, which is how
     * push notifications trigger an early poll.
     */
    class CancellationToken
    {
    public:
        CancellationToken();

        void cancel() const;
        bool is_cancelled() const;

        /** Interrupt the current (or next) wait_for with WaitResult::Woken */
        void wake() const;

        /** Block up to `timeout`; returns early on cancel or wake */
        WaitResult wait_for(std::chrono::milliseconds timeout) const;

        /** Consume a pending wake without blocking */
        bool take_wake() const;

        CancellationToken child() const;

        /** Children registered for cancel propagation; expired ones are dropped on the next child() */
        std::size_t registered_children() const;

    private:
        struct State
        {
            mutable std::mutex mutex;
            std::condition_variable cv;
            bool cancelled{false};
            bool woken{false};
            std::vector<std::weak_ptr<State>> children;
        };

        explicit CancellationToken(std::shared_ptr<State> state);

        static void cancel_state(const std::shared_ptr<State> &state);

        std::shared_ptr<State> state_;
    };

    /**
     * Time source for every deadline, backoff and timestamp in the engine.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual Timestamp now() const = 0;

        /** Sleep for `duration` unless the token is cancelled or woken first */
        virtual WaitResult sleep_for(std::chrono::milliseconds duration, const CancellationToken &token) const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp now() const override;
        WaitResult sleep_for(std::chrono::milliseconds duration, const CancellationToken &token) const override;
    };

} // namespace proofline
