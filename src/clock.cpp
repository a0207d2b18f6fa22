#include "proofline/clock.hpp"
#include <charconv>
#include <ctime>
#include <format>
#include <thread>

namespace proofline
{

    std::string format_timestamp(Timestamp ts)
    {
        auto secs = std::chrono::floor<std::chrono::seconds>(ts);
        auto ms = (ts - secs).count();
        auto time_t_value = std::chrono::system_clock::to_time_t(secs);

        std::tm tm_buf;
        gmtime_r(&time_t_value, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms));
    }

    Result<Timestamp> parse_timestamp(const std::string &iso)
    {
        // 2026-10-19T08:15:00.250Z
        auto invalid = [&iso]() {
            return std::unexpected(ProoflineError::validation(
                std::format("Invalid timestamp '{}' (expected YYYY-MM-DDTHH:MM:SS.mmmZ)", iso)));
        };

        if (iso.size() != 24 || iso[4] != '-' || iso[7] != '-' || iso[10] != 'T' || iso[13] != ':' ||
            iso[16] != ':' || iso[19] != '.' || iso[23] != 'Z')
        {
            return invalid();
        }

        auto field = [&iso](std::size_t pos, std::size_t len, int &out) {
            const char *first = iso.data() + pos;
            const char *last = first + len;
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        };

        int year, month, day, hour, minute, second, millis;
        if (!field(0, 4, year) || !field(5, 2, month) || !field(8, 2, day) || !field(11, 2, hour) ||
            !field(14, 2, minute) || !field(17, 2, second) || !field(20, 3, millis))
        {
            return invalid();
        }

        std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59)
            return invalid();

        auto days = std::chrono::sys_days{ymd};
        return Timestamp{std::chrono::duration_cast<std::chrono::milliseconds>(days.time_since_epoch()) +
                         std::chrono::hours{hour} + std::chrono::minutes{minute} +
                         std::chrono::seconds{second} + std::chrono::milliseconds{millis}};
    }

    // ============================================================================
    // CancellationToken
    // ============================================================================

    CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

    CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void CancellationToken::cancel() const
    {
        cancel_state(state_);
    }

    void CancellationToken::cancel_state(const std::shared_ptr<State> &state)
    {
        std::vector<std::weak_ptr<State>> children;
        {
            std::lock_guard lock(state->mutex);
            if (state->cancelled)
                return;
            state->cancelled = true;
            children.swap(state->children);
        }
        state->cv.notify_all();

        for (auto &weak : children)
        {
            if (auto child = weak.lock())
                cancel_state(child);
        }
    }

    bool CancellationToken::is_cancelled() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    void CancellationToken::wake() const
    {
        {
            std::lock_guard lock(state_->mutex);
            state_->woken = true;
        }
        state_->cv.notify_all();
    }

    bool CancellationToken::take_wake() const
    {
        std::lock_guard lock(state_->mutex);
        bool woken = state_->woken;
        state_->woken = false;
        return woken;
    }

    WaitResult CancellationToken::wait_for(std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled || state_->woken; });
        if (state_->cancelled)
            return WaitResult::Cancelled;
        if (state_->woken)
        {
            state_->woken = false;
            return WaitResult::Woken;
        }
        return WaitResult::Elapsed;
    }

    CancellationToken CancellationToken::child() const
    {
        auto child_state = std::make_shared<State>();
        bool parent_cancelled = false;
        {
            std::lock_guard lock(state_->mutex);
            parent_cancelled = state_->cancelled;
            if (!parent_cancelled)
            {
                std::erase_if(state_->children, [](const std::weak_ptr<State> &weak) { return weak.expired(); });
                state_->children.push_back(child_state);
            }
        }
        if (parent_cancelled)
            child_state->cancelled = true;
        return CancellationToken(std::move(child_state));
    }

    std::size_t CancellationToken::registered_children() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->children.size();
    }

    // ============================================================================
    // SystemClock
    // ============================================================================

    Timestamp SystemClock::now() const
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    WaitResult SystemClock::sleep_for(std::chrono::milliseconds duration, const CancellationToken &token) const
    {
        if (duration <= std::chrono::milliseconds::zero())
        {
            if (token.is_cancelled())
                return WaitResult::Cancelled;
            std::this_thread::yield();
            return WaitResult::Elapsed;
        }
        return token.wait_for(duration);
    }

} // namespace proofline
