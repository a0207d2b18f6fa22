#pragma once

#include "backoff.hpp"
#include "clock.hpp"
#include "collaborators.hpp"
#include "model.hpp"
#include "quorum.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace proofline
{

    /** Per-ledger confirmation policy */
    struct ChainPolicy
    {
        std::string chain_id;
        uint64_t required_depth{12};
        std::chrono::milliseconds not_found_grace{std::chrono::minutes(2)};
        std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
        std::chrono::milliseconds call_timeout{std::chrono::seconds(10)};
        BackoffPolicy backoff{};
    };

    struct LedgerBinding
    {
        Ledger &ledger;
        ChainPolicy policy;
    };

    /**
     * Guarded ChainConfirmation record.
     *
     * Exactly one poller writes it; any number of readers take snapshots.
     * Once the record is confirmed or failed further writes are refused.
     */
    class ChainTrack
    {
    public:
        explicit ChainTrack(ChainConfirmation initial);

        ChainConfirmation snapshot() const;

        /** Replace the record; returns false (and changes nothing) if it is already terminal */
        bool write(const ChainConfirmation &next);

    private:
        mutable std::shared_mutex mutex_;
        ChainConfirmation record_;
    };

    struct TrackingOutcome
    {
        std::map<std::string, ChainConfirmation> confirmations;
        AggregateStatus aggregate{AggregateStatus::Pending};
        QuorumPolicy quorum;
        bool forced_cutoff{false}; // stopped by the caller before the aggregate was terminal
    };

    /**
     * Follows the relay transactions of one oracle report on every configured
     * ledger at once, one polling thread per ledger, and stops as soon as the
     * quorum decision is terminal.
     *
     * Ledgers still unresolved when tracking stops keep their current status.
     * Ledgers still unresolved when the wall-clock ceiling passes are marked
     * failed, which always makes the aggregate terminal.
     */
    class ConfirmationTracker
    {
    public:
        ConfirmationTracker(std::vector<LedgerBinding> ledgers,
                            QuorumPolicy quorum,
                            const Clock &clock,
                            std::chrono::milliseconds ceiling = std::chrono::minutes(30));

        /**
         * Track `relays` (chain id -> transaction ref) until the aggregate is
         * terminal, every ledger is terminal, or `token` is cancelled.
         */
        TrackingOutcome track(const std::map<std::string, std::string> &relays,
                              const CancellationToken &token = CancellationToken());

        /** Push-notification hook: poll `chain_id` now instead of after the current delay */
        bool notify(const std::string &chain_id);

        const QuorumPolicy &quorum() const { return quorum_; }

    private:
        void poll_ledger(const LedgerBinding &binding,
                         ChainTrack &track,
                         Timestamp deadline,
                         const CancellationToken &token,
                         const std::function<void()> &changed) const;

        std::vector<LedgerBinding> ledgers_;
        QuorumPolicy quorum_;
        const Clock &clock_;
        std::chrono::milliseconds ceiling_;

        std::mutex active_mutex_;
        std::unordered_map<std::string, CancellationToken> active_;
    };

} // namespace proofline
