#include "proofline/confirmation_tracker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <format>
#include <memory>
#include <thread>

namespace proofline
{

    // ============================================================================
    // ChainTrack
    // ============================================================================

    ChainTrack::ChainTrack(ChainConfirmation initial) : record_(std::move(initial)) {}

    ChainConfirmation ChainTrack::snapshot() const
    {
        std::shared_lock lock(mutex_);
        return record_;
    }

    bool ChainTrack::write(const ChainConfirmation &next)
    {
        std::unique_lock lock(mutex_);
        if (is_terminal(record_.status))
            return false;
        record_ = next;
        return true;
    }

    // ============================================================================
    // ConfirmationTracker
    // ============================================================================

    ConfirmationTracker::ConfirmationTracker(std::vector<LedgerBinding> ledgers,
                                             QuorumPolicy quorum,
                                             const Clock &clock,
                                             std::chrono::milliseconds ceiling)
        : ledgers_(std::move(ledgers)), quorum_(quorum), clock_(clock), ceiling_(ceiling)
    {
    }

    TrackingOutcome ConfirmationTracker::track(const std::map<std::string, std::string> &relays,
                                               const CancellationToken &token)
    {
        const Timestamp deadline = clock_.now() + ceiling_;
        auto run_token = token.child();

        std::vector<std::unique_ptr<ChainTrack>> tracks;
        tracks.reserve(ledgers_.size());
        for (const auto &binding : ledgers_)
        {
            ChainConfirmation initial;
            initial.chain_id = binding.policy.chain_id;
            initial.required_depth = binding.policy.required_depth;
            if (auto it = relays.find(binding.policy.chain_id); it != relays.end())
                initial.transaction_ref = it->second;
            tracks.push_back(std::make_unique<ChainTrack>(std::move(initial)));
        }

        std::mutex mutex;
        std::condition_variable cv;
        std::size_t version = 0;
        std::size_t finished = 0;

        auto changed = [&]() {
            {
                std::lock_guard lock(mutex);
                ++version;
            }
            cv.notify_all();
        };

        std::vector<std::thread> pollers;
        pollers.reserve(ledgers_.size());
        for (std::size_t i = 0; i < ledgers_.size(); ++i)
        {
            auto ledger_token = run_token.child();
            {
                std::lock_guard lock(active_mutex_);
                active_.insert_or_assign(ledgers_[i].policy.chain_id, ledger_token);
            }

            pollers.emplace_back([&, i, ledger_token]() {
                auto &track = *tracks[i];
                try
                {
                    poll_ledger(ledgers_[i], track, deadline, ledger_token, changed);
                }
                catch (const std::exception &e)
                {
                    auto record = track.snapshot();
                    record.status = ChainStatus::Failed;
                    record.failure_reason = std::format("ledger client raised: {}", e.what());
                    record.updated_at = clock_.now();
                    track.write(record);
                    spdlog::error("ledger {} poller aborted: {}", record.chain_id, e.what());
                }
                {
                    std::lock_guard lock(mutex);
                    ++finished;
                }
                cv.notify_all();
            });
        }

        auto statuses = [&]() {
            std::vector<ChainStatus> out;
            out.reserve(tracks.size());
            for (const auto &t : tracks)
                out.push_back(t->snapshot().status);
            return out;
        };

        {
            std::unique_lock lock(mutex);
            std::size_t seen = static_cast<std::size_t>(-1);
            while (true)
            {
                if (version != seen)
                {
                    seen = version;
                    auto aggregate = quorum_.evaluate(statuses());
                    if (aggregate != AggregateStatus::Pending)
                    {
                        spdlog::info("quorum decision reached: {}", aggregate_status_to_string(aggregate));
                        break;
                    }
                }
                if (finished == pollers.size())
                    break;
                cv.wait(lock, [&] { return version != seen || finished == pollers.size(); });
            }
        }

        run_token.cancel();
        for (auto &poller : pollers)
            poller.join();

        {
            std::lock_guard lock(active_mutex_);
            for (const auto &binding : ledgers_)
                active_.erase(binding.policy.chain_id);
        }

        TrackingOutcome outcome{{}, AggregateStatus::Pending, quorum_, false};
        std::vector<ChainStatus> final_statuses;
        for (const auto &t : tracks)
        {
            auto record = t->snapshot();
            final_statuses.push_back(record.status);
            outcome.confirmations.emplace(record.chain_id, std::move(record));
        }
        outcome.aggregate = quorum_.evaluate(final_statuses);
        outcome.forced_cutoff = outcome.aggregate == AggregateStatus::Pending && token.is_cancelled();

        if (outcome.forced_cutoff)
            spdlog::warn("confirmation tracking cut off by caller with aggregate still pending");
        return outcome;
    }

    void ConfirmationTracker::poll_ledger(const LedgerBinding &binding,
                                          ChainTrack &track,
                                          Timestamp deadline,
                                          const CancellationToken &token,
                                          const std::function<void()> &changed) const
    {
        const auto &policy = binding.policy;
        ChainConfirmation record = track.snapshot();

        auto commit = [&](ChainStatus status, std::optional<std::string> reason = std::nullopt) {
            record.status = status;
            record.failure_reason = std::move(reason);
            record.updated_at = clock_.now();
            if (!track.write(record))
            {
                spdlog::warn("ledger {} record is terminal; ignoring update to {}",
                             policy.chain_id, chain_status_to_string(status));
            }
            if (status == ChainStatus::Failed)
            {
                spdlog::warn("ledger {} failed: {}", policy.chain_id, record.failure_reason.value_or("unknown"));
            }
            else if (status == ChainStatus::Confirmed)
            {
                spdlog::info("ledger {} confirmed {} at height {} ({} confirmations)", policy.chain_id,
                             record.transaction_ref, record.block_height, record.confirmation_count);
            }
            changed();
        };

        if (record.transaction_ref.empty())
        {
            commit(ChainStatus::Failed, "oracle reported no relay transaction for this chain");
            return;
        }

        const Timestamp started = clock_.now();
        bool seen = false;
        std::size_t failures = 0;

        while (true)
        {
            if (token.is_cancelled())
                return;

            auto now = clock_.now();
            if (now >= deadline)
            {
                commit(ChainStatus::Failed, "confirmation ceiling exceeded before reaching required depth");
                return;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

            token.take_wake();
            auto status = binding.ledger.get_transaction_status(record.transaction_ref, std::min(policy.call_timeout, left));

            std::chrono::milliseconds delay = policy.poll_interval;
            if (!status)
            {
                if (!status.error().is_transient())
                {
                    commit(ChainStatus::Failed, std::format("ledger error: {}", status.error().what()));
                    return;
                }
                ++failures;
                if (policy.backoff.exhausted(failures))
                {
                    commit(ChainStatus::Failed, std::format("ledger unreachable after {} attempts: {}",
                                                            failures, status.error().what()));
                    return;
                }
                delay = policy.backoff.delay_for(failures);
                spdlog::debug("ledger {} query failed ({}); backing off {} ms",
                              policy.chain_id, status.error().what(), delay.count());
            }
            else
            {
                failures = 0;
                if (status->reverted)
                {
                    commit(ChainStatus::Failed, "transaction reverted");
                    return;
                }

                if (!status->found)
                {
                    if (seen)
                    {
                        commit(ChainStatus::Failed, "transaction dropped from the chain after being seen (reorganization)");
                        return;
                    }
                    if (clock_.now() - started >= policy.not_found_grace)
                    {
                        commit(ChainStatus::Failed, "transaction not found within grace period");
                        return;
                    }
                }
                else
                {
                    seen = true;
                    record.block_height = status->block_height;
                    record.confirmation_count = status->confirmation_count;
                    if (status->confirmation_count >= policy.required_depth)
                    {
                        commit(ChainStatus::Confirmed);
                        return;
                    }
                    commit(ChainStatus::Pending);
                }
            }

            auto wait = std::min(delay, std::chrono::duration_cast<std::chrono::milliseconds>(
                                            std::max(deadline - clock_.now(), Timestamp::duration::zero())));
            clock_.sleep_for(wait, token);
        }
    }

    bool ConfirmationTracker::notify(const std::string &chain_id)
    {
        std::lock_guard lock(active_mutex_);
        auto it = active_.find(chain_id);
        if (it == active_.end())
            return false;
        it->second.wake();
        return true;
    }

} // namespace proofline
