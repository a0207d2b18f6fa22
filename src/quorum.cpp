#include "proofline/quorum.hpp"
#include <format>

namespace proofline
{

    Result<QuorumPolicy> QuorumPolicy::make(std::size_t configured, std::optional<std::size_t> required)
    {
        if (configured == 0)
        {
            return std::unexpected(ProoflineError::config("At least one ledger must be configured").on_field("ledgers"));
        }

        std::size_t k = required.value_or(majority(configured));
        if (k == 0 || k > configured)
        {
            return std::unexpected(ProoflineError::config(std::format(
                                       "Quorum {} is outside 1..{} for {} configured ledgers", k, configured, configured))
                                       .on_field("tracker.quorum"));
        }
        return QuorumPolicy(configured, k);
    }

    AggregateStatus QuorumPolicy::evaluate(std::size_t confirmed, std::size_t failed) const
    {
        if (confirmed >= required_)
            return AggregateStatus::Confirmed;
        if (failed > configured_ - required_)
            return AggregateStatus::Failed;
        return AggregateStatus::Pending;
    }

    AggregateStatus QuorumPolicy::evaluate(const std::vector<ChainStatus> &statuses) const
    {
        std::size_t confirmed = 0;
        std::size_t failed = 0;
        for (auto status : statuses)
        {
            if (status == ChainStatus::Confirmed)
                ++confirmed;
            else if (status == ChainStatus::Failed)
                ++failed;
        }
        return evaluate(confirmed, failed);
    }

} // namespace proofline
