#pragma once

#include "model.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace proofline
{
    /**
     * k-of-N confirmation policy across ledgers.
     */
    class QuorumPolicy
    {
    public:
        /** `required` defaults to a strict majority of `configured` */
        static Result<QuorumPolicy> make(std::size_t configured, std::optional<std::size_t> required = std::nullopt);

        static std::size_t majority(std::size_t configured) { return configured / 2 + 1; }

        /**
         * confirmed once `required` ledgers confirmed; failed once so many
         * failed that the rest cannot reach `required`; pending otherwise.
         */
        AggregateStatus evaluate(std::size_t confirmed, std::size_t failed) const;

        AggregateStatus evaluate(const std::vector<ChainStatus> &statuses) const;

        std::size_t configured() const { return configured_; }
        std::size_t required() const { return required_; }

        /** Failures the policy absorbs before quorum becomes unreachable */
        std::size_t tolerated_failures() const { return configured_ - required_; }

    private:
        QuorumPolicy(std::size_t configured, std::size_t required)
            : configured_(configured), required_(required) {}

        std::size_t configured_;
        std::size_t required_;
    };
}
