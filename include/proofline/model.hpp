#pragma once

#include "clock.hpp"
#include "digest.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace proofline
{

    /**
     * Reference to externally stored bytes, issued by the storage collaborator.
     */
    struct ContentLocator
    {
        std::string uri;
        Digest digest;

        nlohmann::json to_json() const;
        static Result<ContentLocator> from_json(const nlohmann::json &j);

        bool operator==(const ContentLocator &other) const = default;
    };

    /**
     * Report returned by the oracle once it has attested a digest.
     * Untrusted until OracleClient / Verifier validation succeeds.
     */
    struct OracleReport
    {
        std::string request_id;
        Digest reported_digest;
        std::string signature; // Ed25519 signature (base64)
        std::string signer;    // key id of the signing oracle key
        Timestamp issued_at;
        bool finalized{false};
        std::map<std::string, std::string> relays; // chain id -> relay transaction ref

        /** Canonical bytes covered by the signature: {issued_at, reported_digest, request_id} */
        Result<crypto::Bytes> signing_payload() const;

        nlohmann::json to_json() const;
        static Result<OracleReport> from_json(const nlohmann::json &j);

        bool operator==(const OracleReport &other) const = default;
    };

    enum class ChainStatus
    {
        Unconfirmed,
        Pending,
        Confirmed,
        Failed
    };

    std::string chain_status_to_string(ChainStatus status);
    Result<ChainStatus> chain_status_from_string(const std::string &s);

    inline bool is_terminal(ChainStatus status)
    {
        return status == ChainStatus::Confirmed || status == ChainStatus::Failed;
    }

    /**
     * Confirmation state of the relay transaction on one ledger.
     * Written only by that ledger's poller; frozen once terminal.
     */
    struct ChainConfirmation
    {
        std::string chain_id;
        std::string transaction_ref;
        uint64_t block_height{0};
        uint64_t confirmation_count{0};
        uint64_t required_depth{0};
        ChainStatus status{ChainStatus::Unconfirmed};
        std::optional<std::string> failure_reason;
        std::optional<Timestamp> updated_at;

        nlohmann::json to_json() const;
        static Result<ChainConfirmation> from_json(const nlohmann::json &j);

        bool operator==(const ChainConfirmation &other) const = default;
    };

    enum class AggregateStatus
    {
        Pending,
        Confirmed,
        Failed
    };

    std::string aggregate_status_to_string(AggregateStatus status);
    Result<AggregateStatus> aggregate_status_from_string(const std::string &s);

    /** Answer of a ledger collaborator for one transaction */
    struct TransactionStatus
    {
        bool found{false};
        uint64_t block_height{0};
        uint64_t confirmation_count{0};
        bool reverted{false};

        static Result<TransactionStatus> from_json(const nlohmann::json &j);
    };

} // namespace proofline
