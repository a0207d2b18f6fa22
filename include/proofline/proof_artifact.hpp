#pragma once

#include "clock.hpp"
#include "digest.hpp"
#include "model.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace proofline
{

    inline constexpr const char *kArtifactSchemaVersion = "1";

    /**
     * Portable, self-checksummed proof that a document was attested and
     * relayed to a quorum of ledgers (or, for a failed aggregate, that it
     * was not).
     *
     * Immutable once assembled. `artifact_checksum` is SHA-256 over the
     * canonical JSON of every other field, so any edit to the serialized
     * artifact is detectable without trusting whoever produced it.
     */
    struct ProofArtifact
    {
        std::string schema_version{kArtifactSchemaVersion};
        DigestAlgorithm hash_algorithm{DigestAlgorithm::SHA256};
        Digest document_id;
        ContentLocator content_locator;
        Digest metadata_digest;
        OracleReport oracle_report;
        std::map<std::string, ChainConfirmation> chain_confirmations;
        AggregateStatus aggregate_status{AggregateStatus::Pending};
        std::size_t quorum_required{0};
        std::size_t quorum_configured{0};
        bool forced_cutoff{false};
        std::vector<std::string> warnings;
        Timestamp created_at;
        Digest artifact_checksum;

        /** Every field except `artifact_checksum` */
        nlohmann::json body_json() const;

        /** Full serialized form, checksum included */
        nlohmann::json to_json() const;

        /** Canonical text of body_json(), the checksum input */
        Result<std::string> canonical_json() const;

        Result<Digest> compute_checksum() const;

        /** IntegrityFault (field artifact_checksum, expected/actual set) if the stored checksum is stale */
        Result<void> verify_checksum() const;

        /**
         * Parse an artifact from untrusted JSON. Structure is validated here;
         * the checksum is not, so a tampered artifact still parses and the
         * verifier can report exactly which stage it fails.
         */
        static Result<ProofArtifact> from_json(const nlohmann::json &j);

        static Result<ProofArtifact> parse(const std::string &text);

        bool operator==(const ProofArtifact &other) const = default;
    };

} // namespace proofline
