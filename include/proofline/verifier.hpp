#pragma once

#include "clock.hpp"
#include "collaborators.hpp"
#include "confirmation_tracker.hpp"
#include "crypto.hpp"
#include "oracle_keys.hpp"
#include "proof_artifact.hpp"
#include "quorum.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace proofline
{

    enum class StageStatus
    {
        Passed,
        Failed,
        Skipped
    };

    std::string stage_status_to_string(StageStatus status);

    struct StageResult
    {
        std::string stage;
        StageStatus status{StageStatus::Passed};
        std::optional<std::string> expected;
        std::optional<std::string> actual;
        std::string detail;

        nlohmann::json to_json() const;
    };

    enum class Verdict
    {
        Verified,
        Failed
    };

    std::string verdict_to_string(Verdict verdict);

    struct VerificationReport
    {
        Verdict verdict{Verdict::Failed};
        std::vector<StageResult> stages;

        bool verified() const { return verdict == Verdict::Verified; }

        /** First failed stage in pipeline order, or nullptr when verified */
        const StageResult *failing_stage() const;

        const StageResult *find_stage(const std::string &stage) const;

        nlohmann::json to_json() const;
    };

    /**
     * Independent re-verification of a ProofArtifact.
     *
     * Nothing recorded in the artifact is taken on trust: the checksum and
     * every digest are recomputed, the oracle signature is checked against
     * this verifier's own key ring, and each recorded ledger is queried live
     * against this verifier's own depth requirements and quorum. All stages
     * run even after one fails, so the report is complete.
     */
    class Verifier
    {
    public:
        Verifier(const OracleKeyRing &keys,
                 std::vector<LedgerBinding> ledgers,
                 QuorumPolicy quorum,
                 const Clock &clock,
                 ContentStore *content_store = nullptr);

        /**
         * Verify against caller-supplied content bytes. Without `metadata`
         * the metadata stage is skipped and the recorded metadata digest is
         * used to re-derive the document id.
         */
        VerificationReport verify(const ProofArtifact &artifact,
                                  const crypto::Bytes &content,
                                  const std::optional<nlohmann::json> &metadata = std::nullopt,
                                  const CancellationToken &token = CancellationToken()) const;

        /** Retrieve the content through the artifact's locator, then verify */
        Result<VerificationReport> verify_stored(const ProofArtifact &artifact,
                                                 const std::optional<nlohmann::json> &metadata = std::nullopt,
                                                 const CancellationToken &token = CancellationToken()) const;

    private:
        StageResult check_ledger(const ProofArtifact &artifact,
                                 const ChainConfirmation &recorded,
                                 const CancellationToken &token,
                                 bool &live_confirmed) const;

        const OracleKeyRing &keys_;
        std::vector<LedgerBinding> ledgers_;
        QuorumPolicy quorum_;
        const Clock &clock_;
        ContentStore *content_store_;
    };

} // namespace proofline
