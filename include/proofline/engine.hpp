#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include "collaborators.hpp"
#include "confirmation_tracker.hpp"
#include "oracle_client.hpp"
#include "oracle_keys.hpp"
#include "proof_artifact.hpp"
#include "proof_store.hpp"
#include "quorum.hpp"
#include "types.hpp"
#include "verifier.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace proofline
{

    /**
     * Collaborators borrowed by the engine. All of them must outlive it.
     * `proofs` and `audit` are optional.
     */
    struct EngineCollaborators
    {
        ContentStore &content;
        Oracle &oracle;
        std::vector<LedgerBinding> ledgers;
        const OracleKeyRing &keys;
        const Clock &clock;
        ProofStore *proofs{nullptr};
        AuditTrail *audit{nullptr};
    };

    struct EngineSettings
    {
        OracleClientConfig oracle{};
        std::optional<std::size_t> quorum; // majority when unset
        std::chrono::milliseconds tracker_ceiling{std::chrono::minutes(30)};
    };

    /**
     * Runs the whole attestation pipeline:
     * content -> identity -> oracle -> ledgers -> artifact.
     *
     * A failed aggregate is a business outcome, not an error: `attest` still
     * returns the (negative) artifact. Errors are reserved for integrity
     * faults, rejected or timed-out oracle requests and cancellation before
     * any ledger tracking started.
     */
    class AttestationEngine
    {
    public:
        static Result<std::unique_ptr<AttestationEngine>> create(EngineCollaborators collaborators,
                                                                 EngineSettings settings = {});

        Result<ProofArtifact> attest(const ContentLocator &locator,
                                     const nlohmann::json &metadata,
                                     const CancellationToken &token = CancellationToken());

        VerificationReport verify(const ProofArtifact &artifact,
                                  const crypto::Bytes &content,
                                  const std::optional<nlohmann::json> &metadata = std::nullopt,
                                  const CancellationToken &token = CancellationToken()) const;

        /** Push-notification entry points */
        OracleClient &oracle_client() { return oracle_client_; }
        ConfirmationTracker &tracker() { return tracker_; }

    private:
        AttestationEngine(EngineCollaborators collaborators, EngineSettings settings, QuorumPolicy quorum);

        void audit(const std::string &stage, const std::string &action, const std::string &subject,
                   const std::string &result, nlohmann::json details = nlohmann::json::object());

        EngineCollaborators c_;
        OracleClient oracle_client_;
        ConfirmationTracker tracker_;
        Verifier verifier_;
    };

} // namespace proofline
