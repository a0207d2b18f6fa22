#include "proofline/engine.hpp"
#include "proofline/digest.hpp"
#include "proofline/proof_assembler.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace proofline
{

    using Json = nlohmann::json;

    Result<std::unique_ptr<AttestationEngine>> AttestationEngine::create(EngineCollaborators collaborators,
                                                                         EngineSettings settings)
    {
        auto quorum = QuorumPolicy::make(collaborators.ledgers.size(), settings.quorum);
        if (!quorum)
            return std::unexpected(quorum.error());

        for (const auto &binding : collaborators.ledgers)
        {
            if (binding.ledger.chain_id() != binding.policy.chain_id)
            {
                return std::unexpected(ProoflineError::config("Ledger client is bound to a different chain")
                                           .on_field("ledgers.chain_id")
                                           .compared(binding.policy.chain_id, binding.ledger.chain_id()));
            }
        }

        return std::unique_ptr<AttestationEngine>(
            new AttestationEngine(std::move(collaborators), std::move(settings), *quorum));
    }

    AttestationEngine::AttestationEngine(EngineCollaborators collaborators, EngineSettings settings, QuorumPolicy quorum)
        : c_(std::move(collaborators)),
          oracle_client_(c_.oracle, c_.keys, c_.clock, settings.oracle),
          tracker_(c_.ledgers, quorum, c_.clock, settings.tracker_ceiling),
          verifier_(c_.keys, c_.ledgers, quorum, c_.clock, &c_.content)
    {
    }

    void AttestationEngine::audit(const std::string &stage, const std::string &action, const std::string &subject,
                                  const std::string &result, Json details)
    {
        if (!c_.audit)
            return;
        AuditEvent event{c_.clock.now(), stage, action, subject, result, std::move(details)};
        if (auto appended = c_.audit->append(event); !appended)
            spdlog::error("audit trail rejected {} event: {}", stage, appended.error().describe());
    }

    Result<ProofArtifact> AttestationEngine::attest(const ContentLocator &locator,
                                                    const Json &metadata,
                                                    const CancellationToken &token)
    {
        // 1. content and identity
        auto content = c_.content.retrieve(locator);
        if (!content)
        {
            audit("content", "retrieve", locator.uri, "error", {{"error", content.error().describe()}});
            return std::unexpected(content.error().at_stage("content"));
        }

        auto content_digest = Hasher::hash(*content);
        if (content_digest != locator.digest)
        {
            auto err = ProoflineError::integrity("Content behind the locator does not match the locator digest");
            err.at_stage("canonicalize").on_field("content_digest").compared(locator.digest.to_hex(), content_digest.to_hex());
            spdlog::error("{}", err.describe());
            audit("canonicalize", "derive_identity", locator.uri, "integrity_fault", {{"error", err.describe()}});
            return std::unexpected(err);
        }

        auto stored_digest = c_.content.locator_digest(locator);
        if (!stored_digest)
        {
            audit("content", "locator_digest", locator.uri, "error", {{"error", stored_digest.error().describe()}});
            return std::unexpected(stored_digest.error().at_stage("content"));
        }
        if (*stored_digest != content_digest)
        {
            auto err = ProoflineError::integrity("Content store reports a different digest for the retrieved bytes");
            err.at_stage("canonicalize").on_field("content_digest").compared(stored_digest->to_hex(), content_digest.to_hex());
            spdlog::error("{}", err.describe());
            audit("canonicalize", "derive_identity", locator.uri, "integrity_fault", {{"error", err.describe()}});
            return std::unexpected(err);
        }

        auto identity = Hasher::derive_identity(*content, metadata);
        if (!identity)
        {
            spdlog::error("identity derivation failed: {}", identity.error().describe());
            audit("canonicalize", "derive_identity", locator.uri, "error", {{"error", identity.error().describe()}});
            return std::unexpected(identity.error());
        }
        const auto document_hex = identity->document_id.to_hex();
        spdlog::info("document {} (content {}, metadata {})", document_hex,
                     identity->content_digest.to_hex(), identity->metadata_digest.to_hex());
        audit("canonicalize", "derive_identity", document_hex, "ok",
              {{"content_digest", identity->content_digest.to_hex()},
               {"metadata_digest", identity->metadata_digest.to_hex()}});

        // 2. oracle
        AttestationRequest request;
        auto outcome = oracle_client_.attest(identity->document_id, locator, token, &request);
        if (!outcome)
        {
            audit("oracle", "attest", document_hex, request_state_to_string(request.state),
                  {{"request_id", request.request_id}, {"error", outcome.error().describe()}});
            return std::unexpected(outcome.error());
        }
        audit("oracle", "attest", document_hex, "finalized",
              {{"request_id", outcome->report.request_id},
               {"signer", outcome->report.signer},
               {"stale", outcome->assessment.stale}});

        // 3. ledgers
        auto tracking = tracker_.track(outcome->report.relays, token);
        Json ledger_states = Json::object();
        for (const auto &[chain_id, confirmation] : tracking.confirmations)
            ledger_states[chain_id] = chain_status_to_string(confirmation.status);
        audit("tracker", "track", document_hex, aggregate_status_to_string(tracking.aggregate),
              {{"ledgers", ledger_states}, {"forced_cutoff", tracking.forced_cutoff}});

        // 4. artifact
        auto artifact = ProofAssembler::assemble({identity->document_id,
                                                  locator,
                                                  identity->metadata_digest,
                                                  outcome->report,
                                                  tracking,
                                                  c_.clock.now(),
                                                  outcome->assessment.warnings});
        if (!artifact)
        {
            audit("assemble", "assemble", document_hex, "error", {{"error", artifact.error().describe()}});
            return std::unexpected(artifact.error());
        }
        audit("assemble", "assemble", document_hex, aggregate_status_to_string(artifact->aggregate_status),
              {{"artifact_checksum", artifact->artifact_checksum.to_hex()}});

        if (c_.proofs)
        {
            if (auto stored = c_.proofs->put(*artifact); !stored)
            {
                spdlog::error("could not persist proof {}: {}", document_hex, stored.error().describe());
                return std::unexpected(stored.error());
            }
        }
        return artifact;
    }

    VerificationReport AttestationEngine::verify(const ProofArtifact &artifact,
                                                 const crypto::Bytes &content,
                                                 const std::optional<Json> &metadata,
                                                 const CancellationToken &token) const
    {
        return verifier_.verify(artifact, content, metadata, token);
    }

} // namespace proofline
