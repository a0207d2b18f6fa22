#include "proofline/proof_assembler.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace proofline
{

    Result<ProofArtifact> ProofAssembler::assemble(const AssemblyInput &input)
    {
        const auto &tracking = input.tracking;

        if (tracking.aggregate == AggregateStatus::Pending && !tracking.forced_cutoff)
        {
            return std::unexpected(ProoflineError::invalid_input(
                                       "Cannot assemble a proof while the confirmation aggregate is still pending")
                                       .at_stage("assemble")
                                       .on_field("aggregate_status"));
        }

        if (input.report.reported_digest != input.document_id)
        {
            spdlog::error("refusing to assemble: oracle report digest {} is not document {}",
                          input.report.reported_digest.to_hex(), input.document_id.to_hex());
            return std::unexpected(ProoflineError::integrity("Oracle report digest does not match the document id")
                                       .at_stage("assemble")
                                       .on_field("reported_digest")
                                       .compared(input.document_id.to_hex(), input.report.reported_digest.to_hex()));
        }

        if (tracking.confirmations.size() != tracking.quorum.configured())
        {
            return std::unexpected(ProoflineError::invalid_input(std::format(
                                       "Tracking recorded {} ledgers but the quorum is configured for {}",
                                       tracking.confirmations.size(), tracking.quorum.configured()))
                                       .at_stage("assemble")
                                       .on_field("chain_confirmations"));
        }

        for (const auto &[chain_id, confirmation] : tracking.confirmations)
        {
            if (chain_id != confirmation.chain_id)
            {
                return std::unexpected(ProoflineError::invalid_input("Confirmation is filed under a different chain id")
                                           .at_stage("assemble")
                                           .on_field("chain_confirmations." + chain_id)
                                           .compared(chain_id, confirmation.chain_id));
            }
        }

        ProofArtifact artifact;
        artifact.document_id = input.document_id;
        artifact.content_locator = input.locator;
        artifact.metadata_digest = input.metadata_digest;
        artifact.oracle_report = input.report;
        artifact.chain_confirmations = tracking.confirmations;
        artifact.aggregate_status = tracking.aggregate;
        artifact.quorum_required = tracking.quorum.required();
        artifact.quorum_configured = tracking.quorum.configured();
        artifact.forced_cutoff = tracking.forced_cutoff;
        artifact.warnings = input.warnings;
        artifact.created_at = input.created_at;

        auto checksum = artifact.compute_checksum();
        if (!checksum)
            return std::unexpected(checksum.error().at_stage("assemble"));
        artifact.artifact_checksum = *checksum;

        if (artifact.aggregate_status == AggregateStatus::Failed)
        {
            spdlog::warn("assembled negative proof for document {}", artifact.document_id.to_hex());
        }
        else
        {
            spdlog::info("assembled proof for document {} ({}, checksum {})",
                         artifact.document_id.to_hex(),
                         aggregate_status_to_string(artifact.aggregate_status),
                         artifact.artifact_checksum.to_hex());
        }
        return artifact;
    }

} // namespace proofline
