#include "proofline/verifier.hpp"
#include "proofline/digest.hpp"
#include "proofline/oracle_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace proofline
{

    using Json = nlohmann::json;

    namespace
    {
        StageResult passed(std::string stage, std::string detail = {})
        {
            return StageResult{std::move(stage), StageStatus::Passed, std::nullopt, std::nullopt, std::move(detail)};
        }

        StageResult skipped(std::string stage, std::string detail)
        {
            return StageResult{std::move(stage), StageStatus::Skipped, std::nullopt, std::nullopt, std::move(detail)};
        }

        StageResult failed(std::string stage, std::string detail,
                           std::optional<std::string> expected = std::nullopt,
                           std::optional<std::string> actual = std::nullopt)
        {
            return StageResult{std::move(stage), StageStatus::Failed, std::move(expected), std::move(actual), std::move(detail)};
        }

        StageResult compare_digests(std::string stage, const Digest &expected, const Digest &actual, std::string what)
        {
            if (expected == actual)
                return passed(std::move(stage));
            return failed(std::move(stage), std::format("{} does not match", what), expected.to_hex(), actual.to_hex());
        }

        std::string describe_live(const TransactionStatus &status)
        {
            if (!status.found)
                return "not found";
            if (status.reverted)
                return "reverted";
            return std::format("{} confirmations at height {}", status.confirmation_count, status.block_height);
        }
    } // namespace

    std::string stage_status_to_string(StageStatus status)
    {
        switch (status)
        {
        case StageStatus::Passed:
            return "passed";
        case StageStatus::Failed:
            return "failed";
        case StageStatus::Skipped:
            return "skipped";
        }
        return "unknown";
    }

    std::string verdict_to_string(Verdict verdict)
    {
        return verdict == Verdict::Verified ? "VERIFIED" : "FAILED";
    }

    Json StageResult::to_json() const
    {
        Json j = {
            {"stage", stage},
            {"status", stage_status_to_string(status)}};
        if (expected)
            j["expected"] = *expected;
        if (actual)
            j["actual"] = *actual;
        if (!detail.empty())
            j["detail"] = detail;
        return j;
    }

    const StageResult *VerificationReport::failing_stage() const
    {
        auto it = std::find_if(stages.begin(), stages.end(),
                               [](const StageResult &s) { return s.status == StageStatus::Failed; });
        return it == stages.end() ? nullptr : &*it;
    }

    const StageResult *VerificationReport::find_stage(const std::string &stage) const
    {
        auto it = std::find_if(stages.begin(), stages.end(),
                               [&](const StageResult &s) { return s.stage == stage; });
        return it == stages.end() ? nullptr : &*it;
    }

    Json VerificationReport::to_json() const
    {
        Json j = {{"verdict", verdict_to_string(verdict)}};
        if (const auto *failing = failing_stage())
            j["failing_stage"] = failing->stage;
        Json stage_list = Json::array();
        for (const auto &s : stages)
            stage_list.push_back(s.to_json());
        j["stages"] = stage_list;
        return j;
    }

    // ============================================================================
    // Verifier
    // ============================================================================

    Verifier::Verifier(const OracleKeyRing &keys,
                       std::vector<LedgerBinding> ledgers,
                       QuorumPolicy quorum,
                       const Clock &clock,
                       ContentStore *content_store)
        : keys_(keys), ledgers_(std::move(ledgers)), quorum_(quorum), clock_(clock), content_store_(content_store)
    {
    }

    VerificationReport Verifier::verify(const ProofArtifact &artifact,
                                        const crypto::Bytes &content,
                                        const std::optional<Json> &metadata,
                                        const CancellationToken &token) const
    {
        VerificationReport report;

        // artifact_checksum
        if (auto checksum = artifact.compute_checksum(); !checksum)
        {
            report.stages.push_back(failed("artifact_checksum", checksum.error().describe()));
        }
        else
        {
            report.stages.push_back(compare_digests("artifact_checksum", *checksum, artifact.artifact_checksum,
                                                    "recorded artifact checksum"));
        }

        // content_digest
        const Digest content_digest = Hasher::hash(content);
        report.stages.push_back(compare_digests("content_digest", artifact.content_locator.digest, content_digest,
                                                "content digest"));

        // metadata_digest
        Digest metadata_digest = artifact.metadata_digest;
        if (!metadata)
        {
            report.stages.push_back(skipped("metadata_digest", "metadata not supplied; recorded digest used for document id"));
        }
        else if (auto recomputed = Hasher::hash_metadata(*metadata); !recomputed)
        {
            report.stages.push_back(failed("metadata_digest", recomputed.error().describe()));
        }
        else
        {
            metadata_digest = *recomputed;
            report.stages.push_back(compare_digests("metadata_digest", artifact.metadata_digest, metadata_digest,
                                                    "metadata digest"));
        }

        // document_id
        const Digest document_id = Hasher::assemble_document_id(content_digest, metadata_digest);
        report.stages.push_back(compare_digests("document_id", artifact.document_id, document_id, "document id"));

        // oracle_signature
        if (auto sig = check_report_signature(artifact.oracle_report, keys_); !sig)
        {
            report.stages.push_back(failed("oracle_signature", sig.error().what(),
                                           std::nullopt, sig.error().field.empty() ? std::nullopt : std::optional(sig.error().field)));
        }
        else
        {
            report.stages.push_back(passed("oracle_signature", std::format("signed by {}", artifact.oracle_report.signer)));
        }

        // oracle_digest
        if (!artifact.oracle_report.finalized)
        {
            report.stages.push_back(failed("oracle_digest", "oracle report is not finalized", "true", "false"));
        }
        else
        {
            report.stages.push_back(compare_digests("oracle_digest", document_id, artifact.oracle_report.reported_digest,
                                                    "oracle reported digest"));
        }

        // ledger:<chainId>
        std::size_t live_confirmed = 0;
        for (const auto &[chain_id, recorded] : artifact.chain_confirmations)
        {
            bool confirmed = false;
            report.stages.push_back(check_ledger(artifact, recorded, token, confirmed));
            if (confirmed)
                ++live_confirmed;
        }

        // quorum
        const std::string expected_quorum = std::format("at least {} of {} ledgers confirmed", quorum_.required(), quorum_.configured());
        if (artifact.aggregate_status != AggregateStatus::Confirmed)
        {
            report.stages.push_back(failed("quorum",
                                           std::format("artifact records aggregate status {}",
                                                       aggregate_status_to_string(artifact.aggregate_status)),
                                           expected_quorum,
                                           std::format("{} confirmed live", live_confirmed)));
        }
        else if (live_confirmed < quorum_.required())
        {
            report.stages.push_back(failed("quorum", "too few ledgers re-confirmed live",
                                           expected_quorum, std::format("{} confirmed live", live_confirmed)));
        }
        else
        {
            report.stages.push_back(passed("quorum", std::format("{} ledgers confirmed live", live_confirmed)));
        }

        report.verdict = report.failing_stage() ? Verdict::Failed : Verdict::Verified;
        if (const auto *failing = report.failing_stage())
        {
            spdlog::warn("verification of {} FAILED at stage {}", artifact.document_id.to_hex(), failing->stage);
        }
        else
        {
            spdlog::info("verification of {} VERIFIED", artifact.document_id.to_hex());
        }
        return report;
    }

    Result<VerificationReport> Verifier::verify_stored(const ProofArtifact &artifact,
                                                       const std::optional<Json> &metadata,
                                                       const CancellationToken &token) const
    {
        if (!content_store_)
        {
            return std::unexpected(ProoflineError::invalid_input("No content store configured to retrieve the document")
                                       .at_stage("content_digest"));
        }
        auto content = content_store_->retrieve(artifact.content_locator);
        if (!content)
            return std::unexpected(content.error());

        auto stored_digest = content_store_->locator_digest(artifact.content_locator);
        if (!stored_digest)
            return std::unexpected(stored_digest.error());
        auto retrieved_digest = Hasher::hash(*content);
        if (*stored_digest != retrieved_digest)
        {
            return std::unexpected(ProoflineError::integrity("Content store reports a different digest for the retrieved bytes")
                                       .at_stage("content_digest")
                                       .on_field("content_digest")
                                       .compared(stored_digest->to_hex(), retrieved_digest.to_hex()));
        }
        return verify(artifact, *content, metadata, token);
    }

    StageResult Verifier::check_ledger(const ProofArtifact &artifact,
                                       const ChainConfirmation &recorded,
                                       const CancellationToken &token,
                                       bool &live_confirmed) const
    {
        live_confirmed = false;
        const std::string stage = "ledger:" + recorded.chain_id;

        auto binding = std::find_if(ledgers_.begin(), ledgers_.end(),
                                    [&](const LedgerBinding &b) { return b.policy.chain_id == recorded.chain_id; });
        if (binding == ledgers_.end())
        {
            return skipped(stage, "no ledger client configured for this chain; not counted toward quorum");
        }
        const auto &policy = binding->policy;

        if (recorded.status == ChainStatus::Confirmed)
        {
            auto relay = artifact.oracle_report.relays.find(recorded.chain_id);
            if (relay == artifact.oracle_report.relays.end() || relay->second != recorded.transaction_ref)
            {
                return failed(stage, "recorded transaction is not the one the oracle relayed",
                              relay == artifact.oracle_report.relays.end() ? std::string("<none>") : relay->second,
                              recorded.transaction_ref);
            }
        }

        if (recorded.transaction_ref.empty())
        {
            if (recorded.status == ChainStatus::Confirmed)
                return failed(stage, "confirmed ledger has no transaction reference");
            return skipped(stage, std::format("recorded {} without a transaction", chain_status_to_string(recorded.status)));
        }

        Result<TransactionStatus> live = std::unexpected(ProoflineError::cancelled("Verification cancelled"));
        std::size_t failures = 0;
        while (!token.is_cancelled())
        {
            live = binding->ledger.get_transaction_status(recorded.transaction_ref, policy.call_timeout);
            if (live || !live.error().is_transient())
                break;
            ++failures;
            if (policy.backoff.exhausted(failures))
                break;
            clock_.sleep_for(policy.backoff.delay_for(failures), token);
        }

        const std::string expected = std::format("found with at least {} confirmations", policy.required_depth);

        if (!live)
        {
            if (recorded.status != ChainStatus::Confirmed)
                return skipped(stage, std::format("recorded {}; live query failed: {}",
                                                  chain_status_to_string(recorded.status), live.error().what()));
            return failed(stage, std::format("live query failed: {}", live.error().what()), expected, "unavailable");
        }

        bool deep_enough = live->found && !live->reverted && live->confirmation_count >= policy.required_depth;
        if (recorded.status != ChainStatus::Confirmed)
        {
            return skipped(stage, std::format("recorded {}; live: {}", chain_status_to_string(recorded.status), describe_live(*live)));
        }

        if (!deep_enough)
        {
            spdlog::warn("ledger {} no longer confirms {}: {}", recorded.chain_id, recorded.transaction_ref, describe_live(*live));
            return failed(stage, "recorded confirmation does not hold on the live ledger", expected, describe_live(*live));
        }

        live_confirmed = true;
        return passed(stage, describe_live(*live));
    }

} // namespace proofline
