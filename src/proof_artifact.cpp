#include "proofline/proof_artifact.hpp"
#include "proofline/json_canonicalization.hpp"
#include "proofline/json_fields.hpp"
#include <format>

namespace proofline
{

    using Json = nlohmann::json;

    namespace
    {
        // Re-anchor a nested parse error under its parent field
        ProoflineError nested(ProoflineError err, const std::string &parent)
        {
            err.on_field(err.field.empty() ? parent : parent + "." + err.field);
            return err;
        }
    } // namespace

    Json ProofArtifact::body_json() const
    {
        Json confirmations = Json::object();
        for (const auto &[chain_id, confirmation] : chain_confirmations)
        {
            confirmations[chain_id] = confirmation.to_json();
        }

        return Json{
            {"schema_version", schema_version},
            {"hash_algorithm", digest_algorithm_to_string(hash_algorithm)},
            {"document_id", document_id.to_hex()},
            {"content_locator", content_locator.to_json()},
            {"metadata_digest", metadata_digest.to_hex()},
            {"oracle_report", oracle_report.to_json()},
            {"chain_confirmations", confirmations},
            {"aggregate_status", aggregate_status_to_string(aggregate_status)},
            {"quorum", Json{{"required", quorum_required}, {"configured", quorum_configured}}},
            {"forced_cutoff", forced_cutoff},
            {"warnings", warnings},
            {"created_at", format_timestamp(created_at)}};
    }

    Json ProofArtifact::to_json() const
    {
        Json j = body_json();
        j["artifact_checksum"] = artifact_checksum.to_hex();
        return j;
    }

    Result<std::string> ProofArtifact::canonical_json() const
    {
        return json::RFC8785Canonicalizer::canonicalize(body_json());
    }

    Result<Digest> ProofArtifact::compute_checksum() const
    {
        auto canonical = canonical_json();
        if (!canonical)
            return std::unexpected(canonical.error());
        return Hasher::hash(*canonical);
    }

    Result<void> ProofArtifact::verify_checksum() const
    {
        auto computed = compute_checksum();
        if (!computed)
            return std::unexpected(computed.error());
        if (*computed != artifact_checksum)
        {
            return std::unexpected(ProoflineError::integrity("Artifact checksum does not match its contents")
                                       .at_stage("artifact_checksum")
                                       .on_field("artifact_checksum")
                                       .compared(computed->to_hex(), artifact_checksum.to_hex()));
        }
        return {};
    }

    Result<ProofArtifact> ProofArtifact::from_json(const Json &j)
    {
        ProofArtifact a;

        auto version = json::require_string(j, "schema_version");
        if (!version)
            return std::unexpected(version.error());
        if (*version != kArtifactSchemaVersion)
        {
            return std::unexpected(ProoflineError::validation(std::format("Unsupported artifact schema version '{}'", *version))
                                       .on_field("schema_version")
                                       .compared(kArtifactSchemaVersion, *version));
        }
        a.schema_version = *version;

        auto algorithm_text = json::require_string(j, "hash_algorithm");
        if (!algorithm_text)
            return std::unexpected(algorithm_text.error());
        auto algorithm = digest_algorithm_from_string(*algorithm_text);
        if (!algorithm)
            return std::unexpected(algorithm.error());
        a.hash_algorithm = *algorithm;

        auto document_id = json::require_digest(j, "document_id");
        if (!document_id)
            return std::unexpected(document_id.error());
        a.document_id = *document_id;

        auto locator_json = json::require_field(j, "content_locator");
        if (!locator_json)
            return std::unexpected(locator_json.error());
        auto locator = ContentLocator::from_json(**locator_json);
        if (!locator)
            return std::unexpected(nested(locator.error(), "content_locator"));
        a.content_locator = *locator;

        auto metadata_digest = json::require_digest(j, "metadata_digest");
        if (!metadata_digest)
            return std::unexpected(metadata_digest.error());
        a.metadata_digest = *metadata_digest;

        auto report_json = json::require_field(j, "oracle_report");
        if (!report_json)
            return std::unexpected(report_json.error());
        auto report = OracleReport::from_json(**report_json);
        if (!report)
            return std::unexpected(nested(report.error(), "oracle_report"));
        a.oracle_report = *report;

        auto confirmations = json::require_field(j, "chain_confirmations");
        if (!confirmations)
            return std::unexpected(confirmations.error());
        if (!(*confirmations)->is_object())
        {
            return std::unexpected(ProoflineError::validation("Field 'chain_confirmations' must be an object")
                                       .on_field("chain_confirmations"));
        }
        for (auto it = (*confirmations)->begin(); it != (*confirmations)->end(); ++it)
        {
            const std::string parent = "chain_confirmations." + it.key();
            auto confirmation = ChainConfirmation::from_json(it.value());
            if (!confirmation)
                return std::unexpected(nested(confirmation.error(), parent));
            if (confirmation->chain_id != it.key())
            {
                return std::unexpected(ProoflineError::validation("Confirmation is filed under a different chain id")
                                           .on_field(parent + ".chain_id")
                                           .compared(it.key(), confirmation->chain_id));
            }
            a.chain_confirmations.emplace(it.key(), std::move(*confirmation));
        }

        auto aggregate_text = json::require_string(j, "aggregate_status");
        if (!aggregate_text)
            return std::unexpected(aggregate_text.error());
        auto aggregate = aggregate_status_from_string(*aggregate_text);
        if (!aggregate)
            return std::unexpected(aggregate.error());
        a.aggregate_status = *aggregate;

        auto quorum = json::require_field(j, "quorum");
        if (!quorum)
            return std::unexpected(quorum.error());
        auto required = json::require_u64(**quorum, "required");
        if (!required)
            return std::unexpected(nested(required.error(), "quorum"));
        auto configured = json::require_u64(**quorum, "configured");
        if (!configured)
            return std::unexpected(nested(configured.error(), "quorum"));
        a.quorum_required = static_cast<std::size_t>(*required);
        a.quorum_configured = static_cast<std::size_t>(*configured);

        auto forced = json::require_bool(j, "forced_cutoff");
        if (!forced)
            return std::unexpected(forced.error());
        a.forced_cutoff = *forced;

        auto warnings = json::require_field(j, "warnings");
        if (!warnings)
            return std::unexpected(warnings.error());
        if (!(*warnings)->is_array())
            return std::unexpected(ProoflineError::validation("Field 'warnings' must be an array").on_field("warnings"));
        for (const auto &warning : **warnings)
        {
            if (!warning.is_string())
                return std::unexpected(ProoflineError::validation("Warnings must be strings").on_field("warnings"));
            a.warnings.push_back(warning.get<std::string>());
        }

        auto created_at = json::require_timestamp(j, "created_at");
        if (!created_at)
            return std::unexpected(created_at.error());
        a.created_at = *created_at;

        auto checksum = json::require_digest(j, "artifact_checksum");
        if (!checksum)
            return std::unexpected(checksum.error());
        a.artifact_checksum = *checksum;

        return a;
    }

    Result<ProofArtifact> ProofArtifact::parse(const std::string &text)
    {
        try
        {
            return from_json(Json::parse(text));
        }
        catch (const Json::parse_error &e)
        {
            return std::unexpected(ProoflineError::validation(std::format("Artifact is not valid JSON: {}", e.what())));
        }
    }

} // namespace proofline
