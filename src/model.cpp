#include "proofline/model.hpp"
#include "proofline/json_canonicalization.hpp"
#include "proofline/json_fields.hpp"
#include <format>

namespace proofline
{

    using Json = nlohmann::json;

    // ========== ContentLocator ==========

    Json ContentLocator::to_json() const
    {
        return Json{
            {"uri", uri},
            {"digest", digest.to_hex()}};
    }

    Result<ContentLocator> ContentLocator::from_json(const Json &j)
    {
        auto uri = json::require_string(j, "uri");
        if (!uri)
            return std::unexpected(uri.error());
        if (uri->empty())
            return std::unexpected(ProoflineError::validation("Locator URI is empty").on_field("uri"));
        auto digest = json::require_digest(j, "digest");
        if (!digest)
            return std::unexpected(digest.error());
        return ContentLocator{*uri, *digest};
    }

    // ========== OracleReport ==========

    Result<crypto::Bytes> OracleReport::signing_payload() const
    {
        Json payload = {
            {"issued_at", format_timestamp(issued_at)},
            {"reported_digest", reported_digest.to_hex()},
            {"request_id", request_id}};
        return json::RFC8785Canonicalizer::canonical_bytes(payload);
    }

    Json OracleReport::to_json() const
    {
        Json relays_json = Json::object();
        for (const auto &[chain_id, tx_ref] : relays)
        {
            relays_json[chain_id] = tx_ref;
        }

        return Json{
            {"request_id", request_id},
            {"reported_digest", reported_digest.to_hex()},
            {"signature", signature},
            {"signer", signer},
            {"issued_at", format_timestamp(issued_at)},
            {"finalized", finalized},
            {"relays", relays_json}};
    }

    Result<OracleReport> OracleReport::from_json(const Json &j)
    {
        OracleReport report;

        auto request_id = json::require_string(j, "request_id");
        if (!request_id)
            return std::unexpected(request_id.error());
        report.request_id = *request_id;

        auto digest = json::require_digest(j, "reported_digest");
        if (!digest)
            return std::unexpected(digest.error());
        report.reported_digest = *digest;

        auto signature = json::require_string(j, "signature");
        if (!signature)
            return std::unexpected(signature.error());
        report.signature = *signature;

        auto signer = json::require_string(j, "signer");
        if (!signer)
            return std::unexpected(signer.error());
        report.signer = *signer;

        auto issued_at = json::require_timestamp(j, "issued_at");
        if (!issued_at)
            return std::unexpected(issued_at.error());
        report.issued_at = *issued_at;

        auto finalized = json::require_bool(j, "finalized");
        if (!finalized)
            return std::unexpected(finalized.error());
        report.finalized = *finalized;

        if (auto it = j.find("relays"); it != j.end())
        {
            if (!it->is_object())
                return std::unexpected(ProoflineError::validation("Field 'relays' must be an object").on_field("relays"));
            for (auto relay = it->begin(); relay != it->end(); ++relay)
            {
                if (!relay.value().is_string())
                {
                    return std::unexpected(ProoflineError::validation(
                                               std::format("Relay for chain '{}' must be a string", relay.key()))
                                               .on_field("relays." + relay.key()));
                }
                report.relays.emplace(relay.key(), relay.value().get<std::string>());
            }
        }

        return report;
    }

    // ========== ChainStatus / AggregateStatus ==========

    std::string chain_status_to_string(ChainStatus status)
    {
        switch (status)
        {
        case ChainStatus::Unconfirmed:
            return "unconfirmed";
        case ChainStatus::Pending:
            return "pending";
        case ChainStatus::Confirmed:
            return "confirmed";
        case ChainStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    Result<ChainStatus> chain_status_from_string(const std::string &s)
    {
        if (s == "unconfirmed")
            return ChainStatus::Unconfirmed;
        if (s == "pending")
            return ChainStatus::Pending;
        if (s == "confirmed")
            return ChainStatus::Confirmed;
        if (s == "failed")
            return ChainStatus::Failed;
        return std::unexpected(ProoflineError::validation(std::format("Invalid chain status: {}", s))
                                   .on_field("status"));
    }

    std::string aggregate_status_to_string(AggregateStatus status)
    {
        switch (status)
        {
        case AggregateStatus::Pending:
            return "pending";
        case AggregateStatus::Confirmed:
            return "confirmed";
        case AggregateStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    Result<AggregateStatus> aggregate_status_from_string(const std::string &s)
    {
        if (s == "pending")
            return AggregateStatus::Pending;
        if (s == "confirmed")
            return AggregateStatus::Confirmed;
        if (s == "failed")
            return AggregateStatus::Failed;
        return std::unexpected(ProoflineError::validation(std::format("Invalid aggregate status: {}", s))
                                   .on_field("aggregate_status"));
    }

    // ========== ChainConfirmation ==========

    Json ChainConfirmation::to_json() const
    {
        Json j = {
            {"chain_id", chain_id},
            {"transaction_ref", transaction_ref},
            {"block_height", block_height},
            {"confirmation_count", confirmation_count},
            {"required_depth", required_depth},
            {"status", chain_status_to_string(status)}};

        if (failure_reason)
            j["failure_reason"] = *failure_reason;
        if (updated_at)
            j["updated_at"] = format_timestamp(*updated_at);
        return j;
    }

    Result<ChainConfirmation> ChainConfirmation::from_json(const Json &j)
    {
        ChainConfirmation c;

        auto chain_id = json::require_string(j, "chain_id");
        if (!chain_id)
            return std::unexpected(chain_id.error());
        c.chain_id = *chain_id;

        auto tx_ref = json::require_string(j, "transaction_ref");
        if (!tx_ref)
            return std::unexpected(tx_ref.error());
        c.transaction_ref = *tx_ref;

        auto height = json::require_u64(j, "block_height");
        if (!height)
            return std::unexpected(height.error());
        c.block_height = *height;

        auto count = json::require_u64(j, "confirmation_count");
        if (!count)
            return std::unexpected(count.error());
        c.confirmation_count = *count;

        auto depth = json::require_u64(j, "required_depth");
        if (!depth)
            return std::unexpected(depth.error());
        c.required_depth = *depth;

        auto status_text = json::require_string(j, "status");
        if (!status_text)
            return std::unexpected(status_text.error());
        auto status = chain_status_from_string(*status_text);
        if (!status)
            return std::unexpected(status.error());
        c.status = *status;

        if (j.contains("failure_reason"))
        {
            auto reason = json::require_string(j, "failure_reason");
            if (!reason)
                return std::unexpected(reason.error());
            c.failure_reason = *reason;
        }
        if (j.contains("updated_at"))
        {
            auto updated = json::require_timestamp(j, "updated_at");
            if (!updated)
                return std::unexpected(updated.error());
            c.updated_at = *updated;
        }
        return c;
    }

    // ========== TransactionStatus ==========

    Result<TransactionStatus> TransactionStatus::from_json(const Json &j)
    {
        TransactionStatus status;

        auto found = json::require_bool(j, "found");
        if (!found)
            return std::unexpected(found.error());
        status.found = *found;

        if (!status.found)
            return status;

        auto height = json::require_u64(j, "block_height");
        if (!height)
            return std::unexpected(height.error());
        status.block_height = *height;

        auto count = json::require_u64(j, "confirmation_count");
        if (!count)
            return std::unexpected(count.error());
        status.confirmation_count = *count;

        auto reverted = json::require_bool(j, "reverted");
        if (!reverted)
            return std::unexpected(reverted.error());
        status.reverted = *reverted;

        return status;
    }

} // namespace proofline
