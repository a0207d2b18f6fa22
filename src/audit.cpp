#include "proofline/audit.hpp"
#include "proofline/crypto.hpp"
#include "proofline/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace proofline
{

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", format_timestamp(ts)},
                              {"stage", stage},
                              {"action", action},
                              {"subject", subject},
                              {"result", result},
                              {"details", details}};
    }

    AuditTrail::AuditTrail(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : spdlog::default_logger())
    {
    }

    Result<std::string> AuditTrail::link(const std::string &previous, const AuditEvent &event)
    {
        auto canonical = json::RFC8785Canonicalizer::canonicalize(event.to_json());
        if (!canonical)
            return std::unexpected(canonical.error().at_stage("audit"));
        return crypto::SHA256::to_hex(crypto::SHA256::hash(previous + *canonical));
    }

    Result<std::string> AuditTrail::append(const AuditEvent &event)
    {
        std::lock_guard lock(mutex_);
        auto hash = link(hashes_.empty() ? std::string() : hashes_.back(), event);
        if (!hash)
            return hash;

        events_.push_back(event);
        hashes_.push_back(*hash);

        nlohmann::json j = event.to_json();
        j["chain_hash"] = *hash;
        logger_->info(j.dump());
        return hash;
    }

    std::optional<std::string> AuditTrail::head() const
    {
        std::lock_guard lock(mutex_);
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    std::vector<std::string> AuditTrail::hashes() const
    {
        std::lock_guard lock(mutex_);
        return hashes_;
    }

    std::vector<AuditEvent> AuditTrail::events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

    Result<void> AuditTrail::verify() const
    {
        std::lock_guard lock(mutex_);
        std::string previous;
        for (std::size_t i = 0; i < events_.size(); ++i)
        {
            auto expected = link(previous, events_[i]);
            if (!expected)
                return std::unexpected(expected.error());
            if (*expected != hashes_[i])
            {
                return std::unexpected(ProoflineError::integrity(std::format("Audit chain broken at event {}", i))
                                           .at_stage("audit")
                                           .compared(*expected, hashes_[i]));
            }
            previous = hashes_[i];
        }
        return {};
    }

} // namespace proofline
