#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace proofline
{
    struct AuditEvent
    {
        Timestamp ts;
        std::string stage;   // canonicalize, oracle, tracker, assemble, verify
        std::string action;
        std::string subject; // document id or request id
        std::string result;
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;
    };

    /**
     * AuditTrail links stage events with hashes for tamper detection.
     *
     * Each link is SHA-256 over the previous link (hex) followed by the
     * canonical JSON of the event, so removing or reordering any event
     * breaks every later link. Events are also emitted through spdlog
     * together with their link.
     */
    class AuditTrail
    {
    public:
        explicit AuditTrail(std::shared_ptr<spdlog::logger> logger = nullptr);

        /** Append an event, returning its chain hash */
        Result<std::string> append(const AuditEvent &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        std::vector<std::string> hashes() const;

        std::vector<AuditEvent> events() const;

        /** Recompute every link from the recorded events */
        Result<void> verify() const;

        /** Link for `event` following `previous` (empty for the first event) */
        static Result<std::string> link(const std::string &previous, const AuditEvent &event);

    private:
        mutable std::mutex mutex_;
        std::shared_ptr<spdlog::logger> logger_;
        std::vector<AuditEvent> events_;
        std::vector<std::string> hashes_;
    };

} // namespace proofline
