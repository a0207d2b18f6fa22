#include "proofline/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <format>

namespace proofline
{

    Result<void> configure_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        // from_str maps anything unrecognised to "off"
        if (level == spdlog::level::off && cfg.level != "off")
        {
            return std::unexpected(ProoflineError::config(std::format("Unknown log level '{}'", cfg.level))
                                       .on_field("logging.level"));
        }
        spdlog::set_level(level);
        spdlog::set_pattern(cfg.pattern);
        return {};
    }

    Result<std::shared_ptr<spdlog::logger>> make_audit_logger(const LoggingConfig &cfg)
    {
        if (!cfg.audit_log)
            return spdlog::default_logger();

        if (auto existing = spdlog::get("audit"))
            return existing;

        try
        {
            auto logger = spdlog::basic_logger_mt("audit", *cfg.audit_log);
            logger->set_pattern("%v");
            logger->flush_on(spdlog::level::info);
            return logger;
        }
        catch (const spdlog::spdlog_ex &e)
        {
            return std::unexpected(ProoflineError::io(std::format("Cannot open audit log '{}': {}", *cfg.audit_log, e.what()))
                                       .on_field("logging.audit_log"));
        }
    }

} // namespace proofline
