#pragma once

#include "config.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace proofline
{

    /** Apply level and pattern to the default spdlog logger. Unknown levels are a ConfigError. */
    Result<void> configure_logging(const LoggingConfig &cfg);

    /**
     * Logger for audit events: a file sink at `cfg.audit_log` when set,
     * otherwise the default logger.
     */
    Result<std::shared_ptr<spdlog::logger>> make_audit_logger(const LoggingConfig &cfg);

} // namespace proofline
