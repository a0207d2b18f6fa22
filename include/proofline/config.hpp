#pragma once

#include "confirmation_tracker.hpp"
#include "oracle_client.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace proofline
{

    struct OracleKeyConfig
    {
        std::string key_id;
        std::string public_key; // base64 Ed25519
        std::string authority;
        std::string description;
    };

    struct OracleConfig
    {
        std::string endpoint{"http://127.0.0.1:8700"};
        OracleClientConfig client{};
        std::vector<OracleKeyConfig> keys;
    };

    struct LedgerConfig
    {
        std::string endpoint;
        ChainPolicy policy{};
    };

    struct TrackerConfig
    {
        std::optional<std::size_t> quorum; // defaults to a majority of the configured ledgers
        std::chrono::milliseconds ceiling{std::chrono::minutes(30)};
    };

    struct StorageConfig
    {
        std::string backend{"file"}; // file | rocksdb
        std::string path{"./data/proofs"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v"};
        std::optional<std::string> audit_log; // file sink for audit events; stdout logger when unset
    };

    struct EngineConfig
    {
        OracleConfig oracle{};
        TrackerConfig tracker{};
        std::vector<LedgerConfig> ledgers;
        StorageConfig storage{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs (toml++) with PROOFLINE_* environment
     * overrides, then validates the result. Durations are integer
     * milliseconds in keys ending in `_ms`.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<EngineConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<EngineConfig> from_string(const std::string &toml_content);

        /** Effective configuration as JSON, for `config-print` and logs */
        static nlohmann::json to_json(const EngineConfig &cfg);

        /** Cross-field checks: unique non-empty chain ids, quorum range, backend name */
        static Result<void> validate(const EngineConfig &cfg);

    private:
        static Result<void> apply_env_overrides(EngineConfig &cfg);
    };

} // namespace proofline
