#include "proofline/config.hpp"
#include "proofline/quorum.hpp"
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace proofline
{
    namespace
    {
        /**
         * Typed reads from one TOML table. The first type or range error is
         * kept and reported with its dotted path; later reads are skipped.
         */
        class TableReader
        {
        public:
            TableReader(const toml::table &tbl, std::string prefix)
                : tbl_(tbl), prefix_(std::move(prefix)) {}

            template <typename T>
            void read(std::string_view key, T &out)
            {
                if (error)
                    return;
                const toml::node *node = tbl_.get(key);
                if (!node)
                    return;
                if (auto v = node->value<T>())
                {
                    out = *v;
                    return;
                }
                fail(key, "has the wrong type");
            }

            void read_count(std::string_view key, std::size_t &out)
            {
                int64_t v = static_cast<int64_t>(out);
                read(key, v);
                if (error)
                    return;
                if (v < 0)
                {
                    fail(key, "must not be negative");
                    return;
                }
                out = static_cast<std::size_t>(v);
            }

            void read_u64(std::string_view key, uint64_t &out)
            {
                std::size_t v = static_cast<std::size_t>(out);
                read_count(key, v);
                out = static_cast<uint64_t>(v);
            }

            void read_ms(std::string_view key, std::chrono::milliseconds &out)
            {
                int64_t v = out.count();
                read(key, v);
                if (error)
                    return;
                if (v < 0)
                {
                    fail(key, "must not be negative");
                    return;
                }
                out = std::chrono::milliseconds(v);
            }

            void read_backoff(BackoffPolicy &out)
            {
                read_ms("backoff_initial_ms", out.initial);
                read_ms("backoff_max_ms", out.max);
                read("backoff_multiplier", out.multiplier);
                read_count("max_attempts", out.max_attempts);
                if (!error && out.multiplier < 1.0)
                    fail("backoff_multiplier", "must be at least 1.0");
                if (!error && out.max_attempts == 0)
                    fail("max_attempts", "must be at least 1");
            }

            void require(std::string_view key, std::string &out)
            {
                if (error)
                    return;
                if (!tbl_.get(key))
                {
                    fail(key, "is required");
                    return;
                }
                read(key, out);
            }

            std::string path(std::string_view key) const
            {
                return prefix_.empty() ? std::string(key) : std::format("{}.{}", prefix_, key);
            }

            std::optional<ProoflineError> error;

        private:
            void fail(std::string_view key, std::string_view what)
            {
                error = ProoflineError::config(std::format("Config key '{}' {}", path(key), what)).on_field(path(key));
            }

            const toml::table &tbl_;
            std::string prefix_;
        };

        Result<void> parse_toml(const toml::table &tbl, EngineConfig &cfg)
        {
            if (auto oracle = tbl["oracle"].as_table())
            {
                TableReader r(*oracle, "oracle");
                r.read("endpoint", cfg.oracle.endpoint);
                r.read_ms("call_timeout_ms", cfg.oracle.client.call_timeout);
                r.read_ms("poll_interval_ms", cfg.oracle.client.poll_interval);
                r.read_ms("ceiling_ms", cfg.oracle.client.ceiling);
                r.read_ms("staleness_window_ms", cfg.oracle.client.staleness_window);
                r.read_backoff(cfg.oracle.client.backoff);
                if (r.error)
                    return std::unexpected(*r.error);

                if (auto keys = (*oracle)["keys"].as_array())
                {
                    std::size_t index = 0;
                    for (const auto &node : *keys)
                    {
                        auto key_tbl = node.as_table();
                        if (!key_tbl)
                        {
                            return std::unexpected(ProoflineError::config("Entries of [[oracle.keys]] must be tables")
                                                       .on_field(std::format("oracle.keys[{}]", index)));
                        }
                        OracleKeyConfig key;
                        TableReader kr(*key_tbl, std::format("oracle.keys[{}]", index));
                        kr.require("key_id", key.key_id);
                        kr.require("public_key", key.public_key);
                        kr.read("authority", key.authority);
                        kr.read("description", key.description);
                        if (kr.error)
                            return std::unexpected(*kr.error);
                        cfg.oracle.keys.push_back(std::move(key));
                        ++index;
                    }
                }
            }

            if (auto tracker = tbl["tracker"].as_table())
            {
                TableReader r(*tracker, "tracker");
                if (tracker->get("quorum"))
                {
                    std::size_t quorum = 0;
                    r.read_count("quorum", quorum);
                    cfg.tracker.quorum = quorum;
                }
                r.read_ms("ceiling_ms", cfg.tracker.ceiling);
                if (r.error)
                    return std::unexpected(*r.error);
            }

            if (auto ledgers = tbl["ledgers"].as_array())
            {
                std::size_t index = 0;
                for (const auto &node : *ledgers)
                {
                    auto ledger_tbl = node.as_table();
                    if (!ledger_tbl)
                    {
                        return std::unexpected(ProoflineError::config("Entries of [[ledgers]] must be tables")
                                                   .on_field(std::format("ledgers[{}]", index)));
                    }
                    LedgerConfig ledger;
                    TableReader r(*ledger_tbl, std::format("ledgers[{}]", index));
                    r.require("chain_id", ledger.policy.chain_id);
                    r.require("endpoint", ledger.endpoint);
                    r.read_u64("required_depth", ledger.policy.required_depth);
                    r.read_ms("not_found_grace_ms", ledger.policy.not_found_grace);
                    r.read_ms("poll_interval_ms", ledger.policy.poll_interval);
                    r.read_ms("call_timeout_ms", ledger.policy.call_timeout);
                    r.read_backoff(ledger.policy.backoff);
                    if (r.error)
                        return std::unexpected(*r.error);
                    cfg.ledgers.push_back(std::move(ledger));
                    ++index;
                }
            }

            if (auto storage = tbl["storage"].as_table())
            {
                TableReader r(*storage, "storage");
                r.read("backend", cfg.storage.backend);
                r.read("path", cfg.storage.path);
                if (r.error)
                    return std::unexpected(*r.error);
            }

            if (auto logging = tbl["logging"].as_table())
            {
                TableReader r(*logging, "logging");
                r.read("level", cfg.logging.level);
                r.read("pattern", cfg.logging.pattern);
                if (logging->get("audit_log"))
                {
                    std::string audit_log;
                    r.read("audit_log", audit_log);
                    cfg.logging.audit_log = audit_log;
                }
                if (r.error)
                    return std::unexpected(*r.error);
            }

            return {};
        }

        Result<int64_t> env_integer(const char *name, const char *value)
        {
            std::string_view text(value);
            int64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec != std::errc() || ptr != text.data() + text.size() || parsed < 0)
            {
                return std::unexpected(ProoflineError::config(
                                           std::format("Environment variable {} must be a non-negative integer, got '{}'", name, text))
                                           .on_field(name));
            }
            return parsed;
        }
    } // namespace

    Result<EngineConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ProoflineError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<EngineConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        EngineConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            if (auto parsed = parse_toml(tbl, cfg); !parsed)
                return std::unexpected(parsed.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ProoflineError::config(std::format("Failed to parse TOML: {}", e.description())));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(EngineConfig &cfg)
    {
        if (const char *endpoint = std::getenv("PROOFLINE_ORACLE_ENDPOINT"))
            cfg.oracle.endpoint = endpoint;
        if (const char *window = std::getenv("PROOFLINE_STALENESS_WINDOW_MS"))
        {
            auto ms = env_integer("PROOFLINE_STALENESS_WINDOW_MS", window);
            if (!ms)
                return std::unexpected(ms.error());
            cfg.oracle.client.staleness_window = std::chrono::milliseconds(*ms);
        }
        if (const char *quorum = std::getenv("PROOFLINE_QUORUM"))
        {
            auto k = env_integer("PROOFLINE_QUORUM", quorum);
            if (!k)
                return std::unexpected(k.error());
            cfg.tracker.quorum = static_cast<std::size_t>(*k);
        }
        if (const char *backend = std::getenv("PROOFLINE_STORAGE_BACKEND"))
            cfg.storage.backend = backend;
        if (const char *path = std::getenv("PROOFLINE_STORAGE_PATH"))
            cfg.storage.path = path;
        if (const char *level = std::getenv("PROOFLINE_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit = std::getenv("PROOFLINE_AUDIT_LOG"))
            cfg.logging.audit_log = audit;
        return {};
    }

    Result<void> ConfigLoader::validate(const EngineConfig &cfg)
    {
        std::set<std::string> chain_ids;
        for (std::size_t i = 0; i < cfg.ledgers.size(); ++i)
        {
            const auto &ledger = cfg.ledgers[i];
            if (ledger.policy.chain_id.empty())
            {
                return std::unexpected(ProoflineError::config("Ledger chain_id must not be empty")
                                           .on_field(std::format("ledgers[{}].chain_id", i)));
            }
            if (!chain_ids.insert(ledger.policy.chain_id).second)
            {
                return std::unexpected(ProoflineError::config(std::format("Duplicate ledger chain_id '{}'", ledger.policy.chain_id))
                                           .on_field(std::format("ledgers[{}].chain_id", i)));
            }
            if (ledger.policy.required_depth == 0)
            {
                return std::unexpected(ProoflineError::config("required_depth must be at least 1")
                                           .on_field(std::format("ledgers[{}].required_depth", i)));
            }
        }

        if (!cfg.ledgers.empty())
        {
            auto quorum = QuorumPolicy::make(cfg.ledgers.size(), cfg.tracker.quorum);
            if (!quorum)
                return std::unexpected(quorum.error());
        }
        else if (cfg.tracker.quorum)
        {
            return std::unexpected(ProoflineError::config("tracker.quorum is set but no ledgers are configured")
                                       .on_field("tracker.quorum"));
        }

        std::set<std::string> key_ids;
        for (const auto &key : cfg.oracle.keys)
        {
            if (!key_ids.insert(key.key_id).second)
            {
                return std::unexpected(ProoflineError::config(std::format("Duplicate oracle key_id '{}'", key.key_id))
                                           .on_field("oracle.keys"));
            }
        }

        if (cfg.storage.backend != "file" && cfg.storage.backend != "rocksdb")
        {
            return std::unexpected(ProoflineError::config(std::format("Unknown storage backend '{}'", cfg.storage.backend))
                                       .on_field("storage.backend"));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const EngineConfig &cfg)
    {
        auto backoff_json = [](const BackoffPolicy &b) {
            return nlohmann::json{
                {"backoff_initial_ms", b.initial.count()},
                {"backoff_max_ms", b.max.count()},
                {"backoff_multiplier", b.multiplier},
                {"max_attempts", b.max_attempts}};
        };

        nlohmann::json j;
        nlohmann::json keys = nlohmann::json::array();
        for (const auto &key : cfg.oracle.keys)
        {
            keys.push_back({{"key_id", key.key_id},
                            {"public_key", key.public_key},
                            {"authority", key.authority},
                            {"description", key.description}});
        }
        j["oracle"] = {
            {"endpoint", cfg.oracle.endpoint},
            {"call_timeout_ms", cfg.oracle.client.call_timeout.count()},
            {"poll_interval_ms", cfg.oracle.client.poll_interval.count()},
            {"ceiling_ms", cfg.oracle.client.ceiling.count()},
            {"staleness_window_ms", cfg.oracle.client.staleness_window.count()},
            {"backoff", backoff_json(cfg.oracle.client.backoff)},
            {"keys", keys}};

        j["tracker"] = {{"ceiling_ms", cfg.tracker.ceiling.count()}};
        if (cfg.tracker.quorum)
            j["tracker"]["quorum"] = *cfg.tracker.quorum;
        else if (!cfg.ledgers.empty())
            j["tracker"]["quorum"] = QuorumPolicy::majority(cfg.ledgers.size());

        nlohmann::json ledgers = nlohmann::json::array();
        for (const auto &ledger : cfg.ledgers)
        {
            ledgers.push_back({{"chain_id", ledger.policy.chain_id},
                               {"endpoint", ledger.endpoint},
                               {"required_depth", ledger.policy.required_depth},
                               {"not_found_grace_ms", ledger.policy.not_found_grace.count()},
                               {"poll_interval_ms", ledger.policy.poll_interval.count()},
                               {"call_timeout_ms", ledger.policy.call_timeout.count()},
                               {"backoff", backoff_json(ledger.policy.backoff)}});
        }
        j["ledgers"] = ledgers;
        j["storage"] = {{"backend", cfg.storage.backend}, {"path", cfg.storage.path}};
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        if (cfg.logging.audit_log)
            j["logging"]["audit_log"] = *cfg.logging.audit_log;
        return j;
    }

} // namespace proofline
