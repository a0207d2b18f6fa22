#pragma once

#include "clock.hpp"
#include "digest.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <format>
#include <string>

namespace proofline::json
{

    /**
     * Typed field accessors for boundary parsing. Each failure is a
     * ValidationError whose `field` names the offending key.
     */

    inline Result<const nlohmann::json *> require_field(const nlohmann::json &j, const std::string &key)
    {
        if (!j.is_object())
        {
            return std::unexpected(ProoflineError::validation(
                                       std::format("Expected object while reading '{}'", key))
                                       .on_field(key));
        }
        auto it = j.find(key);
        if (it == j.end())
        {
            return std::unexpected(ProoflineError::validation(std::format("Missing field '{}'", key))
                                       .on_field(key));
        }
        return &*it;
    }

    inline Result<std::string> require_string(const nlohmann::json &j, const std::string &key)
    {
        auto field = require_field(j, key);
        if (!field)
            return std::unexpected(field.error());
        if (!(*field)->is_string())
        {
            return std::unexpected(ProoflineError::validation(std::format("Field '{}' must be a string", key))
                                       .on_field(key));
        }
        return (*field)->get<std::string>();
    }

    inline Result<uint64_t> require_u64(const nlohmann::json &j, const std::string &key)
    {
        auto field = require_field(j, key);
        if (!field)
            return std::unexpected(field.error());
        if (!(*field)->is_number_unsigned())
        {
            return std::unexpected(ProoflineError::validation(
                                       std::format("Field '{}' must be a non-negative integer", key))
                                       .on_field(key));
        }
        return (*field)->get<uint64_t>();
    }

    inline Result<bool> require_bool(const nlohmann::json &j, const std::string &key)
    {
        auto field = require_field(j, key);
        if (!field)
            return std::unexpected(field.error());
        if (!(*field)->is_boolean())
        {
            return std::unexpected(ProoflineError::validation(std::format("Field '{}' must be a boolean", key))
                                       .on_field(key));
        }
        return (*field)->get<bool>();
    }

    inline Result<Digest> require_digest(const nlohmann::json &j, const std::string &key)
    {
        auto hex = require_string(j, key);
        if (!hex)
            return std::unexpected(hex.error());
        auto digest = Digest::from_hex(*hex);
        if (!digest)
            return std::unexpected(digest.error().on_field(key));
        return digest;
    }

    inline Result<Timestamp> require_timestamp(const nlohmann::json &j, const std::string &key)
    {
        auto text = require_string(j, key);
        if (!text)
            return std::unexpected(text.error());
        auto ts = parse_timestamp(*text);
        if (!ts)
            return std::unexpected(ts.error().on_field(key));
        return ts;
    }

} // namespace proofline::json
