#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace proofline::json
{

    /**
     * Deterministic JSON serialization used for every digest and signature.
     *
     * Follows RFC 8785 (JCS) with one deviation: object keys are ordered by
     * their raw UTF-8 bytes rather than UTF-16 code units.
     *
     * - Object keys sorted lexicographically, recursively
     * - No insignificant whitespace
     * - Strings emitted as UTF-8 with minimal escaping
     * - Numbers in ECMAScript shortest round-trip form
     *
     * Values that have no canonical form (NaN, Infinity, binary blobs,
     * invalid UTF-8) are rejected with a ValidationError naming the JSON
     * path; nothing is silently dropped or replaced.
     */
    class RFC8785Canonicalizer
    {
    public:
        /**
         * Canonicalize a JSON value
         * @param value JSON value to canonicalize
         * @return Canonical JSON string or ValidationError
         */
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /**
         * Canonicalize and return the UTF-8 bytes, ready for hashing
         */
        static Result<std::vector<uint8_t>> canonical_bytes(const nlohmann::json &value);

        /**
         * Parse JSON text and canonicalize
         * @param json_str Input JSON string
         * @return Canonical JSON string or error
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output, const std::string &path);

        static Result<void> serialize_string(const std::string &str, std::string &output, const std::string &path);

        static Result<void> serialize_number(const nlohmann::json &num, std::string &output, const std::string &path);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output, const std::string &path);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output, const std::string &path);

        static std::string escape_string(const std::string &str);
    };

    /** True when `str` is well-formed UTF-8 (no overlongs, no surrogates) */
    bool is_valid_utf8(const std::string &str);

    /** ECMAScript Number::toString rendering of a finite double */
    std::string format_double(double value);

} // namespace proofline::json
