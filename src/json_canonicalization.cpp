#include "proofline/json_canonicalization.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace proofline::json
{

    namespace
    {
        std::string child_path(const std::string &parent, const std::string &key)
        {
            return std::format("{}.{}", parent, key);
        }

        std::string index_path(const std::string &parent, std::size_t index)
        {
            return std::format("{}[{}]", parent, index);
        }

        std::vector<const std::string *> sorted_keys(const nlohmann::json &obj)
        {
            std::vector<const std::string *> keys;
            keys.reserve(obj.size());
            for (auto it = obj.begin(); it != obj.end(); ++it)
                keys.push_back(&it.key());
            std::sort(keys.begin(), keys.end(), [](const std::string *a, const std::string *b) { return *a < *b; });
            return keys;
        }
    } // namespace

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output, "$"); !res)
            return std::unexpected(res.error());
        return output;
    }

    Result<std::vector<uint8_t>> RFC8785Canonicalizer::canonical_bytes(const nlohmann::json &value)
    {
        auto canonical = canonicalize(value);
        if (!canonical)
            return std::unexpected(canonical.error());
        return std::vector<uint8_t>(canonical->begin(), canonical->end());
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        nlohmann::json parsed;
        try
        {
            parsed = nlohmann::json::parse(json_str);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ProoflineError::invalid_input(
                std::format("JSON parse error: {}", e.what())));
        }
        return canonicalize(parsed);
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output, const std::string &path)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return serialize_number(value, output, path);

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output, path);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output, path);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output, path);

        case nlohmann::json::value_t::binary:
            return std::unexpected(ProoflineError::validation(
                                       std::format("Binary value at {} has no canonical JSON form", path))
                                       .on_field(path));

        case nlohmann::json::value_t::discarded:
            break;
        }
        return std::unexpected(ProoflineError::validation(
                                   std::format("Discarded value at {} cannot be serialized", path))
                                   .on_field(path));
    }

    Result<void> RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output, const std::string &path)
    {
        if (!is_valid_utf8(str))
        {
            return std::unexpected(ProoflineError::validation(
                                       std::format("String at {} is not valid UTF-8", path))
                                       .on_field(path));
        }
        output += '"';
        output += escape_string(str);
        output += '"';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_number(const nlohmann::json &num, std::string &output, const std::string &path)
    {
        if (num.is_number_unsigned())
        {
            output += std::to_string(num.get<uint64_t>());
            return {};
        }
        if (num.is_number_integer())
        {
            output += std::to_string(num.get<int64_t>());
            return {};
        }

        double value = num.get<double>();
        if (std::isnan(value) || std::isinf(value))
        {
            return std::unexpected(ProoflineError::validation(
                                       std::format("Non-finite number at {} has no canonical JSON form", path))
                                       .on_field(path));
        }
        output += format_double(value);
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output, const std::string &path)
    {
        output += '{';

        // Sort keys lexicographically (UTF-8 byte order)
        auto keys = sorted_keys(obj);

        bool first = true;
        for (const auto *key : keys)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;

            auto key_path = child_path(path, *key);
            if (auto res = serialize_string(*key, output, key_path); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(obj.at(*key), output, key_path); !res)
                return res;
        }

        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output, const std::string &path)
    {
        output += '[';

        std::size_t index = 0;
        for (const auto &item : arr)
        {
            if (index > 0)
            {
                output += ',';
            }
            if (auto res = serialize_value(item, output, index_path(path, index)); !res)
                return res;
            ++index;
        }

        output += ']';
        return {};
    }

    std::string RFC8785Canonicalizer::escape_string(const std::string &str)
    {
        std::string escaped;
        escaped.reserve(str.size());

        for (unsigned char ch : str)
        {
            // Must escape: " (0x22), \ (0x5C), and control characters (0x00-0x1F)
            switch (ch)
            {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\b':
                escaped += "\\b";
                break;
            case '\f':
                escaped += "\\f";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    escaped += std::format("\\u{:04x}", static_cast<int>(ch));
                }
                else
                {
                    escaped += static_cast<char>(ch);
                }
                break;
            }
        }

        return escaped;
    }

    bool is_valid_utf8(const std::string &str)
    {
        const auto *bytes = reinterpret_cast<const unsigned char *>(str.data());
        std::size_t i = 0;
        const std::size_t n = str.size();

        while (i < n)
        {
            unsigned char c = bytes[i];
            std::size_t len = 0;
            uint32_t cp = 0;

            if (c < 0x80)
            {
                ++i;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                len = 2;
                cp = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                len = 3;
                cp = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                len = 4;
                cp = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + len > n)
                return false;

            for (std::size_t k = 1; k < len; ++k)
            {
                unsigned char cc = bytes[i + k];
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            // Overlong encodings, surrogates and out-of-range code points
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp >= 0xD800 && cp <= 0xDFFF)
                return false;
            if (cp > 0x10FFFF)
                return false;

            i += len;
        }
        return true;
    }

    std::string format_double(double value)
    {
        if (value == 0.0)
            return "0"; // covers -0.0 as well

        // Shortest round-trip digits in scientific form, e.g. "-1.2345e-07"
        std::array<char, 64> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::scientific);
        std::string sci(buf.data(), end);

        std::string out;
        std::size_t pos = 0;
        if (sci[0] == '-')
        {
            out += '-';
            pos = 1;
        }

        auto e_pos = sci.find('e');
        std::string digits;
        for (std::size_t i = pos; i < e_pos; ++i)
        {
            if (sci[i] != '.')
                digits += sci[i];
        }
        while (digits.size() > 1 && digits.back() == '0')
            digits.pop_back();

        int exponent = std::stoi(sci.substr(e_pos + 1));
        const int k = static_cast<int>(digits.size());
        const int n = exponent + 1;

        if (k <= n && n <= 21)
        {
            out += digits;
            out.append(static_cast<std::size_t>(n - k), '0');
        }
        else if (0 < n && n <= 21)
        {
            out += digits.substr(0, static_cast<std::size_t>(n));
            out += '.';
            out += digits.substr(static_cast<std::size_t>(n));
        }
        else if (-6 < n && n <= 0)
        {
            out += "0.";
            out.append(static_cast<std::size_t>(-n), '0');
            out += digits;
        }
        else
        {
            out += digits[0];
            if (k > 1)
            {
                out += '.';
                out += digits.substr(1);
            }
            out += 'e';
            out += (n - 1) >= 0 ? '+' : '-';
            out += std::to_string(std::abs(n - 1));
        }
        return out;
    }

} // namespace proofline::json
