#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace proofline
{

    struct OracleKey
    {
        std::string key_id;
        std::string public_key; // base64 Ed25519 public key
        std::string authority;
        std::string description;
        bool is_active{true};
    };

    /**
     * Registry of oracle keys whose signatures the engine accepts.
     * Owned by the caller and passed by reference; safe for concurrent readers.
     */
    class OracleKeyRing
    {
    public:
        OracleKeyRing() = default;

        Result<void> add_key(
            std::string key_id,
            std::string public_key,
            std::string authority,
            std::string description);

        /** Mark a key inactive; reports it signed are rejected from then on */
        Result<void> revoke_key(std::string_view key_id);

        std::optional<OracleKey> get_key(std::string_view key_id) const;

        std::vector<OracleKey> list_active_keys() const;

        bool is_authorized(std::string_view key_id) const;

        /**
         * Check `signature_base64` over `message` with the key `key_id`.
         * Unknown or revoked keys yield false; malformed encodings yield an error.
         */
        Result<bool> verify(
            std::string_view key_id,
            const crypto::Bytes &message,
            std::string_view signature_base64) const;

        std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, OracleKey> keys_;
    };

} // namespace proofline
