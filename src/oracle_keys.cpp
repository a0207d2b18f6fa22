#include "proofline/oracle_keys.hpp"
#include <format>
#include <mutex>
#include <shared_mutex>

namespace proofline
{

    Result<void> OracleKeyRing::add_key(
        std::string key_id,
        std::string public_key,
        std::string authority,
        std::string description)
    {
        if (key_id.empty())
        {
            return std::unexpected(ProoflineError::invalid_input("Oracle key id is empty").on_field("key_id"));
        }

        auto decoded = crypto::decode_public_key(public_key);
        if (!decoded)
        {
            return std::unexpected(decoded.error().on_field("public_key"));
        }

        std::unique_lock lock(mutex_);
        if (keys_.contains(key_id))
        {
            return std::unexpected(ProoflineError::invalid_input(
                std::format("Oracle key '{}' already registered", key_id)));
        }

        OracleKey key{key_id, std::move(public_key), std::move(authority), std::move(description), true};
        keys_.emplace(std::move(key_id), std::move(key));
        return {};
    }

    Result<void> OracleKeyRing::revoke_key(std::string_view key_id)
    {
        std::unique_lock lock(mutex_);
        auto it = keys_.find(std::string(key_id));
        if (it == keys_.end())
        {
            return std::unexpected(ProoflineError::not_found(std::format("Oracle key '{}' not found", key_id)));
        }
        it->second.is_active = false;
        return {};
    }

    std::optional<OracleKey> OracleKeyRing::get_key(std::string_view key_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = keys_.find(std::string(key_id));
        if (it == keys_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<OracleKey> OracleKeyRing::list_active_keys() const
    {
        std::vector<OracleKey> out;
        std::shared_lock lock(mutex_);
        for (const auto &[_, key] : keys_)
        {
            if (key.is_active)
                out.push_back(key);
        }
        return out;
    }

    bool OracleKeyRing::is_authorized(std::string_view key_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = keys_.find(std::string(key_id));
        if (it == keys_.end())
            return false;
        return it->second.is_active;
    }

    Result<bool> OracleKeyRing::verify(
        std::string_view key_id,
        const crypto::Bytes &message,
        std::string_view signature_base64) const
    {
        auto key = get_key(key_id);
        if (!key || !key->is_active)
            return false;

        if (signature_base64.empty())
            return false;

        auto pub = crypto::decode_public_key(key->public_key);
        if (!pub)
            return std::unexpected(pub.error());

        auto sig = crypto::decode_signature(std::string(signature_base64));
        if (!sig)
            return std::unexpected(sig.error().on_field("signature"));

        return crypto::Ed25519KeyPair::verify(message, *sig, *pub);
    }

    std::size_t OracleKeyRing::size() const
    {
        std::shared_lock lock(mutex_);
        return keys_.size();
    }

} // namespace proofline
