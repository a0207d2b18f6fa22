#include "proofline/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>
#include <format>
#include <stdexcept>

using json = nlohmann::json;

namespace proofline::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(ProoflineError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const std::array<uint8_t, 32> &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(ProoflineError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    std::string Ed25519KeyPair::public_key_b64() const
    {
        return Base64::encode(Bytes(public_key.begin(), public_key.end()));
    }

    std::string Ed25519KeyPair::to_json() const
    {
        json j = {
            {"public_key", public_key_b64()},
            {"secret_key", Base64::encode(Bytes(secret_key.begin(), secret_key.end()))}};
        return j.dump(2);
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.resize(hash.size() * 2);
        return hex;
    }

    Result<SHA256Hash> SHA256::from_hex(const std::string &hex)
    {
        if (hex.size() != 64)
        {
            return std::unexpected(ProoflineError::validation(
                std::format("Invalid SHA-256 hex length: {} (expected 64)", hex.size())));
        }

        SHA256Hash hash;
        size_t bin_len = 0;
        const char *end = nullptr;
        if (sodium_hex2bin(hash.data(), hash.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) != 0 ||
            bin_len != hash.size() || end != hex.data() + hex.size())
        {
            return std::unexpected(ProoflineError::validation("Invalid hex character in SHA-256 digest"));
        }
        return hash;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(ProoflineError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    Result<Ed25519PublicKey> decode_public_key(const std::string &public_key_b64)
    {
        auto bytes = Base64::decode(public_key_b64);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (bytes->size() != crypto_sign_PUBLICKEYBYTES)
        {
            return std::unexpected(ProoflineError::crypto(
                std::format("Invalid public key length: {} (expected 32 bytes)", bytes->size())));
        }
        Ed25519PublicKey key{};
        std::copy(bytes->begin(), bytes->end(), key.begin());
        return key;
    }

    Result<Ed25519Signature> decode_signature(const std::string &signature_b64)
    {
        auto bytes = Base64::decode(signature_b64);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (bytes->size() != crypto_sign_BYTES)
        {
            return std::unexpected(ProoflineError::crypto(
                std::format("Invalid signature length: {} (expected 64 bytes)", bytes->size())));
        }
        Ed25519Signature sig{};
        std::copy(bytes->begin(), bytes->end(), sig.begin());
        return sig;
    }

} // namespace proofline::crypto
