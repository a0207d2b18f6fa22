#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace proofline::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * Ed25519 key pair for signing and verification (libsodium)
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Derive key pair from seed bytes (32 bytes)
         */
        static Result<Ed25519KeyPair> from_seed(const std::array<uint8_t, 32> &seed);

        /**
         * Sign a message, returns 64-byte signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify signature against message
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /** Base64 public key, the form stored in oracle key configuration */
        std::string public_key_b64() const;

        /** Key file written by `proofline keygen`: base64 public and secret halves */
        std::string to_json() const;
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);

        /**
         * Parse hash from hex string (exactly 64 hex characters)
         */
        static Result<SHA256Hash> from_hex(const std::string &hex);
    };

    /**
     * Base64 encoding/decoding (standard alphabet, padded)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Decode a base64 Ed25519 public key, checking its length
     */
    Result<Ed25519PublicKey> decode_public_key(const std::string &public_key_b64);

    /**
     * Decode a base64 Ed25519 signature, checking its length
     */
    Result<Ed25519Signature> decode_signature(const std::string &signature_b64);

} // namespace proofline::crypto
