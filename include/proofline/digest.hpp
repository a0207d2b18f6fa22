#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace proofline
{

    enum class DigestAlgorithm
    {
        SHA256
    };

    std::string digest_algorithm_to_string(DigestAlgorithm algorithm);
    Result<DigestAlgorithm> digest_algorithm_from_string(const std::string &s);

    /**
     * 256-bit digest tagged with the algorithm that produced it.
     * Rendered as 64 lowercase hex characters wherever it is serialized.
     */
    struct Digest
    {
        DigestAlgorithm algorithm{DigestAlgorithm::SHA256};
        crypto::SHA256Hash bytes{};

        std::string to_hex() const;

        /** Strict parse: exactly 64 lowercase hex characters */
        static Result<Digest> from_hex(const std::string &hex);

        bool operator==(const Digest &other) const = default;
    };

    /** The three digests identifying one (content, metadata) pair */
    struct DocumentIdentity
    {
        Digest content_digest;
        Digest metadata_digest;
        Digest document_id;
    };

    /**
     * Content and metadata hashing.
     *
     * The document id is SHA-256 over the raw bytes of the content digest
     * followed by the raw bytes of the metadata digest. That order is fixed;
     * swapping it changes every id ever issued.
     */
    class Hasher
    {
    public:
        static Digest hash(const crypto::Bytes &data);

        static Digest hash(const std::string &data);

        /** Digest of the canonical serialization of `metadata` */
        static Result<Digest> hash_metadata(const nlohmann::json &metadata);

        static Digest assemble_document_id(const Digest &content_digest, const Digest &metadata_digest);

        /**
         * Compute all three digests twice and compare. Any difference between
         * the two passes is an IntegrityFault: it means canonicalization is not
         * a pure function and nothing derived from it can be trusted.
         */
        static Result<DocumentIdentity> derive_identity(const crypto::Bytes &content, const nlohmann::json &metadata);
    };

} // namespace proofline
