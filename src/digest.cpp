#include "proofline/digest.hpp"
#include "proofline/json_canonicalization.hpp"
#include <algorithm>
#include <format>

namespace proofline
{

    std::string digest_algorithm_to_string(DigestAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case DigestAlgorithm::SHA256:
            return "sha256";
        }
        return "unknown";
    }

    Result<DigestAlgorithm> digest_algorithm_from_string(const std::string &s)
    {
        if (s == "sha256")
            return DigestAlgorithm::SHA256;
        return std::unexpected(ProoflineError::validation(std::format("Unsupported digest algorithm: {}", s))
                                   .on_field("hash_algorithm"));
    }

    std::string Digest::to_hex() const
    {
        return crypto::SHA256::to_hex(bytes);
    }

    Result<Digest> Digest::from_hex(const std::string &hex)
    {
        bool lowercase = std::all_of(hex.begin(), hex.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
        if (!lowercase)
        {
            return std::unexpected(ProoflineError::validation(
                std::format("Digest '{}' is not lowercase hex", hex)));
        }

        auto parsed = crypto::SHA256::from_hex(hex);
        if (!parsed)
            return std::unexpected(parsed.error());
        return Digest{DigestAlgorithm::SHA256, *parsed};
    }

    Digest Hasher::hash(const crypto::Bytes &data)
    {
        return Digest{DigestAlgorithm::SHA256, crypto::SHA256::hash(data)};
    }

    Digest Hasher::hash(const std::string &data)
    {
        return Digest{DigestAlgorithm::SHA256, crypto::SHA256::hash(data)};
    }

    Result<Digest> Hasher::hash_metadata(const nlohmann::json &metadata)
    {
        auto canonical = json::RFC8785Canonicalizer::canonical_bytes(metadata);
        if (!canonical)
            return std::unexpected(canonical.error().at_stage("canonicalize"));
        return hash(*canonical);
    }

    Digest Hasher::assemble_document_id(const Digest &content_digest, const Digest &metadata_digest)
    {
        crypto::Bytes concatenated;
        concatenated.reserve(content_digest.bytes.size() + metadata_digest.bytes.size());
        concatenated.insert(concatenated.end(), content_digest.bytes.begin(), content_digest.bytes.end());
        concatenated.insert(concatenated.end(), metadata_digest.bytes.begin(), metadata_digest.bytes.end());
        return hash(concatenated);
    }

    Result<DocumentIdentity> Hasher::derive_identity(const crypto::Bytes &content, const nlohmann::json &metadata)
    {
        auto compute = [&]() -> Result<DocumentIdentity> {
            auto metadata_digest = hash_metadata(metadata);
            if (!metadata_digest)
                return std::unexpected(metadata_digest.error());
            auto content_digest = hash(content);
            return DocumentIdentity{content_digest, *metadata_digest,
                                    assemble_document_id(content_digest, *metadata_digest)};
        };

        auto first = compute();
        if (!first)
            return first;
        auto second = compute();
        if (!second)
            return second;

        if (first->content_digest != second->content_digest)
        {
            return std::unexpected(ProoflineError::integrity("Content digest changed between two passes")
                                       .at_stage("hash")
                                       .on_field("content_digest")
                                       .compared(first->content_digest.to_hex(), second->content_digest.to_hex()));
        }
        if (first->metadata_digest != second->metadata_digest)
        {
            return std::unexpected(ProoflineError::integrity("Metadata digest changed between two passes; canonicalization is not deterministic")
                                       .at_stage("canonicalize")
                                       .on_field("metadata_digest")
                                       .compared(first->metadata_digest.to_hex(), second->metadata_digest.to_hex()));
        }
        if (first->document_id != second->document_id)
        {
            return std::unexpected(ProoflineError::integrity("Document id changed between two passes")
                                       .at_stage("hash")
                                       .on_field("document_id")
                                       .compared(first->document_id.to_hex(), second->document_id.to_hex()));
        }
        return first;
    }

} // namespace proofline
