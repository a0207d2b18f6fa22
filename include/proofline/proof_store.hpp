#pragma once

#include "config.hpp"
#include "digest.hpp"
#include "proof_artifact.hpp"
#include "types.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace proofline
{

    /**
     * Abstract interface for proof artifact storage backends, keyed by
     * document id. A later artifact for the same document replaces the
     * earlier one.
     */
    class ProofStore
    {
    public:
        virtual ~ProofStore() = default;

        virtual Result<void> put(const ProofArtifact &artifact) = 0;

        /** NotFound when absent; IntegrityFault when the stored bytes fail their checksum */
        virtual Result<ProofArtifact> get(const Digest &document_id) = 0;

        virtual Result<std::vector<Digest>> list() = 0;
    };

    /**
     * One canonical JSON file per document id under a directory.
     */
    class FileProofStore : public ProofStore
    {
    public:
        explicit FileProofStore(std::filesystem::path root);

        Result<void> put(const ProofArtifact &artifact) override;
        Result<ProofArtifact> get(const Digest &document_id) override;
        Result<std::vector<Digest>> list() override;

    private:
        std::filesystem::path path_for(const Digest &document_id) const;

        std::filesystem::path root_;
    };

#ifdef PROOFLINE_HAVE_ROCKSDB
    /**
     * RocksDB-backed ProofStore: key is the document id hex, value the
     * canonical JSON of the artifact.
     */
    class RocksDbProofStore : public ProofStore
    {
    public:
        static Result<std::unique_ptr<RocksDbProofStore>> open(const std::string &path);
        ~RocksDbProofStore() override;

        Result<void> put(const ProofArtifact &artifact) override;
        Result<ProofArtifact> get(const Digest &document_id) override;
        Result<std::vector<Digest>> list() override;

    private:
        class Impl;
        explicit RocksDbProofStore(std::unique_ptr<Impl> impl);
        std::unique_ptr<Impl> impl_;
    };
#endif

    /** Backend selected by `cfg.backend`; "rocksdb" is a ConfigError in builds without RocksDB */
    Result<std::unique_ptr<ProofStore>> open_proof_store(const StorageConfig &cfg);

} // namespace proofline
