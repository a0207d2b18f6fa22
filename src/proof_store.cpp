#include "proofline/proof_store.hpp"
#include "proofline/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#ifdef PROOFLINE_HAVE_ROCKSDB
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#endif

namespace proofline
{

    namespace
    {
        Result<std::string> encode(const ProofArtifact &artifact)
        {
            auto text = json::RFC8785Canonicalizer::canonicalize(artifact.to_json());
            if (!text)
                return std::unexpected(text.error().at_stage("store"));
            return text;
        }

        Result<ProofArtifact> decode(const std::string &text, const std::string &origin)
        {
            auto artifact = ProofArtifact::parse(text);
            if (!artifact)
            {
                return std::unexpected(ProoflineError::storage(
                                           std::format("Stored artifact {} is unreadable: {}", origin, artifact.error().describe()))
                                           .at_stage("store"));
            }
            if (auto checksum = artifact->verify_checksum(); !checksum)
            {
                spdlog::error("stored artifact {} fails its checksum", origin);
                return std::unexpected(checksum.error().at_stage("store"));
            }
            return artifact;
        }
    } // namespace

    // ============================================================================
    // FileProofStore
    // ============================================================================

    FileProofStore::FileProofStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path FileProofStore::path_for(const Digest &document_id) const
    {
        return root_ / (document_id.to_hex() + ".json");
    }

    Result<void> FileProofStore::put(const ProofArtifact &artifact)
    {
        auto text = encode(artifact);
        if (!text)
            return std::unexpected(text.error());

        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            return std::unexpected(ProoflineError::storage(
                std::format("Cannot create proof directory {}: {}", root_.string(), ec.message())));
        }

        const auto target = path_for(artifact.document_id);
        auto staging = target;
        staging += ".tmp";
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out)
                return std::unexpected(ProoflineError::storage("Cannot write " + staging.string()));
            out << *text;
            out.flush();
            if (!out)
                return std::unexpected(ProoflineError::storage("Short write to " + staging.string()));
        }

        std::filesystem::rename(staging, target, ec);
        if (ec)
        {
            return std::unexpected(ProoflineError::storage(
                std::format("Cannot move {} into place: {}", staging.string(), ec.message())));
        }
        spdlog::debug("stored proof {} at {}", artifact.document_id.to_hex(), target.string());
        return {};
    }

    Result<ProofArtifact> FileProofStore::get(const Digest &document_id)
    {
        const auto path = path_for(document_id);
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return std::unexpected(ProoflineError::not_found("No proof stored for document " + document_id.to_hex()));
        std::stringstream buffer;
        buffer << in.rdbuf();
        return decode(buffer.str(), path.string());
    }

    Result<std::vector<Digest>> FileProofStore::list()
    {
        std::vector<Digest> out;
        std::error_code ec;
        if (!std::filesystem::exists(root_, ec))
            return out;

        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
                continue;
            auto id = Digest::from_hex(entry.path().stem().string());
            if (!id)
            {
                spdlog::warn("ignoring foreign file {} in proof directory", entry.path().string());
                continue;
            }
            out.push_back(*id);
        }
        if (ec)
            return std::unexpected(ProoflineError::storage(std::format("Cannot list {}: {}", root_.string(), ec.message())));

        std::sort(out.begin(), out.end(), [](const Digest &a, const Digest &b) { return a.bytes < b.bytes; });
        return out;
    }

    // ============================================================================
    // RocksDbProofStore
    // ============================================================================

#ifdef PROOFLINE_HAVE_ROCKSDB
    class RocksDbProofStore::Impl
    {
    public:
        explicit Impl(rocksdb::DB *db) : db(db) {}

        ~Impl()
        {
            delete db;
        }

        rocksdb::DB *db{nullptr};
    };

    Result<std::unique_ptr<RocksDbProofStore>> RocksDbProofStore::open(const std::string &path)
    {
        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::DB *db = nullptr;
        auto status = rocksdb::DB::Open(options, path, &db);
        if (!status.ok())
        {
            return std::unexpected(ProoflineError::storage("RocksDB open failed: " + status.ToString()));
        }
        return std::unique_ptr<RocksDbProofStore>(new RocksDbProofStore(std::make_unique<Impl>(db)));
    }

    RocksDbProofStore::RocksDbProofStore(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
    RocksDbProofStore::~RocksDbProofStore() = default;

    Result<void> RocksDbProofStore::put(const ProofArtifact &artifact)
    {
        auto text = encode(artifact);
        if (!text)
            return std::unexpected(text.error());

        rocksdb::WriteOptions options;
        options.sync = true;
        auto status = impl_->db->Put(options, artifact.document_id.to_hex(), *text);
        if (!status.ok())
        {
            return std::unexpected(ProoflineError::storage("RocksDB Put failed: " + status.ToString()));
        }
        return {};
    }

    Result<ProofArtifact> RocksDbProofStore::get(const Digest &document_id)
    {
        std::string value;
        auto key = document_id.to_hex();
        auto status = impl_->db->Get(rocksdb::ReadOptions(), key, &value);
        if (status.IsNotFound())
            return std::unexpected(ProoflineError::not_found("No proof stored for document " + key));
        if (!status.ok())
            return std::unexpected(ProoflineError::storage("RocksDB Get failed: " + status.ToString()));
        return decode(value, key);
    }

    Result<std::vector<Digest>> RocksDbProofStore::list()
    {
        std::vector<Digest> out;
        std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(rocksdb::ReadOptions()));
        for (it->SeekToFirst(); it->Valid(); it->Next())
        {
            auto id = Digest::from_hex(it->key().ToString());
            if (!id)
            {
                spdlog::warn("ignoring foreign key {} in proof database", it->key().ToString());
                continue;
            }
            out.push_back(*id);
        }
        if (!it->status().ok())
            return std::unexpected(ProoflineError::storage("RocksDB iteration failed: " + it->status().ToString()));
        return out;
    }
#endif // PROOFLINE_HAVE_ROCKSDB

    Result<std::unique_ptr<ProofStore>> open_proof_store(const StorageConfig &cfg)
    {
        if (cfg.backend == "file")
            return std::unique_ptr<ProofStore>(std::make_unique<FileProofStore>(cfg.path));

        if (cfg.backend == "rocksdb")
        {
#ifdef PROOFLINE_HAVE_ROCKSDB
            auto store = RocksDbProofStore::open(cfg.path);
            if (!store)
                return std::unexpected(store.error());
            return std::unique_ptr<ProofStore>(std::move(*store));
#else
            return std::unexpected(ProoflineError::config("This build has no RocksDB support").on_field("storage.backend"));
#endif
        }

        return std::unexpected(ProoflineError::config("Unknown storage backend: " + cfg.backend).on_field("storage.backend"));
    }

} // namespace proofline
