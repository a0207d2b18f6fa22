#include <catch2/catch_test_macros.hpp>
#include "proofline/proof_store.hpp"
#include "support/fakes.hpp"
#include <fstream>

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

TEST_CASE("File proof store round trips artifacts by document id", "[store]")
{
    TempDir dir;
    FileProofStore store(dir.path() / "proofs");
    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});

    REQUIRE(store.list().value().empty());
    REQUIRE(store.put(artifact).has_value());

    auto loaded = store.get(artifact.document_id);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == artifact);

    auto ids = store.list();
    REQUIRE(ids.has_value());
    REQUIRE(ids->size() == 1);
    REQUIRE(ids->front() == artifact.document_id);

    SECTION("Files hold canonical JSON named after the document id")
    {
        auto path = dir.path() / "proofs" / (artifact.document_id.to_hex() + ".json");
        std::ifstream in(path);
        REQUIRE(in.good());
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        REQUIRE(text.find('\n') == std::string::npos);
        REQUIRE(text.find("\"aggregate_status\":\"confirmed\"") != std::string::npos);
    }

    SECTION("A later artifact replaces the earlier one")
    {
        auto later = artifact;
        later.created_at = at_ms(kEpochMs + 60000);
        later.artifact_checksum = later.compute_checksum().value();
        REQUIRE(store.put(later).has_value());
        REQUIRE(store.get(artifact.document_id).value().created_at == later.created_at);
        REQUIRE(store.list().value().size() == 1);
    }
}

TEST_CASE("File proof store reports missing and corrupted artifacts", "[store]")
{
    TempDir dir;
    FileProofStore store(dir.path());
    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});

    auto missing = store.get(artifact.document_id);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::NotFound);

    REQUIRE(store.put(artifact).has_value());
    auto path = dir.path() / (artifact.document_id.to_hex() + ".json");

    SECTION("Edited contents fail the checksum on read")
    {
        auto j = artifact.to_json();
        j["aggregate_status"] = "failed";
        std::ofstream(path, std::ios::trunc) << j.dump();

        auto res = store.get(artifact.document_id);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::IntegrityFault);
    }

    SECTION("Unparseable contents are a storage error")
    {
        std::ofstream(path, std::ios::trunc) << "{ truncated";

        auto res = store.get(artifact.document_id);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::StorageError);
    }

    SECTION("Foreign files are ignored when listing")
    {
        std::ofstream(dir.path() / "notes.json") << "{}";
        std::ofstream(dir.path() / "README") << "hello";
        REQUIRE(store.list().value().size() == 1);
    }
}

TEST_CASE("Proof store backend follows configuration", "[store]")
{
    TempDir dir;

    StorageConfig cfg;
    cfg.backend = "file";
    cfg.path = (dir.path() / "proofs").string();
    auto store = open_proof_store(cfg);
    REQUIRE(store.has_value());
    REQUIRE(*store != nullptr);

    cfg.backend = "tape";
    auto unknown = open_proof_store(cfg);
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().field == "storage.backend");
}

#ifdef PROOFLINE_HAVE_ROCKSDB
TEST_CASE("RocksDB proof store round trips artifacts", "[store][rocksdb]")
{
    TempDir dir;
    auto store = RocksDbProofStore::open((dir.path() / "db").string());
    REQUIRE(store.has_value());

    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});
    REQUIRE((*store)->put(artifact).has_value());
    REQUIRE((*store)->get(artifact.document_id).value() == artifact);
    REQUIRE((*store)->list().value().size() == 1);

    auto other = Hasher::hash(std::string("unknown"));
    REQUIRE((*store)->get(other).error().code == ErrorCode::NotFound);
}
#endif
