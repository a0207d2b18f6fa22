#include <catch2/catch_test_macros.hpp>
#include "proofline/json_canonicalization.hpp"
#include "proofline/proof_artifact.hpp"
#include "support/fakes.hpp"

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

TEST_CASE("Artifact survives serialization unchanged", "[artifact]")
{
    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});

    auto text = artifact.to_json().dump(2);
    auto parsed = ProofArtifact::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == artifact);
    REQUIRE(parsed->verify_checksum().has_value());

    SECTION("Checksum covers the canonical body only")
    {
        auto body = artifact.body_json();
        REQUIRE_FALSE(body.contains("artifact_checksum"));
        auto canonical = json::RFC8785Canonicalizer::canonicalize(body).value();
        REQUIRE(Hasher::hash(canonical) == artifact.artifact_checksum);
        REQUIRE(artifact.canonical_json().value() == canonical);
    }

    SECTION("Quorum is recorded as required of configured")
    {
        auto j = artifact.to_json();
        REQUIRE(j["quorum"]["required"] == 2);
        REQUIRE(j["quorum"]["configured"] == 3);
        REQUIRE(j["hash_algorithm"] == "sha256");
        REQUIRE(j["created_at"] == "2026-01-01T00:00:00.000Z");
    }
}

TEST_CASE("Any edit to a serialized artifact breaks its checksum", "[artifact]")
{
    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});
    auto j = artifact.to_json();

    SECTION("Confirmation count")
    {
        j["chain_confirmations"]["chain-a"]["confirmation_count"] = 13;
    }
    SECTION("Aggregate status")
    {
        j["aggregate_status"] = "failed";
    }
    SECTION("Warning list")
    {
        j["warnings"].push_back("injected");
    }
    SECTION("Content locator")
    {
        j["content_locator"]["uri"] = "mem://elsewhere";
    }

    auto tampered = ProofArtifact::from_json(j);
    REQUIRE(tampered.has_value());
    auto check = tampered->verify_checksum();
    REQUIRE_FALSE(check.has_value());
    REQUIRE(check.error().code == ErrorCode::IntegrityFault);
    REQUIRE(check.error().field == "artifact_checksum");
    REQUIRE(check.error().actual == artifact.artifact_checksum.to_hex());
}

TEST_CASE("Malformed artifacts name the offending field", "[artifact]")
{
    auto artifact = sample_artifact(oracle_keypair(), bytes_of("hello world"), Json{{"type", "note"}});
    auto j = artifact.to_json();

    SECTION("Missing top-level field")
    {
        j.erase("metadata_digest");
        auto res = ProofArtifact::from_json(j);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "metadata_digest");
    }

    SECTION("Nested oracle report field")
    {
        j["oracle_report"].erase("signer");
        auto res = ProofArtifact::from_json(j);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "oracle_report.signer");
    }

    SECTION("Uppercase digest")
    {
        j["document_id"] = "B00C64C4A83C24D76C1B8EA92F1326614DC8DDD2A8049345382F3D737E32D7E7";
        REQUIRE_FALSE(ProofArtifact::from_json(j).has_value());
    }

    SECTION("Confirmation filed under the wrong chain")
    {
        j["chain_confirmations"]["chain-a"]["chain_id"] = "chain-b";
        auto res = ProofArtifact::from_json(j);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "chain_confirmations.chain-a.chain_id");
    }

    SECTION("Unknown schema version")
    {
        j["schema_version"] = "2";
        auto res = ProofArtifact::from_json(j);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "schema_version");
    }

    SECTION("Not JSON at all")
    {
        REQUIRE_FALSE(ProofArtifact::parse("{\"schema_version\":").has_value());
    }
}
