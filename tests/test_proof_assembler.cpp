#include <catch2/catch_test_macros.hpp>
#include "proofline/proof_assembler.hpp"
#include "support/fakes.hpp"

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

namespace
{
    struct AssemblyFixture
    {
        crypto::Ed25519KeyPair kp = oracle_keypair();
        DocumentIdentity identity = Hasher::derive_identity(bytes_of("hello world"), Json{{"type", "note"}}).value();
        ContentLocator locator{"mem://doc", identity.content_digest};
        OracleReport report = signed_report(kp, identity.document_id, at_ms(kEpochMs - 1000),
                                            {{"chain-a", "0xchain-a"}, {"chain-b", "0xchain-b"}, {"chain-c", "0xchain-c"}});
        TrackingOutcome tracking{{{"chain-a", confirmation_on("chain-a")},
                                  {"chain-b", confirmation_on("chain-b")},
                                  {"chain-c", confirmation_on("chain-c", ChainStatus::Pending, 4)}},
                                 AggregateStatus::Confirmed,
                                 QuorumPolicy::make(3, 2).value(),
                                 false};
        std::vector<std::string> warnings{"oracle report is stale"};

        Result<ProofArtifact> assemble(Timestamp created_at = at_ms(kEpochMs)) const
        {
            return ProofAssembler::assemble({identity.document_id, locator, identity.metadata_digest,
                                             report, tracking, created_at, warnings});
        }
    };
}

TEST_CASE("Assembler copies every stage output into the artifact", "[assembler]")
{
    AssemblyFixture f;
    auto artifact = f.assemble();
    REQUIRE(artifact.has_value());

    REQUIRE(artifact->schema_version == "1");
    REQUIRE(artifact->document_id.to_hex() == "b00c64c4a83c24d76c1b8ea92f1326614dc8ddd2a8049345382f3d737e32d7e7");
    REQUIRE(artifact->content_locator == f.locator);
    REQUIRE(artifact->metadata_digest == f.identity.metadata_digest);
    REQUIRE(artifact->oracle_report == f.report);
    REQUIRE(artifact->chain_confirmations.size() == 3);
    REQUIRE(artifact->aggregate_status == AggregateStatus::Confirmed);
    REQUIRE(artifact->quorum_required == 2);
    REQUIRE(artifact->quorum_configured == 3);
    REQUIRE_FALSE(artifact->forced_cutoff);
    REQUIRE(artifact->warnings == f.warnings);
    REQUIRE(artifact->created_at == at_ms(kEpochMs));
    REQUIRE(artifact->verify_checksum().has_value());
}

TEST_CASE("Assembly is a pure function of its input", "[assembler]")
{
    AssemblyFixture f;
    auto first = f.assemble().value();
    auto second = f.assemble().value();
    REQUIRE(first == second);
    REQUIRE(first.canonical_json().value() == second.canonical_json().value());

    SECTION("The creation time is part of the checksum")
    {
        auto later = f.assemble(at_ms(kEpochMs + 1)).value();
        REQUIRE(later.artifact_checksum != first.artifact_checksum);
    }
}

TEST_CASE("Assembler refuses a pending aggregate", "[assembler]")
{
    AssemblyFixture f;
    f.tracking.aggregate = AggregateStatus::Pending;

    auto res = f.assemble();
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
    REQUIRE(res.error().field == "aggregate_status");

    SECTION("Unless the caller cut tracking off")
    {
        f.tracking.forced_cutoff = true;
        auto cut = f.assemble();
        REQUIRE(cut.has_value());
        REQUIRE(cut->aggregate_status == AggregateStatus::Pending);
        REQUIRE(cut->forced_cutoff);
    }
}

TEST_CASE("Assembler produces negative proofs for failed aggregates", "[assembler]")
{
    AssemblyFixture f;
    f.tracking.confirmations["chain-a"] = confirmation_on("chain-a", ChainStatus::Failed, 0);
    f.tracking.confirmations["chain-b"] = confirmation_on("chain-b", ChainStatus::Failed, 0);
    f.tracking.aggregate = AggregateStatus::Failed;

    auto artifact = f.assemble();
    REQUIRE(artifact.has_value());
    REQUIRE(artifact->aggregate_status == AggregateStatus::Failed);
    REQUIRE(artifact->chain_confirmations.at("chain-a").failure_reason == "transaction reverted");
}

TEST_CASE("Assembler refuses a report for another document", "[assembler]")
{
    AssemblyFixture f;
    f.report = signed_report(f.kp, Hasher::hash(std::string("other")), at_ms(kEpochMs));

    auto res = f.assemble();
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::IntegrityFault);
    REQUIRE(res.error().field == "reported_digest");
    REQUIRE(res.error().expected == f.identity.document_id.to_hex());
}

TEST_CASE("Assembler checks the confirmation set against the quorum", "[assembler]")
{
    AssemblyFixture f;

    SECTION("Every configured ledger must be present")
    {
        f.tracking.confirmations.erase("chain-c");
        auto res = f.assemble();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "chain_confirmations");
    }

    SECTION("Confirmations must be filed under their own chain")
    {
        f.tracking.confirmations["chain-c"].chain_id = "chain-z";
        auto res = f.assemble();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "chain_confirmations.chain-c");
    }
}
