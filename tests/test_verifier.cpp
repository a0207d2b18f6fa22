#include <catch2/catch_test_macros.hpp>
#include "proofline/verifier.hpp"
#include "support/fakes.hpp"

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

namespace
{
    ChainPolicy policy_for(const std::string &chain_id, uint64_t depth = 12)
    {
        ChainPolicy policy;
        policy.chain_id = chain_id;
        policy.required_depth = depth;
        return policy;
    }

    struct VerifierFixture
    {
        ManualClock clock;
        OracleKeyRing ring;
        crypto::Ed25519KeyPair kp = oracle_keypair();
        crypto::Bytes content = bytes_of("hello world");
        Json metadata = Json{{"type", "note"}};
        ScriptedLedger a{"chain-a", {tx_found(15)}};
        ScriptedLedger b{"chain-b", {tx_found(15)}};
        ScriptedLedger c{"chain-c", {tx_found(15)}};
        ProofArtifact artifact = sample_artifact(kp, content, metadata);

        VerifierFixture() { authorize(ring, kp); }

        std::vector<LedgerBinding> bindings(uint64_t depth = 12)
        {
            return {{a, policy_for("chain-a", depth)}, {b, policy_for("chain-b", depth)}, {c, policy_for("chain-c", depth)}};
        }

        Verifier verifier(uint64_t depth = 12, ContentStore *store = nullptr)
        {
            return Verifier(ring, bindings(depth), QuorumPolicy::make(3).value(), clock, store);
        }

        void reseal() { artifact.artifact_checksum = artifact.compute_checksum().value(); }
    };

    StageStatus status_of(const VerificationReport &report, const std::string &stage)
    {
        const auto *result = report.find_stage(stage);
        REQUIRE(result != nullptr);
        return result->status;
    }
}

TEST_CASE("Untouched artifact verifies at every stage", "[verifier]")
{
    VerifierFixture f;
    auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

    REQUIRE(report.verified());
    REQUIRE(report.failing_stage() == nullptr);

    std::vector<std::string> stages;
    for (const auto &s : report.stages)
    {
        stages.push_back(s.stage);
        REQUIRE(s.status == StageStatus::Passed);
    }
    REQUIRE(stages == std::vector<std::string>{"artifact_checksum", "content_digest", "metadata_digest", "document_id",
                                               "oracle_signature", "oracle_digest", "ledger:chain-a", "ledger:chain-b",
                                               "ledger:chain-c", "quorum"});

    auto j = report.to_json();
    REQUIRE(j["verdict"] == "VERIFIED");
    REQUIRE_FALSE(j.contains("failing_stage"));
    REQUIRE(j["stages"].size() == 10);

    SECTION("Metadata is optional")
    {
        auto without = f.verifier().verify(f.artifact, f.content);
        REQUIRE(without.verified());
        REQUIRE(status_of(without, "metadata_digest") == StageStatus::Skipped);
    }
}

TEST_CASE("Altered content fails the content digest stage", "[verifier]")
{
    VerifierFixture f;
    auto report = f.verifier().verify(f.artifact, bytes_of("hello world!"), f.metadata);

    REQUIRE_FALSE(report.verified());
    REQUIRE(report.failing_stage()->stage == "content_digest");
    REQUIRE(report.failing_stage()->expected == f.artifact.content_locator.digest.to_hex());
    REQUIRE(report.failing_stage()->actual == Hasher::hash(bytes_of("hello world!")).to_hex());
    REQUIRE(status_of(report, "document_id") == StageStatus::Failed);
    REQUIRE(status_of(report, "oracle_digest") == StageStatus::Failed);
    REQUIRE(status_of(report, "oracle_signature") == StageStatus::Passed);
    REQUIRE(report.to_json()["failing_stage"] == "content_digest");
}

TEST_CASE("Altered metadata fails the metadata digest stage", "[verifier]")
{
    VerifierFixture f;
    auto report = f.verifier().verify(f.artifact, f.content, Json{{"type", "memo"}});

    REQUIRE_FALSE(report.verified());
    REQUIRE(report.failing_stage()->stage == "metadata_digest");
    REQUIRE(status_of(report, "content_digest") == StageStatus::Passed);
    REQUIRE(status_of(report, "document_id") == StageStatus::Failed);
}

TEST_CASE("Edited artifact fails the checksum stage", "[verifier]")
{
    VerifierFixture f;
    f.artifact.chain_confirmations["chain-a"].confirmation_count = 99;

    auto report = f.verifier().verify(f.artifact, f.content, f.metadata);
    REQUIRE_FALSE(report.verified());
    REQUIRE(report.failing_stage()->stage == "artifact_checksum");
    REQUIRE(report.failing_stage()->actual == f.artifact.artifact_checksum.to_hex());
}

TEST_CASE("Resealed forgeries are caught by the oracle stages", "[verifier]")
{
    VerifierFixture f;

    SECTION("Swapped reported digest")
    {
        f.artifact.oracle_report.reported_digest = Hasher::hash(std::string("forged"));
        f.reseal();
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE(status_of(report, "artifact_checksum") == StageStatus::Passed);
        REQUIRE(report.failing_stage()->stage == "oracle_signature");
        REQUIRE(status_of(report, "oracle_digest") == StageStatus::Failed);
    }

    SECTION("Report signed by an unknown key")
    {
        auto rogue = oracle_keypair(9);
        sign_report(f.artifact.oracle_report, rogue);
        f.reseal();
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE(report.failing_stage()->stage == "oracle_signature");
        REQUIRE(status_of(report, "oracle_digest") == StageStatus::Passed);
    }

    SECTION("Report no longer finalized")
    {
        f.artifact.oracle_report.finalized = false;
        f.reseal();
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);
        REQUIRE(status_of(report, "oracle_digest") == StageStatus::Failed);
    }

    SECTION("Recorded transaction differs from the relay")
    {
        f.artifact.chain_confirmations["chain-a"].transaction_ref = "0xforged";
        f.reseal();
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE(report.failing_stage()->stage == "ledger:chain-a");
        REQUIRE(report.failing_stage()->actual == "0xforged");
        REQUIRE(f.a.calls() == 0);
    }
}

TEST_CASE("Ledger stages re-query every recorded chain", "[verifier]")
{
    VerifierFixture f;

    SECTION("A vanished transaction fails its ledger")
    {
        f.a.reset({tx_missing()});
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE_FALSE(report.verified());
        REQUIRE(report.failing_stage()->stage == "ledger:chain-a");
        REQUIRE(report.failing_stage()->actual == "not found");
        REQUIRE(status_of(report, "quorum") == StageStatus::Passed);
    }

    SECTION("The verifier's own depth requirement applies")
    {
        auto report = f.verifier(20).verify(f.artifact, f.content, f.metadata);

        REQUIRE_FALSE(report.verified());
        REQUIRE(status_of(report, "ledger:chain-a") == StageStatus::Failed);
        REQUIRE(status_of(report, "quorum") == StageStatus::Failed);
    }

    SECTION("Transient ledger errors are retried")
    {
        f.b.reset({tx_transient(), tx_found(15)});
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE(report.verified());
        REQUIRE(f.b.calls() == 2);
    }

    SECTION("Chains without a configured client are skipped")
    {
        Verifier partial(f.ring, {{f.a, policy_for("chain-a")}, {f.b, policy_for("chain-b")}},
                         QuorumPolicy::make(2).value(), f.clock);
        auto report = partial.verify(f.artifact, f.content, f.metadata);

        REQUIRE(report.verified());
        REQUIRE(status_of(report, "ledger:chain-c") == StageStatus::Skipped);
        REQUIRE(f.c.calls() == 0);
    }

    SECTION("Ledgers recorded as unconfirmed are informational")
    {
        f.artifact.chain_confirmations["chain-c"] = confirmation_on("chain-c", ChainStatus::Pending, 3);
        f.reseal();
        auto report = f.verifier().verify(f.artifact, f.content, f.metadata);

        REQUIRE(status_of(report, "ledger:chain-c") == StageStatus::Skipped);
        REQUIRE(report.verified());
    }
}

TEST_CASE("Negative proofs never verify", "[verifier]")
{
    VerifierFixture f;
    f.artifact.chain_confirmations["chain-a"] = confirmation_on("chain-a", ChainStatus::Failed, 0);
    f.artifact.chain_confirmations["chain-b"] = confirmation_on("chain-b", ChainStatus::Failed, 0);
    f.artifact.aggregate_status = AggregateStatus::Failed;
    f.reseal();

    auto report = f.verifier().verify(f.artifact, f.content, f.metadata);
    REQUIRE_FALSE(report.verified());
    REQUIRE(report.failing_stage()->stage == "quorum");
    REQUIRE(report.to_json()["verdict"] == "FAILED");
}

TEST_CASE("Stored content is fetched through the locator", "[verifier]")
{
    VerifierFixture f;
    InMemoryContentStore store;
    store.put("mem://doc", f.content);

    auto report = f.verifier(12, &store).verify_stored(f.artifact, f.metadata);
    REQUIRE(report.has_value());
    REQUIRE(report->verified());

    SECTION("Overwritten content is detected")
    {
        store.overwrite("mem://doc", bytes_of("goodbye"));
        auto tampered = f.verifier(12, &store).verify_stored(f.artifact, f.metadata);
        REQUIRE(tampered.has_value());
        REQUIRE(tampered->failing_stage()->stage == "content_digest");
    }

    SECTION("A store whose digest index disagrees with its bytes is refused")
    {
        store.misreport("mem://doc", Hasher::hash(std::string("stale index entry")));
        auto res = f.verifier(12, &store).verify_stored(f.artifact, f.metadata);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::IntegrityFault);
        REQUIRE(res.error().field == "content_digest");
    }

    SECTION("Without a store there is nothing to fetch")
    {
        auto res = f.verifier().verify_stored(f.artifact);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidInput);
    }
}
