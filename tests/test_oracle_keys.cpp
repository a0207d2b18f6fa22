#include <catch2/catch_test_macros.hpp>
#include "proofline/crypto.hpp"
#include "proofline/oracle_client.hpp"
#include "proofline/oracle_keys.hpp"
#include "support/fakes.hpp"

using namespace proofline;
using namespace proofline::testing;

namespace {
    std::string sign_message(const crypto::Ed25519KeyPair &kp, const std::string &message) {
        auto sig_arr = kp.sign(bytes_of(message));
        return crypto::Base64::encode(crypto::Bytes(sig_arr.begin(), sig_arr.end()));
    }
}

TEST_CASE("Oracle signatures require a registered key", "[oracle][keys]") {
    OracleKeyRing ring;
    auto kp = oracle_keypair();

    auto add_res = ring.add_key("oracle-1", kp.public_key_b64(), "attestor", "primary oracle");
    REQUIRE(add_res.has_value());
    REQUIRE(ring.size() == 1);
    REQUIRE(ring.is_authorized("oracle-1"));

    std::string sig_b64 = sign_message(kp, "payload");
    auto verified = ring.verify("oracle-1", bytes_of("payload"), sig_b64);
    REQUIRE(verified.has_value());
    REQUIRE(*verified);

    SECTION("Rejects tampered signature") {
        std::string bad_sig = sig_b64;
        bad_sig[0] = (bad_sig[0] == 'A') ? 'B' : 'A';
        auto res = ring.verify("oracle-1", bytes_of("payload"), bad_sig);
        REQUIRE(res.has_value());
        REQUIRE_FALSE(*res);
    }

    SECTION("Rejects unknown key") {
        auto res = ring.verify("oracle-2", bytes_of("payload"), sig_b64);
        REQUIRE(res.has_value());
        REQUIRE_FALSE(*res);
    }

    SECTION("Revoked keys no longer verify") {
        REQUIRE(ring.revoke_key("oracle-1").has_value());
        REQUIRE_FALSE(ring.is_authorized("oracle-1"));
        REQUIRE(ring.list_active_keys().empty());
        auto res = ring.verify("oracle-1", bytes_of("payload"), sig_b64);
        REQUIRE(res.has_value());
        REQUIRE_FALSE(*res);
    }

    SECTION("Malformed signature encoding is an error") {
        auto res = ring.verify("oracle-1", bytes_of("payload"), "not base64!");
        REQUIRE_FALSE(res.has_value());
    }
}

TEST_CASE("Key ring rejects bad registrations", "[oracle][keys]") {
    OracleKeyRing ring;
    auto kp = oracle_keypair();

    REQUIRE_FALSE(ring.add_key("", kp.public_key_b64(), "a", "d").has_value());

    auto bad_key = ring.add_key("oracle-1", "AAAA", "a", "d");
    REQUIRE_FALSE(bad_key.has_value());
    REQUIRE(bad_key.error().field == "public_key");

    REQUIRE(ring.add_key("oracle-1", kp.public_key_b64(), "a", "d").has_value());
    REQUIRE_FALSE(ring.add_key("oracle-1", kp.public_key_b64(), "a", "d").has_value());

    auto missing = ring.revoke_key("nobody");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Report signatures are checked against the key ring", "[oracle][keys]") {
    OracleKeyRing ring;
    auto kp = oracle_keypair();
    authorize(ring, kp);

    auto digest = Hasher::hash(std::string("document"));
    auto report = signed_report(kp, digest, at_ms(kEpochMs));
    REQUIRE(check_report_signature(report, ring).has_value());

    SECTION("Signature covers the reported digest") {
        auto forged = report;
        forged.reported_digest = Hasher::hash(std::string("other document"));
        auto res = check_report_signature(forged, ring);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "signature");
    }

    SECTION("Signature covers the issue time") {
        auto forged = report;
        forged.issued_at = at_ms(kEpochMs + 1);
        REQUIRE_FALSE(check_report_signature(forged, ring).has_value());
    }

    SECTION("Reports signed by another key are rejected") {
        auto rogue = oracle_keypair(9);
        auto rogue_report = signed_report(rogue, digest, at_ms(kEpochMs));
        auto res = check_report_signature(rogue_report, ring);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "signature");
    }

    SECTION("Unknown signer is rejected") {
        auto other = report;
        other.signer = "oracle-9";
        auto res = check_report_signature(other, ring);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "signer");
    }
}
