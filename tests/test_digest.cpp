#include <catch2/catch_test_macros.hpp>
#include "proofline/digest.hpp"
#include "support/fakes.hpp"
#include <cmath>
#include <set>

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

TEST_CASE("Content digest is SHA-256 of the raw bytes", "[digest]")
{
    auto digest = Hasher::hash(bytes_of("hello world"));
    REQUIRE(digest.algorithm == DigestAlgorithm::SHA256);
    REQUIRE(digest.to_hex() == "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_CASE("Metadata digest is taken over canonical JSON", "[digest]")
{
    auto digest = Hasher::hash_metadata(Json{{"type", "note"}});
    REQUIRE(digest.has_value());
    REQUIRE(digest->to_hex() == "a9cf9d3ae0aef0cd0f9b2f46bc52869e1b9d6639784377356a1d6b290b0629b5");

    SECTION("Key order and whitespace do not matter")
    {
        auto a = Hasher::hash_metadata(Json::parse(R"({"b": 1, "a": [1, 2]})"));
        auto b = Hasher::hash_metadata(Json::parse(R"({"a":[1,2],"b":1})"));
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*a == *b);
    }

    SECTION("Values without a canonical form are rejected")
    {
        auto res = Hasher::hash_metadata(Json{{"score", std::nan("")}});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::ValidationError);
        REQUIRE(res.error().stage == "canonicalize");
        REQUIRE(res.error().field == "$.score");
    }
}

TEST_CASE("Document id concatenates content then metadata digest", "[digest]")
{
    auto content = Hasher::hash(bytes_of("hello world"));
    auto metadata = Hasher::hash_metadata(Json{{"type", "note"}}).value();

    auto id = Hasher::assemble_document_id(content, metadata);
    REQUIRE(id.to_hex() == "b00c64c4a83c24d76c1b8ea92f1326614dc8ddd2a8049345382f3d737e32d7e7");

    auto reversed = Hasher::assemble_document_id(metadata, content);
    REQUIRE(reversed.to_hex() == "4ff1d8bf6bfd7f74e7ebe0e08fb568e0d503fa781d1b43275a1894a943f07d7e");
    REQUIRE(reversed != id);
}

TEST_CASE("Identity derivation is deterministic", "[digest]")
{
    auto identity = Hasher::derive_identity(bytes_of("hello world"), Json{{"type", "note"}});
    REQUIRE(identity.has_value());
    REQUIRE(identity->content_digest.to_hex() == "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    REQUIRE(identity->metadata_digest.to_hex() == "a9cf9d3ae0aef0cd0f9b2f46bc52869e1b9d6639784377356a1d6b290b0629b5");
    REQUIRE(identity->document_id.to_hex() == "b00c64c4a83c24d76c1b8ea92f1326614dc8ddd2a8049345382f3d737e32d7e7");

    auto again = Hasher::derive_identity(bytes_of("hello world"), Json{{"type", "note"}});
    REQUIRE(again.has_value());
    REQUIRE(again->document_id == identity->document_id);

    SECTION("Changing either input changes the id")
    {
        auto other_content = Hasher::derive_identity(bytes_of("hello world!"), Json{{"type", "note"}});
        auto other_meta = Hasher::derive_identity(bytes_of("hello world"), Json{{"type", "memo"}});
        REQUIRE(other_content->document_id != identity->document_id);
        REQUIRE(other_meta->document_id != identity->document_id);
        REQUIRE(other_meta->content_digest == identity->content_digest);
    }
}

TEST_CASE("Document ids separate every single-byte and single-field mutation", "[digest]")
{
    crypto::Bytes content;
    for (int i = 0; i < 64; ++i)
        content.push_back(static_cast<uint8_t>(i * 7));

    const Json metadata = {{"type", "contract"},
                           {"pages", 12},
                           {"signed", true},
                           {"parties", Json::array({"acme", "globex"})},
                           {"terms", {{"currency", "EUR"}, {"amount", 1500}, {"renewal", {{"months", 6}, {"auto", false}}}}}};

    const auto base = Hasher::derive_identity(content, metadata).value().document_id.to_hex();
    std::set<std::string> seen{base};
    std::size_t samples = 0;

    auto record = [&](const crypto::Bytes &bytes, const Json &meta) {
        auto identity = Hasher::derive_identity(bytes, meta);
        REQUIRE(identity.has_value());
        ++samples;
        seen.insert(identity->document_id.to_hex());
    };

    for (std::size_t pos = 0; pos < content.size(); ++pos)
    {
        for (uint8_t mask : {uint8_t{0x01}, uint8_t{0x80}, uint8_t{0xff}})
        {
            auto mutated = content;
            mutated[pos] ^= mask;
            record(mutated, metadata);
        }
    }

    // Change every scalar leaf of the metadata once
    auto flat = metadata.flatten();
    for (const auto &[pointer, value] : flat.items())
    {
        auto mutated = flat;
        if (value.is_string())
            mutated[pointer] = value.get<std::string>() + "x";
        else if (value.is_boolean())
            mutated[pointer] = !value.get<bool>();
        else
            mutated[pointer] = value.get<int64_t>() + 1;
        record(content, mutated.unflatten());
    }

    // Renamed keys and an extra field are mutations too
    auto renamed = metadata;
    renamed["Type"] = renamed["type"];
    renamed.erase("type");
    record(content, renamed);

    auto extended = metadata;
    extended["terms"]["renewal"]["notice_days"] = 30;
    record(content, extended);

    // One extra digest per sample on top of the base
    REQUIRE(samples == content.size() * 3 + flat.size() + 2);
    REQUIRE(seen.size() == samples + 1);
}

TEST_CASE("Digest hex parsing is strict", "[digest]")
{
    const std::string hex = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
    auto parsed = Digest::from_hex(hex);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->to_hex() == hex);

    std::string upper = hex;
    upper[0] = 'B';
    REQUIRE_FALSE(Digest::from_hex(upper).has_value());
    REQUIRE_FALSE(Digest::from_hex(hex.substr(2)).has_value());
    REQUIRE_FALSE(Digest::from_hex(hex + "00").has_value());
    REQUIRE_FALSE(Digest::from_hex("").has_value());

    REQUIRE(digest_algorithm_from_string("sha256").value() == DigestAlgorithm::SHA256);
    REQUIRE_FALSE(digest_algorithm_from_string("md5").has_value());
}
