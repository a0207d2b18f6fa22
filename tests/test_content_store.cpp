#include <catch2/catch_test_macros.hpp>
#include "proofline/content_store.hpp"
#include "support/fakes.hpp"
#include <fstream>

using namespace proofline;
using namespace proofline::testing;

TEST_CASE("File content store addresses files by absolute file URI", "[content]")
{
    TempDir dir;
    auto path = dir.path() / "doc.txt";
    std::ofstream(path, std::ios::binary) << "hello world";

    auto locator = FileContentStore::locate(path);
    REQUIRE(locator.has_value());
    REQUIRE(locator->uri.starts_with("file:///"));
    REQUIRE(locator->digest.to_hex() == "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");

    FileContentStore store;
    auto bytes = store.retrieve(*locator);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == bytes_of("hello world"));
    REQUIRE(store.locator_digest(*locator).value() == locator->digest);

    SECTION("Rewritten files report their new digest")
    {
        std::ofstream(path, std::ios::binary | std::ios::trunc) << "goodbye";
        REQUIRE(store.locator_digest(*locator).value() != locator->digest);
    }

    SECTION("Missing files are an IO error")
    {
        std::filesystem::remove(path);
        auto res = store.retrieve(*locator);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::IOError);
    }
}

TEST_CASE("File content store only understands file URIs", "[content]")
{
    FileContentStore store;
    ContentLocator locator{"s3://bucket/doc", Hasher::hash(std::string("doc"))};

    auto res = store.retrieve(locator);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
    REQUIRE(res.error().field == "uri");

    REQUIRE_FALSE(FileContentStore::locate("/definitely/not/here.bin").has_value());
}
