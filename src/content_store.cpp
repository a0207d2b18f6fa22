#include "proofline/content_store.hpp"
#include "proofline/digest.hpp"
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace proofline
{

    namespace
    {
        constexpr std::string_view kFileScheme = "file://";
    }

    Result<crypto::Bytes> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return std::unexpected(ProoflineError::io("Cannot open " + path.string()));
        crypto::Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            return std::unexpected(ProoflineError::io("Read error on " + path.string()));
        return bytes;
    }

    Result<std::filesystem::path> FileContentStore::path_of(const ContentLocator &locator)
    {
        if (!locator.uri.starts_with(kFileScheme))
        {
            return std::unexpected(ProoflineError::invalid_input(
                                       std::format("Unsupported locator scheme in '{}'", locator.uri))
                                       .on_field("uri"));
        }
        return std::filesystem::path(locator.uri.substr(kFileScheme.size()));
    }

    Result<crypto::Bytes> FileContentStore::retrieve(const ContentLocator &locator)
    {
        auto path = path_of(locator);
        if (!path)
            return std::unexpected(path.error());
        return read_file(*path);
    }

    Result<Digest> FileContentStore::locator_digest(const ContentLocator &locator)
    {
        auto bytes = retrieve(locator);
        if (!bytes)
            return std::unexpected(bytes.error());
        return Hasher::hash(*bytes);
    }

    Result<ContentLocator> FileContentStore::locate(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
            return std::unexpected(ProoflineError::io(std::format("Cannot resolve {}: {}", path.string(), ec.message())));

        auto bytes = read_file(absolute);
        if (!bytes)
            return std::unexpected(bytes.error());
        return ContentLocator{std::string(kFileScheme) + absolute.string(), Hasher::hash(*bytes)};
    }

} // namespace proofline
