#pragma once

#include "collaborators.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>

namespace proofline
{

    /** Read a whole file as bytes (IOError on failure) */
    Result<crypto::Bytes> read_file(const std::filesystem::path &path);

    /**
     * ContentStore over the local filesystem, addressed by `file://` URIs.
     */
    class FileContentStore : public ContentStore
    {
    public:
        Result<crypto::Bytes> retrieve(const ContentLocator &locator) override;

        Result<Digest> locator_digest(const ContentLocator &locator) override;

        /** Locator for an existing file: absolute file:// URI plus the digest of its bytes */
        static Result<ContentLocator> locate(const std::filesystem::path &path);

        static Result<std::filesystem::path> path_of(const ContentLocator &locator);
    };

} // namespace proofline
