#pragma once

#include "scanguard/sync/source.hpp"

#include <filesystem>
#include <string>

namespace scanguard::sync {

/**
 * @brief RemoteSource over the local filesystem
 *
 * ETags are derived from modification time and size, so a directory's
 * ETag moves whenever an entry is added, removed or renamed in it.
 *
 * With follow_symlinks enabled, a symlinked directory is reported under
 * its canonical path. A link pointing back up the tree therefore shows up
 * as a path the crawl has already visited, which is what lets the loop
 * detector stop it. Without it, symlinks are not listed at all.
 */
class LocalDirectorySource final : public RemoteSource {
public:
    explicit LocalDirectorySource(bool follow_symlinks = false) : follow_symlinks_(follow_symlinks) {}

    [[nodiscard]] errors::SourceType source_type() const override { return errors::SourceType::Local; }

    Result<DirectoryListing, errors::SourceError> list_directory(const std::string& path) override;

    /// "<hex>" hash of mtime and size; empty when @p path cannot be stat'ed
    [[nodiscard]] static std::string etag_for(const std::filesystem::path& path);

private:
    bool follow_symlinks_;
};

} // namespace scanguard::sync
