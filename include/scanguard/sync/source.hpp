#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/errors/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::sync {

/**
 * @brief A child directory as reported by its parent's listing
 */
struct DirectoryEntry {
    std::string path;
    std::string etag;
};

struct FileEntry {
    std::string path;
    std::string etag;
    std::uint64_t size = 0;
};

/**
 * @brief One level of a remote tree
 *
 * Paths are full source paths (never relative to the listed directory),
 * so they can be fed straight back into list_directory.
 */
struct DirectoryListing {
    std::string path;
    std::string etag;
    std::vector<DirectoryEntry> directories;
    std::vector<FileEntry> files;
    std::chrono::milliseconds response_time{0};
    std::uint64_t response_size = 0;
    std::optional<std::string> server_type;
};

/**
 * @brief Shallow directory listing capability of a storage backend
 *
 * Implementations must be safe to call from several crawl workers at
 * once. Failures come back as SourceError values for the classifiers.
 */
class RemoteSource {
public:
    virtual ~RemoteSource() = default;

    [[nodiscard]] virtual errors::SourceType source_type() const = 0;

    virtual Result<DirectoryListing, errors::SourceError> list_directory(const std::string& path) = 0;
};

} // namespace scanguard::sync
