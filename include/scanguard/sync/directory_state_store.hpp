#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/sync/source.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace scanguard::sync {

/**
 * @brief Last seen ETag of every directory a deep scan listed, per user
 *
 * This is the baseline smart sync compares a fresh shallow listing
 * against. Readers take a shared lock; writers hold a unique lock for the
 * whole bulk operation, so a concurrent reader sees either the old or the
 * new subtree.
 */
class DirectoryStateStore {
public:
    DirectoryStateStore() = default;

    DirectoryStateStore(const DirectoryStateStore&) = delete;
    DirectoryStateStore& operator=(const DirectoryStateStore&) = delete;

    [[nodiscard]] std::optional<std::string> etag(const std::string& user_id, const std::string& path) const;

    /// Known directories at or below @p root, in path order
    [[nodiscard]] std::vector<DirectoryEntry> list_under(const std::string& user_id,
                                                         const std::string& root) const;

    /// Insert or overwrite each entry
    void upsert(const std::string& user_id, const std::vector<DirectoryEntry>& entries);

    /**
     * @brief Replace everything at or below @p root with @p entries
     * @return Number of directories dropped because they are no longer listed
     */
    std::size_t replace_under(const std::string& user_id,
                              const std::string& root,
                              const std::vector<DirectoryEntry>& entries);

    void clear(const std::string& user_id);

    [[nodiscard]] std::size_t size(const std::string& user_id) const;

    [[nodiscard]] nlohmann::json to_json(const std::string& user_id) const;

    /// Replace @p user_id's directories with a to_json() object ({"path": "etag", ...})
    Result<void> load_json(const std::string& user_id, const nlohmann::json& document);

private:
    using DirectoryMap = std::map<std::string, std::string>;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DirectoryMap> users_;
};

/// True when @p path is @p root itself or lies below it
[[nodiscard]] bool is_within(const std::string& root, const std::string& path);

/// Parent of a '/'-separated path; "" for a top-level name
[[nodiscard]] std::string parent_of(const std::string& path);

} // namespace scanguard::sync
