#include "scanguard/sync/directory_state_store.hpp"

#include <mutex>

namespace scanguard::sync {

namespace {

std::string trim_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

bool is_within(const std::string& root, const std::string& path) {
    const auto base = trim_trailing_slash(root);
    const auto candidate = trim_trailing_slash(path);
    if (candidate.compare(0, base.size(), base) != 0) {
        return false;
    }
    if (candidate.size() == base.size()) {
        return true;
    }
    return base == "/" || candidate[base.size()] == '/';
}

std::string parent_of(const std::string& path) {
    const auto trimmed = trim_trailing_slash(path);
    const auto slash = trimmed.find_last_of('/');
    if (slash == std::string::npos) {
        return {};
    }
    if (slash == 0) {
        return "/";
    }
    return trimmed.substr(0, slash);
}

std::optional<std::string> DirectoryStateStore::etag(const std::string& user_id, const std::string& path) const {
    std::shared_lock lock(mutex_);
    auto user = users_.find(user_id);
    if (user == users_.end()) {
        return std::nullopt;
    }
    auto it = user->second.find(trim_trailing_slash(path));
    if (it == user->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DirectoryEntry> DirectoryStateStore::list_under(const std::string& user_id,
                                                            const std::string& root) const {
    std::vector<DirectoryEntry> entries;
    std::shared_lock lock(mutex_);
    auto user = users_.find(user_id);
    if (user == users_.end()) {
        return entries;
    }
    for (const auto& [path, etag] : user->second) {
        if (is_within(root, path)) {
            entries.push_back({path, etag});
        }
    }
    return entries;
}

void DirectoryStateStore::upsert(const std::string& user_id, const std::vector<DirectoryEntry>& entries) {
    std::unique_lock lock(mutex_);
    auto& directories = users_[user_id];
    for (const auto& entry : entries) {
        directories[trim_trailing_slash(entry.path)] = entry.etag;
    }
}

std::size_t DirectoryStateStore::replace_under(const std::string& user_id,
                                               const std::string& root,
                                               const std::vector<DirectoryEntry>& entries) {
    std::unique_lock lock(mutex_);
    auto& directories = users_[user_id];

    DirectoryMap fresh;
    for (const auto& entry : entries) {
        if (is_within(root, entry.path)) {
            fresh[trim_trailing_slash(entry.path)] = entry.etag;
        }
    }

    std::size_t dropped = 0;
    for (auto it = directories.begin(); it != directories.end();) {
        if (is_within(root, it->first)) {
            if (fresh.count(it->first) == 0) {
                ++dropped;
            }
            it = directories.erase(it);
        } else {
            ++it;
        }
    }
    directories.merge(fresh);
    return dropped;
}

void DirectoryStateStore::clear(const std::string& user_id) {
    std::unique_lock lock(mutex_);
    users_.erase(user_id);
}

std::size_t DirectoryStateStore::size(const std::string& user_id) const {
    std::shared_lock lock(mutex_);
    auto user = users_.find(user_id);
    return user == users_.end() ? 0 : user->second.size();
}

nlohmann::json DirectoryStateStore::to_json(const std::string& user_id) const {
    auto result = nlohmann::json::object();
    std::shared_lock lock(mutex_);
    auto user = users_.find(user_id);
    if (user != users_.end()) {
        for (const auto& [path, etag] : user->second) {
            result[path] = etag;
        }
    }
    return result;
}

Result<void> DirectoryStateStore::load_json(const std::string& user_id, const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<void>(std::string("directory state must be a JSON object"));
    }

    DirectoryMap directories;
    for (const auto& item : document.items()) {
        if (!item.value().is_string()) {
            return Err<void>("directory state for '" + item.key() + "' must be a string ETag");
        }
        directories[trim_trailing_slash(item.key())] = item.value().get<std::string>();
    }

    std::unique_lock lock(mutex_);
    users_[user_id] = std::move(directories);
    return Ok();
}

} // namespace scanguard::sync
