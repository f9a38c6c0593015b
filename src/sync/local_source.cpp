#include "scanguard/sync/local_source.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>
#include <system_error>

namespace scanguard::sync {

namespace fs = std::filesystem;

namespace {

std::string hash_to_hex(std::size_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

} // namespace

std::string LocalDirectorySource::etag_for(const fs::path& path) {
    std::error_code ec;
    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        return {};
    }

    std::uintmax_t size = 0;
    if (fs::is_regular_file(path, ec)) {
        size = fs::file_size(path, ec);
        if (ec) {
            size = 0;
        }
    }

    const auto fingerprint = std::to_string(write_time.time_since_epoch().count()) + ":" + std::to_string(size);
    return hash_to_hex(std::hash<std::string>{}(fingerprint));
}

Result<DirectoryListing, errors::SourceError> LocalDirectorySource::list_directory(const std::string& path) {
    const auto started = std::chrono::steady_clock::now();
    const fs::path root(path);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        if (!ec) {
            ec = std::make_error_code(fs::exists(root) ? std::errc::not_a_directory
                                                       : std::errc::no_such_file_or_directory);
        }
        return Err<DirectoryListing>(errors::SourceError::from_error_code(ec, path));
    }

    DirectoryListing listing;
    listing.path = path;
    listing.etag = etag_for(root);
    listing.server_type = "local";

    fs::directory_iterator it(root, ec);
    if (ec) {
        return Err<DirectoryListing>(errors::SourceError::from_error_code(ec, path));
    }

    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code status_ec;
        fs::path entry_path = entry.path();

        if (entry.is_symlink(status_ec)) {
            if (!follow_symlinks_) {
                continue;
            }
            auto target = fs::canonical(entry_path, status_ec);
            if (status_ec) {
                spdlog::debug("[LocalSource] dangling symlink {}: {}", entry_path.string(), status_ec.message());
                continue;
            }
            entry_path = std::move(target);
        }

        const auto entry_string = entry_path.generic_string();
        if (fs::is_directory(entry_path, status_ec)) {
            listing.directories.push_back({entry_string, etag_for(entry_path)});
        } else if (fs::is_regular_file(entry_path, status_ec)) {
            auto size = fs::file_size(entry_path, status_ec);
            listing.files.push_back({entry_string, etag_for(entry_path), status_ec ? 0 : size});
        }
        listing.response_size += entry_string.size();
    }
    if (ec) {
        return Err<DirectoryListing>(errors::SourceError::from_error_code(ec, path));
    }

    listing.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return Ok<DirectoryListing, errors::SourceError>(std::move(listing));
}

} // namespace scanguard::sync
