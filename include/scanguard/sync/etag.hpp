#pragma once

#include <string>
#include <string_view>

namespace scanguard::sync {

/// Strip a weak "W/" prefix and one pair of surrounding quotes
[[nodiscard]] std::string normalize_etag(std::string_view etag);

/**
 * @brief Weak comparison of two ETags
 *
 * "W/\"abc\"", "\"abc\"" and "abc" all compare equal. An empty ETag never
 * matches anything, including another empty one.
 */
[[nodiscard]] bool compare_etags(std::string_view known, std::string_view current);

} // namespace scanguard::sync
