#include "scanguard/sync/etag.hpp"

namespace scanguard::sync {

std::string normalize_etag(std::string_view etag) {
    if (etag.size() >= 2 && (etag[0] == 'W' || etag[0] == 'w') && etag[1] == '/') {
        etag.remove_prefix(2);
    }
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag.remove_prefix(1);
        etag.remove_suffix(1);
    }
    return std::string(etag);
}

bool compare_etags(std::string_view known, std::string_view current) {
    const auto lhs = normalize_etag(known);
    if (lhs.empty()) {
        return false;
    }
    return lhs == normalize_etag(current);
}

} // namespace scanguard::sync
