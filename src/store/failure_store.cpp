#include "scanguard/store/failure_store.hpp"

namespace scanguard::store {

nlohmann::json FailureStats::to_json() const {
    return nlohmann::json{
        {"active_failures", active_failures},
        {"resolved_failures", resolved_failures},
        {"excluded_resources", excluded_resources},
        {"critical_failures", critical_failures},
        {"high_failures", high_failures},
        {"medium_failures", medium_failures},
        {"low_failures", low_failures},
        {"ready_for_retry", ready_for_retry},
        {"by_source_type", by_source_type},
        {"by_error_type", by_error_type},
    };
}

} // namespace scanguard::store
