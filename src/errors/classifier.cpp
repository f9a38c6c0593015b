#include "scanguard/errors/classifier.hpp"

namespace scanguard::errors {

bool default_should_retry(Severity severity, std::uint32_t failure_count) noexcept {
    switch (severity) {
        case Severity::Critical: return false;
        case Severity::High: return failure_count < 2;
        case Severity::Medium: return failure_count < 5;
        case Severity::Low: return failure_count < 10;
    }
    return false;
}

std::uint32_t default_max_retries(Severity severity) noexcept {
    switch (severity) {
        case Severity::Critical: return 1;
        case Severity::High: return 3;
        case Severity::Medium: return 5;
        case Severity::Low: return 10;
    }
    return 5;
}

bool SourceErrorClassifier::should_retry(const SourceScanFailure& failure) const {
    return default_should_retry(failure.error_severity, failure.failure_count);
}

} // namespace scanguard::errors
