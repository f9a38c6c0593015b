#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/core/time.hpp"
#include "scanguard/errors/failure.hpp"
#include "scanguard/errors/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::store {

/**
 * @brief Filter for FailureStore::list
 *
 * Defaults list the active failures (unresolved, not excluded), most
 * severe first, then most recent.
 */
struct ListFailuresQuery {
    std::optional<errors::SourceType> source_type;
    std::optional<std::string> source_id;
    std::optional<errors::SourceErrorType> error_type;
    std::optional<errors::Severity> severity;
    bool include_resolved = false;
    bool include_excluded = false;
    bool ready_for_retry = false;
    std::size_t limit = 50;
    std::size_t offset = 0;
};

/**
 * @brief Aggregate counts for one user
 *
 * Severity and by_* buckets count unresolved records only.
 */
struct FailureStats {
    std::uint64_t active_failures = 0;
    std::uint64_t resolved_failures = 0;
    std::uint64_t excluded_resources = 0;
    std::uint64_t critical_failures = 0;
    std::uint64_t high_failures = 0;
    std::uint64_t medium_failures = 0;
    std::uint64_t low_failures = 0;
    std::uint64_t ready_for_retry = 0;
    std::map<std::string, std::uint64_t> by_source_type;
    std::map<std::string, std::uint64_t> by_error_type;

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Default number of rows returned by retry_candidates
constexpr std::size_t kDefaultRetryCandidateLimit = 10;

/**
 * @brief Durable home of SourceScanFailure records
 *
 * Records are keyed by (user_id, source_type, resource_path).
 * Implementations serialize writers per key so concurrent record_failure
 * calls never lose an increment. All operations report storage faults as
 * Result errors and never throw.
 */
class FailureStore {
public:
    virtual ~FailureStore() = default;

    /**
     * @brief Insert or update the record for @p failure.key
     *
     * New: counts 1/1. Existing (resolved or not): counts +1, reopened,
     * policy snapshot refreshed. next_retry_at = now + backoff(failure_count).
     */
    virtual Result<errors::SourceScanFailure> record_failure(const errors::CreateSourceScanFailure& failure,
                                                             TimePoint now) = 0;

    virtual Result<std::optional<errors::SourceScanFailure>> find(const errors::FailureKey& key) const = 0;

    virtual Result<std::optional<errors::SourceScanFailure>> find_by_id(const std::string& user_id,
                                                                        std::uint64_t id) const = 0;

    /// @return true when an unresolved record was resolved
    virtual Result<bool> resolve(const errors::FailureKey& key, const std::string& method, TimePoint now) = 0;

    /// Clear consecutive count and exclusion, make eligible at @p now. Unresolved records only.
    virtual Result<bool> reset_for_retry(const errors::FailureKey& key, TimePoint now) = 0;

    virtual Result<bool> exclude(const errors::FailureKey& key, const std::string& notes, TimePoint now) = 0;

    virtual Result<std::vector<errors::SourceScanFailure>> list(const std::string& user_id,
                                                                const ListFailuresQuery& query,
                                                                TimePoint now) const = 0;

    /**
     * @brief Unresolved, not excluded, due (next_retry_at <= now) and
     *        failure_count below max_retries; critical first, then soonest
     */
    virtual Result<std::vector<errors::SourceScanFailure>> retry_candidates(
        const std::string& user_id,
        std::optional<errors::SourceType> source_type,
        std::size_t limit,
        TimePoint now) const = 0;

    virtual Result<FailureStats> stats(const std::string& user_id,
                                       std::optional<errors::SourceType> source_type,
                                       TimePoint now) const = 0;
};

} // namespace scanguard::store
