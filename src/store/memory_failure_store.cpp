#include "scanguard/store/memory_failure_store.hpp"

#include "scanguard/errors/retry_policy.hpp"

#include <algorithm>
#include <mutex>

namespace scanguard::store {

using errors::FailureKey;
using errors::Severity;
using errors::SourceScanFailure;

namespace {

bool is_due(const SourceScanFailure& failure, TimePoint now) {
    return !failure.resolved
        && !failure.user_excluded
        && failure.next_retry_at
        && *failure.next_retry_at <= now;
}

bool matches(const SourceScanFailure& failure, const ListFailuresQuery& query, TimePoint now) {
    if (query.source_type && failure.key.source_type != *query.source_type) return false;
    if (query.source_id && failure.source_id != query.source_id) return false;
    if (query.error_type && failure.error_type != *query.error_type) return false;
    if (query.severity && failure.error_severity != *query.severity) return false;
    if (!query.include_resolved && failure.resolved) return false;
    if (!query.include_excluded && failure.user_excluded) return false;
    if (query.ready_for_retry && !is_due(failure, now)) return false;
    return true;
}

} // namespace

Result<SourceScanFailure> MemoryFailureStore::record_failure(const errors::CreateSourceScanFailure& failure,
                                                             TimePoint now) {
    if (failure.key.user_id.empty()) {
        return Err<SourceScanFailure>(std::string("failure record requires a user id"));
    }
    if (failure.key.resource_path.empty()) {
        return Err<SourceScanFailure>(std::string("failure record requires a resource path"));
    }

    std::unique_lock lock(mutex_);

    auto [it, inserted] = records_.try_emplace(failure.key);
    auto& record = it->second;
    if (inserted) {
        record.id = next_id_++;
        record.key = failure.key;
        record.failure_count = 1;
        record.consecutive_failures = 1;
        record.first_failure_at = now;
        record.created_at = now;
    } else {
        record.failure_count += 1;
        record.consecutive_failures += 1;
        record.resolved = false;
        record.resolved_at.reset();
        record.resolution_method.reset();
    }

    record.last_failure_at = now;
    record.updated_at = now;
    if (failure.source_id) {
        record.source_id = failure.source_id;
    }
    record.error_type = failure.error_type;
    record.error_severity = failure.error_severity;
    record.error_message = failure.error_message;
    record.error_code = failure.error_code;
    record.http_status_code = failure.http_status_code;
    record.response_time_ms = failure.response_time_ms;
    record.response_size_bytes = failure.response_size_bytes;
    record.estimated_item_count = failure.estimated_item_count;
    record.resource_depth = errors::path_depth(failure.key.resource_path);
    record.diagnostic_data = failure.diagnostic_data;
    record.retry_strategy = failure.retry_strategy;
    record.retry_delay_seconds = failure.retry_delay_seconds;
    record.max_retries = failure.max_retries;
    record.next_retry_at = errors::next_retry_time(now, record.retry_strategy,
                                                   record.retry_delay_seconds, record.failure_count,
                                                   max_retry_delay_seconds_);
    return Ok(record);
}

Result<std::optional<SourceScanFailure>> MemoryFailureStore::find(const FailureKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Ok(std::optional<SourceScanFailure>());
    }
    return Ok(std::optional<SourceScanFailure>(it->second));
}

Result<std::optional<SourceScanFailure>> MemoryFailureStore::find_by_id(const std::string& user_id,
                                                                        std::uint64_t id) const {
    std::shared_lock lock(mutex_);
    for (const auto& [key, record] : records_) {
        if (record.id == id && key.user_id == user_id) {
            return Ok(std::optional<SourceScanFailure>(record));
        }
    }
    return Ok(std::optional<SourceScanFailure>());
}

Result<bool> MemoryFailureStore::resolve(const FailureKey& key, const std::string& method, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end() || it->second.resolved) {
        return Ok(false);
    }

    auto& record = it->second;
    record.resolved = true;
    record.resolved_at = now;
    record.resolution_method = method;
    record.consecutive_failures = 0;
    record.next_retry_at.reset();
    record.updated_at = now;
    return Ok(true);
}

Result<bool> MemoryFailureStore::reset_for_retry(const FailureKey& key, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end() || it->second.resolved) {
        return Ok(false);
    }

    auto& record = it->second;
    record.consecutive_failures = 0;
    record.last_retry_at = now;
    record.next_retry_at = now;
    record.user_excluded = false;
    record.updated_at = now;
    return Ok(true);
}

Result<bool> MemoryFailureStore::exclude(const FailureKey& key, const std::string& notes, TimePoint now) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Ok(false);
    }

    auto& record = it->second;
    record.user_excluded = true;
    if (!notes.empty()) {
        record.user_notes = notes;
    }
    record.updated_at = now;
    return Ok(true);
}

Result<std::vector<SourceScanFailure>> MemoryFailureStore::list(const std::string& user_id,
                                                                const ListFailuresQuery& query,
                                                                TimePoint now) const {
    std::vector<SourceScanFailure> rows;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [key, record] : records_) {
            if (key.user_id == user_id && matches(record, query, now)) {
                rows.push_back(record);
            }
        }
    }

    std::sort(rows.begin(), rows.end(), [](const SourceScanFailure& a, const SourceScanFailure& b) {
        if (a.error_severity != b.error_severity) {
            return a.error_severity > b.error_severity;
        }
        if (a.last_failure_at != b.last_failure_at) {
            return a.last_failure_at > b.last_failure_at;
        }
        return a.id < b.id;
    });

    if (query.offset >= rows.size()) {
        return Ok(std::vector<SourceScanFailure>());
    }
    rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(query.offset));
    if (rows.size() > query.limit) {
        rows.resize(query.limit);
    }
    return Ok(std::move(rows));
}

Result<std::vector<SourceScanFailure>> MemoryFailureStore::retry_candidates(
    const std::string& user_id,
    std::optional<errors::SourceType> source_type,
    std::size_t limit,
    TimePoint now) const {
    std::vector<SourceScanFailure> rows;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [key, record] : records_) {
            if (key.user_id != user_id) continue;
            if (source_type && key.source_type != *source_type) continue;
            if (!is_due(record, now)) continue;
            if (record.failure_count >= record.max_retries) continue;
            rows.push_back(record);
        }
    }

    std::sort(rows.begin(), rows.end(), [](const SourceScanFailure& a, const SourceScanFailure& b) {
        const bool a_critical = a.error_severity == Severity::Critical;
        const bool b_critical = b.error_severity == Severity::Critical;
        if (a_critical != b_critical) {
            return a_critical;
        }
        if (*a.next_retry_at != *b.next_retry_at) {
            return *a.next_retry_at < *b.next_retry_at;
        }
        return a.id < b.id;
    });

    if (rows.size() > limit) {
        rows.resize(limit);
    }
    return Ok(std::move(rows));
}

Result<FailureStats> MemoryFailureStore::stats(const std::string& user_id,
                                               std::optional<errors::SourceType> source_type,
                                               TimePoint now) const {
    FailureStats stats;

    std::shared_lock lock(mutex_);
    for (const auto& [key, record] : records_) {
        if (key.user_id != user_id) continue;
        if (source_type && key.source_type != *source_type) continue;

        if (record.user_excluded) {
            ++stats.excluded_resources;
        }
        if (record.resolved) {
            ++stats.resolved_failures;
            continue;
        }

        ++stats.active_failures;
        switch (record.error_severity) {
            case Severity::Critical: ++stats.critical_failures; break;
            case Severity::High: ++stats.high_failures; break;
            case Severity::Medium: ++stats.medium_failures; break;
            case Severity::Low: ++stats.low_failures; break;
        }
        if (is_due(record, now)) {
            ++stats.ready_for_retry;
        }
        ++stats.by_source_type[errors::to_string(key.source_type)];
        ++stats.by_error_type[errors::to_string(record.error_type)];
    }
    return Ok(std::move(stats));
}

std::vector<SourceScanFailure> MemoryFailureStore::snapshot() const {
    std::vector<SourceScanFailure> rows;
    {
        std::shared_lock lock(mutex_);
        rows.reserve(records_.size());
        for (const auto& entry : records_) {
            rows.push_back(entry.second);
        }
    }
    std::sort(rows.begin(), rows.end(), [](const SourceScanFailure& a, const SourceScanFailure& b) {
        return a.id < b.id;
    });
    return rows;
}

void MemoryFailureStore::load(std::vector<SourceScanFailure> records) {
    std::unique_lock lock(mutex_);
    records_.clear();
    next_id_ = 1;
    for (auto& record : records) {
        next_id_ = std::max(next_id_, record.id + 1);
        auto key = record.key;
        records_[std::move(key)] = std::move(record);
    }
}

std::size_t MemoryFailureStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace scanguard::store
