#pragma once

/**
 * @file memory_failure_store.hpp
 * @brief In-memory FailureStore guarded by a reader-writer lock
 *
 * WHY THIS FILE EXISTS:
 * The tracker needs somewhere to keep one failure record per
 * (user, source type, path) that many crawl workers can update at once.
 * This is that place for tests, short-lived crawls, and as the working
 * set behind JsonFileFailureStore.
 *
 * THREAD SAFETY PATTERN:
 * - Queries (find, list, retry_candidates, stats) take a shared_lock
 * - Mutations take a unique_lock, so the read-increment-write of an
 *   upsert is atomic per key and no failure_count update is lost
 *
 * EXAMPLE USAGE:
 * MemoryFailureStore store;
 * auto recorded = store.record_failure(create, Clock::now());
 * auto due = store.retry_candidates("alice", std::nullopt, 10, Clock::now());
 */

#include "scanguard/errors/retry_policy.hpp"
#include "scanguard/store/failure_store.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace scanguard::store {

class MemoryFailureStore : public FailureStore {
public:
    /// @p max_retry_delay_seconds caps the backoff written into next_retry_at
    explicit MemoryFailureStore(std::uint32_t max_retry_delay_seconds = errors::kMaxRetryDelaySeconds)
        : max_retry_delay_seconds_(max_retry_delay_seconds) {}

    Result<errors::SourceScanFailure> record_failure(const errors::CreateSourceScanFailure& failure,
                                                     TimePoint now) override;
    Result<std::optional<errors::SourceScanFailure>> find(const errors::FailureKey& key) const override;
    Result<std::optional<errors::SourceScanFailure>> find_by_id(const std::string& user_id,
                                                                std::uint64_t id) const override;
    Result<bool> resolve(const errors::FailureKey& key, const std::string& method, TimePoint now) override;
    Result<bool> reset_for_retry(const errors::FailureKey& key, TimePoint now) override;
    Result<bool> exclude(const errors::FailureKey& key, const std::string& notes, TimePoint now) override;
    Result<std::vector<errors::SourceScanFailure>> list(const std::string& user_id,
                                                        const ListFailuresQuery& query,
                                                        TimePoint now) const override;
    Result<std::vector<errors::SourceScanFailure>> retry_candidates(const std::string& user_id,
                                                                    std::optional<errors::SourceType> source_type,
                                                                    std::size_t limit,
                                                                    TimePoint now) const override;
    Result<FailureStats> stats(const std::string& user_id,
                               std::optional<errors::SourceType> source_type,
                               TimePoint now) const override;

    /// Every record, in id order
    [[nodiscard]] std::vector<errors::SourceScanFailure> snapshot() const;

    /// Replace the contents; ids continue after the largest loaded id
    void load(std::vector<errors::SourceScanFailure> records);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<errors::FailureKey, errors::SourceScanFailure, errors::FailureKeyHash> records_;
    std::uint64_t next_id_ = 1;
    std::uint32_t max_retry_delay_seconds_;
};

} // namespace scanguard::store
