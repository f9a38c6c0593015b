#pragma once

#include "scanguard/store/memory_failure_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

namespace scanguard::store {

/**
 * @brief FailureStore that survives restarts as a JSON snapshot on disk
 *
 * Reads and upserts go through an in-memory working set; after every
 * successful mutation the whole set is written to "<path>.tmp" and
 * renamed over @p path, so a crash leaves either the old or the new
 * snapshot, never a torn file. Timestamps are epoch milliseconds.
 *
 * When the snapshot cannot be written the in-memory change stands and
 * the mutation returns an error describing the I/O failure.
 */
class JsonFileFailureStore final : public FailureStore {
public:
    /// Open @p path, loading it when it exists; a missing file is an empty store
    [[nodiscard]] static Result<std::unique_ptr<JsonFileFailureStore>> open(
        std::filesystem::path path,
        std::uint32_t max_retry_delay_seconds = errors::kMaxRetryDelaySeconds);

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

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    JsonFileFailureStore(std::filesystem::path path, std::uint32_t max_retry_delay_seconds)
        : path_(std::move(path)), memory_(max_retry_delay_seconds) {}

    Result<void> load();
    Result<void> persist();

    template<typename T>
    Result<T> persist_after(Result<T> outcome);

    std::filesystem::path path_;
    MemoryFailureStore memory_;
    std::mutex persist_mutex_;
};

} // namespace scanguard::store
