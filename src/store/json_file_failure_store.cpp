#include "scanguard/store/json_file_failure_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace scanguard::store {

namespace fs = std::filesystem;
using json = nlohmann::json;
using errors::SourceScanFailure;

namespace {

constexpr int kSnapshotVersion = 1;

} // namespace

Result<std::unique_ptr<JsonFileFailureStore>> JsonFileFailureStore::open(fs::path path,
                                                                        std::uint32_t max_retry_delay_seconds) {
    if (path.empty()) {
        return Err<std::unique_ptr<JsonFileFailureStore>>(std::string("failure store path is empty"));
    }

    std::unique_ptr<JsonFileFailureStore> store(new JsonFileFailureStore(std::move(path), max_retry_delay_seconds));
    if (auto loaded = store->load(); loaded.is_error()) {
        return Err<std::unique_ptr<JsonFileFailureStore>>(loaded.error());
    }
    spdlog::debug("[FailureStore] opened {} ({} records)", store->path_.string(), store->memory_.size());
    return Ok(std::move(store));
}

Result<void> JsonFileFailureStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Ok();
    }

    std::ifstream input(path_);
    if (!input) {
        return Err<void>(std::string("Failed to open failure store: ") + path_.string());
    }
    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<void>(std::string("Failure store is not valid JSON: ") + path_.string());
    }

    const auto version = document.value("version", 0);
    if (version != kSnapshotVersion) {
        return Err<void>("Unsupported failure store version " + std::to_string(version) + " in " + path_.string());
    }

    const auto failures = document.find("failures");
    if (failures == document.end() || !failures->is_array()) {
        return Err<void>(std::string("Failure store has no failures array: ") + path_.string());
    }

    std::vector<SourceScanFailure> records;
    records.reserve(failures->size());
    for (const auto& entry : *failures) {
        auto record = errors::failure_from_json(entry);
        if (record.is_error()) {
            return Err<void>(path_.string() + ": " + record.error());
        }
        records.push_back(std::move(record.value()));
    }
    memory_.load(std::move(records));
    return Ok();
}

Result<void> JsonFileFailureStore::persist() {
    std::lock_guard lock(persist_mutex_);

    json failures = json::array();
    for (const auto& record : memory_.snapshot()) {
        failures.push_back(errors::failure_to_json(record));
    }
    const json document{
        {"version", kSnapshotVersion},
        {"failures", std::move(failures)},
    };

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Err<void>("Failed to create directory " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    auto staging = path_;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to open staging file: ") + staging.string());
        }
        output << document.dump(2);
        output.flush();
        if (!output) {
            return Err<void>(std::string("Failed to write staging file: ") + staging.string());
        }
    }

    fs::rename(staging, path_, ec);
    if (ec) {
        return Err<void>("Failed to replace " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

template<typename T>
Result<T> JsonFileFailureStore::persist_after(Result<T> outcome) {
    if (outcome.is_error()) {
        return outcome;
    }
    if (auto written = persist(); written.is_error()) {
        spdlog::error("[FailureStore] {}", written.error());
        return Err<T>(written.error());
    }
    return outcome;
}

Result<SourceScanFailure> JsonFileFailureStore::record_failure(const errors::CreateSourceScanFailure& failure,
                                                               TimePoint now) {
    return persist_after(memory_.record_failure(failure, now));
}

Result<std::optional<SourceScanFailure>> JsonFileFailureStore::find(const errors::FailureKey& key) const {
    return memory_.find(key);
}

Result<std::optional<SourceScanFailure>> JsonFileFailureStore::find_by_id(const std::string& user_id,
                                                                          std::uint64_t id) const {
    return memory_.find_by_id(user_id, id);
}

Result<bool> JsonFileFailureStore::resolve(const errors::FailureKey& key, const std::string& method, TimePoint now) {
    auto outcome = memory_.resolve(key, method, now);
    if (outcome.is_ok() && !outcome.value()) {
        return outcome;
    }
    return persist_after(std::move(outcome));
}

Result<bool> JsonFileFailureStore::reset_for_retry(const errors::FailureKey& key, TimePoint now) {
    auto outcome = memory_.reset_for_retry(key, now);
    if (outcome.is_ok() && !outcome.value()) {
        return outcome;
    }
    return persist_after(std::move(outcome));
}

Result<bool> JsonFileFailureStore::exclude(const errors::FailureKey& key, const std::string& notes, TimePoint now) {
    auto outcome = memory_.exclude(key, notes, now);
    if (outcome.is_ok() && !outcome.value()) {
        return outcome;
    }
    return persist_after(std::move(outcome));
}

Result<std::vector<SourceScanFailure>> JsonFileFailureStore::list(const std::string& user_id,
                                                                  const ListFailuresQuery& query,
                                                                  TimePoint now) const {
    return memory_.list(user_id, query, now);
}

Result<std::vector<SourceScanFailure>> JsonFileFailureStore::retry_candidates(
    const std::string& user_id,
    std::optional<errors::SourceType> source_type,
    std::size_t limit,
    TimePoint now) const {
    return memory_.retry_candidates(user_id, source_type, limit, now);
}

Result<FailureStats> JsonFileFailureStore::stats(const std::string& user_id,
                                                 std::optional<errors::SourceType> source_type,
                                                 TimePoint now) const {
    return memory_.stats(user_id, source_type, now);
}

} // namespace scanguard::store
