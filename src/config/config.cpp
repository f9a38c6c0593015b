#include "scanguard/config/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <type_traits>

namespace scanguard::config {

using json = nlohmann::json;

namespace {

template<typename T>
bool holds(const json& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string();
    } else if constexpr (std::is_unsigned_v<T>) {
        return value.is_number_unsigned();
    } else {
        return value.is_number();
    }
}

template<typename T>
const char* type_name() {
    if constexpr (std::is_same_v<T, bool>) {
        return "a boolean";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "a string";
    } else if constexpr (std::is_unsigned_v<T>) {
        return "a non-negative integer";
    } else {
        return "a number";
    }
}

/// Copy object[key] into target when present; wrong types name the full key
template<typename T>
Result<void> assign(T& target, const json& object, const std::string& section, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    const auto full_key = section.empty() ? std::string(key) : section + "." + key;
    if (!holds<T>(*it)) {
        return Err<void>("config key '" + full_key + "' must be " + type_name<T>());
    }
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool> && sizeof(T) < sizeof(std::uint64_t)) {
        if (it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return Err<void>("config key '" + full_key + "' must be at most "
                             + std::to_string(std::numeric_limits<T>::max()));
        }
    }
    target = it->template get<T>();
    return Ok();
}

Result<const json*> section_of(const json& document, const char* name) {
    auto it = document.find(name);
    if (it == document.end()) {
        return Ok<const json*>(nullptr);
    }
    if (!it->is_object()) {
        return Err<const json*>("config key '" + std::string(name) + "' must be an object");
    }
    return Ok<const json*>(&*it);
}

bool is_known_log_level(const std::string& level) {
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

} // namespace

#define SCANGUARD_ASSIGN(target, object, section, key)                  \
    do {                                                                \
        if (auto assigned = assign(target, object, section, key);       \
            assigned.is_error()) {                                      \
            return Err<AppConfig>(assigned.error());                    \
        }                                                               \
    } while (false)

Result<void> AppConfig::validate() const {
    if (auto loop_valid = loop_detection.validate(); loop_valid.is_error()) {
        return Err<void>("loop_detection: " + loop_valid.error());
    }
    if (!is_known_log_level(log_level)) {
        return Err<void>("unknown log_level '" + log_level + "'");
    }
    if (crawl.worker_threads < 1) {
        return Err<void>(std::string("crawl.worker_threads must be at least 1"));
    }
    if (crawl.user_id.empty()) {
        return Err<void>(std::string("crawl.user_id must not be empty"));
    }
    if (tracker.retry_candidate_limit < 1) {
        return Err<void>(std::string("tracker.retry_candidate_limit must be at least 1"));
    }
    if (tracker.max_backoff_secs < 1) {
        return Err<void>(std::string("tracker.max_backoff_secs must be at least 1"));
    }
    return Ok();
}

json AppConfig::to_json() const {
    json crawl_json{
        {"worker_threads", crawl.worker_threads},
        {"max_depth", crawl.max_depth},
        {"follow_symlinks", crawl.follow_symlinks},
        {"user_id", crawl.user_id},
        {"source_type", errors::to_string(crawl.source_type)},
    };
    if (crawl.source_id) {
        crawl_json["source_id"] = *crawl.source_id;
    }
    return {
        {"log_level", log_level},
        {"loop_detection", loop::config_to_json(loop_detection)},
        {"tracker", {
            {"store_path", tracker.store_path},
            {"retry_candidate_limit", tracker.retry_candidate_limit},
            {"max_backoff_secs", tracker.max_backoff_secs},
        }},
        {"crawl", std::move(crawl_json)},
    };
}

Result<AppConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<AppConfig>(std::string("config document must be a JSON object"));
    }

    AppConfig config;
    SCANGUARD_ASSIGN(config.log_level, document, "", "log_level");

    auto loop_section = section_of(document, "loop_detection");
    if (loop_section.is_error()) {
        return Err<AppConfig>(loop_section.error());
    }
    if (const json* loop = loop_section.value()) {
        const std::string section = "loop_detection";
        std::string preset;
        SCANGUARD_ASSIGN(preset, *loop, section, "preset");
        if (!preset.empty()) {
            auto base = loop::LoopDetectionConfig::preset(preset);
            if (!base) {
                return Err<AppConfig>("unknown loop_detection.preset '" + preset + "'");
            }
            config.loop_detection = *base;
        }

        auto& detection = config.loop_detection;
        SCANGUARD_ASSIGN(detection.enabled, *loop, section, "enabled");
        SCANGUARD_ASSIGN(detection.max_access_count, *loop, section, "max_access_count");
        SCANGUARD_ASSIGN(detection.time_window_secs, *loop, section, "time_window_secs");
        SCANGUARD_ASSIGN(detection.max_scan_duration_secs, *loop, section, "max_scan_duration_secs");
        SCANGUARD_ASSIGN(detection.min_scan_interval_secs, *loop, section, "min_scan_interval_secs");
        SCANGUARD_ASSIGN(detection.max_pattern_depth, *loop, section, "max_pattern_depth");
        SCANGUARD_ASSIGN(detection.max_tracked_directories, *loop, section, "max_tracked_directories");
        SCANGUARD_ASSIGN(detection.enable_pattern_analysis, *loop, section, "enable_pattern_analysis");
        SCANGUARD_ASSIGN(detection.reject_on_pattern, *loop, section, "reject_on_pattern");
        SCANGUARD_ASSIGN(detection.log_level, *loop, section, "log_level");
    }

    auto tracker_section = section_of(document, "tracker");
    if (tracker_section.is_error()) {
        return Err<AppConfig>(tracker_section.error());
    }
    if (const json* tracker = tracker_section.value()) {
        const std::string section = "tracker";
        SCANGUARD_ASSIGN(config.tracker.store_path, *tracker, section, "store_path");
        SCANGUARD_ASSIGN(config.tracker.retry_candidate_limit, *tracker, section, "retry_candidate_limit");
        SCANGUARD_ASSIGN(config.tracker.max_backoff_secs, *tracker, section, "max_backoff_secs");
    }

    auto crawl_section = section_of(document, "crawl");
    if (crawl_section.is_error()) {
        return Err<AppConfig>(crawl_section.error());
    }
    if (const json* crawl = crawl_section.value()) {
        const std::string section = "crawl";
        SCANGUARD_ASSIGN(config.crawl.worker_threads, *crawl, section, "worker_threads");
        SCANGUARD_ASSIGN(config.crawl.max_depth, *crawl, section, "max_depth");
        SCANGUARD_ASSIGN(config.crawl.follow_symlinks, *crawl, section, "follow_symlinks");
        SCANGUARD_ASSIGN(config.crawl.user_id, *crawl, section, "user_id");

        std::string source_type;
        SCANGUARD_ASSIGN(source_type, *crawl, section, "source_type");
        if (!source_type.empty()) {
            auto parsed = errors::parse_source_type(source_type);
            if (!parsed) {
                return Err<AppConfig>("unknown crawl.source_type '" + source_type + "'");
            }
            config.crawl.source_type = *parsed;
        }

        std::string source_id;
        SCANGUARD_ASSIGN(source_id, *crawl, section, "source_id");
        if (!source_id.empty()) {
            config.crawl.source_id = source_id;
        }
    }

    return Ok(std::move(config));
}

#undef SCANGUARD_ASSIGN

Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<AppConfig>("Failed to open config file: " + path.string());
    }
    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<AppConfig>("Config file is not valid JSON: " + path.string());
    }

    auto config = config_from_json(document);
    if (config.is_error()) {
        return Err<AppConfig>(path.string() + ": " + config.error());
    }
    spdlog::debug("[Config] loaded {}", path.string());
    return config;
}

} // namespace scanguard::config
