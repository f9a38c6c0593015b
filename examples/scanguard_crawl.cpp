#include "scanguard/config/config.hpp"
#include "scanguard/errors/registry.hpp"
#include "scanguard/events/components.hpp"
#include "scanguard/events/event_bus.hpp"
#include "scanguard/loop/detector.hpp"
#include "scanguard/store/json_file_failure_store.hpp"
#include "scanguard/store/memory_failure_store.hpp"
#include "scanguard/sync/directory_state_store.hpp"
#include "scanguard/sync/local_source.hpp"
#include "scanguard/sync/smart_sync.hpp"
#include "scanguard/tracking/failure_tracker.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config file.json] [--preset production|development|minimal]"
                 " [--state failures.json] [--log-level level] <root>...\n";
}

struct Arguments {
    std::optional<fs::path> config_path;
    std::optional<std::string> preset;
    std::optional<std::string> state_path;
    std::optional<std::string> log_level;
    std::vector<std::string> roots;
};

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = fs::path(argv[++i]);
        } else if (arg == "--preset" && has_value) {
            args.preset = argv[++i];
        } else if (arg == "--state" && has_value) {
            args.state_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            args.log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        } else {
            args.roots.push_back(arg);
        }
    }
    if (args.roots.empty()) {
        return std::nullopt;
    }
    return args;
}

std::string normalize_root(const std::string& root) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::path(root), ec);
    return ec ? fs::path(root).generic_string() : canonical.generic_string();
}

fs::path directory_state_path(const std::string& store_path) {
    return fs::path(store_path + ".dirs.json");
}

void load_directory_state(scanguard::sync::DirectoryStateStore& directories,
                          const std::string& user_id,
                          const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }
    std::ifstream input(path);
    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        spdlog::warn("Ignoring unreadable directory state {}", path.string());
        return;
    }
    if (auto loaded = directories.load_json(user_id, document); loaded.is_error()) {
        spdlog::warn("Ignoring directory state {}: {}", path.string(), loaded.error());
    }
}

void save_directory_state(const scanguard::sync::DirectoryStateStore& directories,
                          const std::string& user_id,
                          const fs::path& path) {
    std::ofstream output(path, std::ios::trunc);
    output << directories.to_json(user_id).dump(2);
    if (!output) {
        spdlog::error("Failed to write directory state {}", path.string());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return 2;
    }

    scanguard::config::AppConfig config;
    if (args->config_path) {
        auto loaded = scanguard::config::load_config(*args->config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (args->preset) {
        auto preset = scanguard::loop::LoopDetectionConfig::preset(*args->preset);
        if (!preset) {
            spdlog::error("Unknown preset '{}'", *args->preset);
            return 1;
        }
        config.loop_detection = *preset;
    }
    if (args->state_path) {
        config.tracker.store_path = *args->state_path;
    }
    if (args->log_level) {
        config.log_level = *args->log_level;
    }
    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error());
        return 1;
    }
    if (config.crawl.source_type != scanguard::errors::SourceType::Local) {
        spdlog::error("This program crawls local folders; crawl.source_type '{}' is not supported",
                      scanguard::errors::to_string(config.crawl.source_type));
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::debug("Configuration: {}", config.to_json().dump());

    scanguard::events::EventBus event_bus;
    scanguard::events::LoggerComponent logger(event_bus);
    scanguard::events::MetricsComponent metrics(event_bus);

    std::shared_ptr<scanguard::store::FailureStore> failure_store;
    if (config.tracker.store_path.empty()) {
        failure_store = std::make_shared<scanguard::store::MemoryFailureStore>(config.tracker.max_backoff_secs);
    } else {
        auto opened = scanguard::store::JsonFileFailureStore::open(config.tracker.store_path,
                                                                   config.tracker.max_backoff_secs);
        if (opened.is_error()) {
            spdlog::error("{}", opened.error());
            return 1;
        }
        failure_store = std::move(opened.value());
    }

    auto tracker = std::make_shared<scanguard::tracking::FailureTracker>(
        failure_store, scanguard::errors::ClassifierRegistry::with_defaults(),
        scanguard::system_clock_fn(), &event_bus);
    auto detector = std::make_shared<scanguard::loop::LoopDetector>(
        config.loop_detection, scanguard::system_clock_fn(), &event_bus);
    auto directories = std::make_shared<scanguard::sync::DirectoryStateStore>();
    auto source = std::make_shared<scanguard::sync::LocalDirectorySource>(config.crawl.follow_symlinks);

    const auto& user_id = config.crawl.user_id;
    if (!config.tracker.store_path.empty()) {
        load_directory_state(*directories, user_id, directory_state_path(config.tracker.store_path));
    }

    scanguard::sync::SmartSyncOptions options;
    options.worker_threads = config.crawl.worker_threads;
    options.max_depth = config.crawl.max_depth;
    scanguard::sync::SmartSyncService sync(source, detector, tracker, directories,
                                           options, config.crawl.source_id, &event_bus);

    json roots = json::array();
    for (const auto& raw_root : args->roots) {
        const auto root = normalize_root(raw_root);
        auto result = sync.evaluate_and_sync(user_id, root);
        if (!result) {
            roots.push_back(json{{"root", root}, {"skipped", true}});
            continue;
        }
        auto summary = result->to_json();
        summary["root"] = root;
        summary["skipped"] = false;
        roots.push_back(std::move(summary));
    }

    if (!config.tracker.store_path.empty()) {
        save_directory_state(*directories, user_id, directory_state_path(config.tracker.store_path));
    }

    json report{
        {"roots", std::move(roots)},
        {"loop_detection", detector->get_metrics().to_json()},
        {"events", metrics.to_json()},
    };

    auto stats = tracker->get_stats(user_id);
    if (stats.is_ok()) {
        report["failure_stats"] = stats.value().to_json();
    } else {
        spdlog::warn("Failure stats unavailable: {}", stats.error());
    }
    report["retry_candidates"] = sync.scan_tracker().get_retry_candidates(user_id);

    std::cout << report.dump(2) << std::endl;
    return 0;
}
