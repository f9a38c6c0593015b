/**
 * @file components.hpp
 * @brief Event-driven observability components
 *
 * WHY THIS FILE EXISTS:
 * Observability must never be able to break a crawl. Keeping logging and
 * counters in subscribers means the core only emits plain events.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * LoopDetector detector(config, system_clock_fn(), &bus);
 */

#pragma once

#include "scanguard/events/event_bus.hpp"
#include "scanguard/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace scanguard::events {

/**
 * @brief Logger component - writes every event through spdlog
 *
 * Rejections and failures log at warn, resolutions and summaries at info,
 * advisory cycle alerts at warn with the cycle rendered as a chain.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<LoopDetectedEvent>([this](const LoopDetectedEvent& e) {
            on_loop_detected(e);
        });

        bus_.subscribe<SlowScanDetectedEvent>([this](const SlowScanDetectedEvent& e) {
            on_slow_scan(e);
        });

        bus_.subscribe<ScanFailureRecordedEvent>([this](const ScanFailureRecordedEvent& e) {
            on_failure_recorded(e);
        });

        bus_.subscribe<ScanFailureResolvedEvent>([this](const ScanFailureResolvedEvent& e) {
            on_failure_resolved(e);
        });

        bus_.subscribe<DirectorySkippedEvent>([this](const DirectorySkippedEvent& e) {
            on_directory_skipped(e);
        });

        bus_.subscribe<CrawlCompletedEvent>([this](const CrawlCompletedEvent& e) {
            on_crawl_completed(e);
        });
    }

private:
    void on_loop_detected(const LoopDetectedEvent& e) {
        if (e.rejected) {
            spdlog::warn("[LoopDetected] kind={} path={} scan={} {}",
                         loop::to_string(e.kind), e.path, e.scan_label, e.description);
            return;
        }
        std::string chain;
        for (const auto& step : e.cycle) {
            if (!chain.empty()) {
                chain += " -> ";
            }
            chain += step;
        }
        spdlog::warn("[CycleAlert] path={} scan={} cycle={}", e.path, e.scan_label, chain);
    }

    void on_slow_scan(const SlowScanDetectedEvent& e) {
        spdlog::warn("[SlowScan] path={} scan={} duration={}ms limit={}s",
                     e.path, e.scan_label, e.duration.count(), e.limit_secs);
    }

    void on_failure_recorded(const ScanFailureRecordedEvent& e) {
        spdlog::warn("[ScanFailure] user={} source={} path={} type={} severity={} count={} consecutive={}",
                     e.user_id, errors::to_string(e.source_type), e.resource_path,
                     errors::to_string(e.error_type), errors::to_string(e.severity),
                     e.failure_count, e.consecutive_failures);
    }

    void on_failure_resolved(const ScanFailureResolvedEvent& e) {
        spdlog::info("[ScanResolved] user={} source={} path={} method={}",
                     e.user_id, errors::to_string(e.source_type), e.resource_path, e.resolution_method);
    }

    void on_directory_skipped(const DirectorySkippedEvent& e) {
        spdlog::info("[DirectorySkipped] crawl={} path={} reason={} {}",
                     e.crawl_id, e.resource_path, to_string(e.reason), e.detail);
    }

    void on_crawl_completed(const CrawlCompletedEvent& e) {
        spdlog::info("[CrawlCompleted] crawl={} source={} scanned={} skipped={} loops={} failed={} files={} duration={}ms",
                     e.crawl_id, errors::to_string(e.source_type), e.directories_scanned,
                     e.directories_skipped, e.loops_rejected, e.directories_failed,
                     e.files_found, e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counts events for dashboards
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto snapshot = metrics.to_json();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> loops_rejected{0};
        std::atomic<uint64_t> cycle_alerts{0};
        std::atomic<uint64_t> slow_scans{0};
        std::atomic<uint64_t> failures_recorded{0};
        std::atomic<uint64_t> critical_failures{0};
        std::atomic<uint64_t> failures_resolved{0};
        std::atomic<uint64_t> directories_skipped{0};
        std::atomic<uint64_t> crawls_completed{0};
        std::atomic<uint64_t> directories_scanned{0};
        std::atomic<uint64_t> files_found{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<LoopDetectedEvent>([this](const LoopDetectedEvent& e) {
            if (e.rejected) {
                stats_.loops_rejected++;
            } else {
                stats_.cycle_alerts++;
            }
        });

        bus_.subscribe<SlowScanDetectedEvent>([this](const SlowScanDetectedEvent&) {
            stats_.slow_scans++;
        });

        bus_.subscribe<ScanFailureRecordedEvent>([this](const ScanFailureRecordedEvent& e) {
            stats_.failures_recorded++;
            if (e.severity == errors::Severity::Critical) {
                stats_.critical_failures++;
            }
        });

        bus_.subscribe<ScanFailureResolvedEvent>([this](const ScanFailureResolvedEvent&) {
            stats_.failures_resolved++;
        });

        bus_.subscribe<DirectorySkippedEvent>([this](const DirectorySkippedEvent&) {
            stats_.directories_skipped++;
        });

        bus_.subscribe<CrawlCompletedEvent>([this](const CrawlCompletedEvent& e) {
            stats_.crawls_completed++;
            stats_.directories_scanned += e.directories_scanned;
            stats_.files_found += e.files_found;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"loops_rejected", stats_.loops_rejected.load()},
            {"cycle_alerts", stats_.cycle_alerts.load()},
            {"slow_scans", stats_.slow_scans.load()},
            {"failures_recorded", stats_.failures_recorded.load()},
            {"critical_failures", stats_.critical_failures.load()},
            {"failures_resolved", stats_.failures_resolved.load()},
            {"directories_skipped", stats_.directories_skipped.load()},
            {"crawls_completed", stats_.crawls_completed.load()},
            {"directories_scanned", stats_.directories_scanned.load()},
            {"files_found", stats_.files_found.load()},
        };
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace scanguard::events
