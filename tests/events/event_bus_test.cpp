#include "scanguard/events/event_bus.hpp"
#include "scanguard/events/events.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scanguard::events;

TEST(EventBus, DeliversToSubscribersOfThatType) {
    EventBus bus;

    std::vector<std::string> rejected_paths;
    int skipped = 0;
    bus.subscribe<LoopDetectedEvent>([&](const LoopDetectedEvent& e) { rejected_paths.push_back(e.path); });
    bus.subscribe<DirectorySkippedEvent>([&](const DirectorySkippedEvent&) { skipped++; });

    LoopDetectedEvent loop;
    loop.path = "/data/a";
    bus.emit(loop);

    DirectorySkippedEvent skip;
    skip.resource_path = "/data/b";
    bus.emit(skip);
    bus.emit(skip);

    ASSERT_EQ(rejected_paths.size(), 1u);
    EXPECT_EQ(rejected_paths[0], "/data/a");
    EXPECT_EQ(skipped, 2);
}

TEST(EventBus, MultipleSubscribersAllRun) {
    EventBus bus;
    int count = 0;

    for (int i = 0; i < 3; ++i) {
        bus.subscribe<CrawlCompletedEvent>([&](const CrawlCompletedEvent&) { count++; });
    }
    bus.emit(CrawlCompletedEvent{});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe<ScanFailureResolvedEvent>([&](const ScanFailureResolvedEvent&) { count++; });

    bus.emit(ScanFailureResolvedEvent{});
    bus.unsubscribe<ScanFailureResolvedEvent>(id);
    bus.emit(ScanFailureResolvedEvent{});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ScanFailureResolvedEvent>(), 0u);
}

TEST(EventBus, EmitWithoutSubscribersIsHarmless) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(SlowScanDetectedEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int delivered = 0;

    bus.subscribe<ScanFailureRecordedEvent>([](const ScanFailureRecordedEvent&) {
        throw std::runtime_error("listener failed");
    });
    bus.subscribe<ScanFailureRecordedEvent>([&](const ScanFailureRecordedEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(ScanFailureRecordedEvent{}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;
    int late = 0;

    bus.subscribe<LoopDetectedEvent>([&](const LoopDetectedEvent&) {
        bus.subscribe<SlowScanDetectedEvent>([&](const SlowScanDetectedEvent&) { late++; });
    });

    bus.emit(LoopDetectedEvent{});
    bus.emit(SlowScanDetectedEvent{});

    EXPECT_EQ(late, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::size_t> files{0};

    bus.subscribe<CrawlCompletedEvent>([&](const CrawlCompletedEvent& e) { files += e.files_found; });

    boost::asio::thread_pool pool(4);
    for (int i = 0; i < 100; ++i) {
        boost::asio::post(pool, [&bus] {
            CrawlCompletedEvent event;
            event.files_found = 2;
            bus.emit(event);
        });
    }
    pool.join();

    EXPECT_EQ(files.load(), 200u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    auto first = bus.subscribe<LoopDetectedEvent>([](const LoopDetectedEvent&) {});
    bus.subscribe<LoopDetectedEvent>([](const LoopDetectedEvent&) {});
    bus.subscribe<CrawlCompletedEvent>([](const CrawlCompletedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<LoopDetectedEvent>(), 2u);

    bus.unsubscribe<LoopDetectedEvent>(first);
    EXPECT_EQ(bus.subscriber_count<LoopDetectedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<LoopDetectedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<CrawlCompletedEvent>(), 0u);
}
