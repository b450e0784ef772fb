//
// Created by Giuseppe Francione on 02/02/26.
//

#include <gtest/gtest.h>
#include "../libtreedump/include/event_bus.hpp"
#include "../libtreedump/include/events.hpp"
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace treedump;

TEST(EventBus, DeliversOnlyToMatchingType) {
    EventBus bus;
    int captured = 0;
    int errors = 0;
    bus.subscribe<FileCapturedEvent>([&captured](const FileCapturedEvent&) { ++captured; });
    bus.subscribe<FileCaptureErrorEvent>([&errors](const FileCaptureErrorEvent&) { ++errors; });

    bus.publish(FileCapturedEvent{});
    bus.publish(FileCapturedEvent{});
    bus.publish(FileCaptureErrorEvent{"x", "gone"});
    // nobody listens for this one
    bus.publish(FileCaptureStartEvent{"y"});

    EXPECT_EQ(captured, 2);
    EXPECT_EQ(errors, 1);
    EXPECT_EQ(bus.subscriber_count<FileCapturedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<FileCaptureStartEvent>(), 0u);
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        bus.subscribe<FileCaptureStartEvent>([i, &order](const FileCaptureStartEvent&) { order.push_back(i); });
    }
    bus.publish(FileCaptureStartEvent{"a"});
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(EventBus, PublishFromHandlerIsRejected) {
    EventBus bus;
    bus.subscribe<FileCaptureStartEvent>([&bus](const FileCaptureStartEvent& e) {
        bus.publish(FileCaptureErrorEvent{e.path, "nested"});
    });
    EXPECT_THROW(bus.publish(FileCaptureStartEvent{"a"}), std::logic_error);

    // the bus is usable again once the failed dispatch unwound
    int errors = 0;
    EXPECT_NO_THROW(bus.subscribe<FileCaptureErrorEvent>([&errors](const FileCaptureErrorEvent&) { ++errors; }));
    bus.publish(FileCaptureErrorEvent{"b", "direct"});
    EXPECT_EQ(errors, 1);
}

TEST(EventBus, SubscribeFromHandlerIsRejected) {
    EventBus bus;
    bus.subscribe<FileCaptureStartEvent>([&bus](const FileCaptureStartEvent&) {
        bus.subscribe<FileCapturedEvent>([](const FileCapturedEvent&) {});
    });
    EXPECT_THROW(bus.publish(FileCaptureStartEvent{"a"}), std::logic_error);
    EXPECT_EQ(bus.subscriber_count<FileCapturedEvent>(), 0u);
}

TEST(EventBus, ConcurrentPublishersAreSerialised) {
    EventBus bus;
    int delivered = 0; // only touched by handlers
    bus.subscribe<FileCaptureStartEvent>([&delivered](const FileCaptureStartEvent&) { ++delivered; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&bus] {
            for (int i = 0; i < 500; ++i) bus.publish(FileCaptureStartEvent{"f"});
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(delivered, 4000);
}
