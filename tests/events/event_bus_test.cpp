#include <gtest/gtest.h>
#include "dm/events/event_bus.hpp"
#include "dm/events/events.hpp"

#include <stdexcept>
#include <vector>

using namespace dm::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received;

    bus.subscribe<NotFoundEvent>([&](const NotFoundEvent& e) {
        handler_called = true;
        received = e.name;
    });

    bus.emit(NotFoundEvent{"album", "Holidays"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received, "Holidays");
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { order.push_back(1); });
    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { order.push_back(2); });
    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { order.push_back(3); });

    bus.emit(ProgressEvent{"a.bin", 10, 100});

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int progress_count = 0;
    int missing_count = 0;

    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { progress_count++; });
    bus.subscribe<NotFoundEvent>([&](const NotFoundEvent&) { missing_count++; });

    bus.emit(ProgressEvent{"a.bin", 1, std::nullopt});
    bus.emit(NotFoundEvent{"path", "Docs"});
    bus.emit(ProgressEvent{"a.bin", 2, std::nullopt});

    EXPECT_EQ(progress_count, 2);
    EXPECT_EQ(missing_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<NotFoundEvent>([&](const NotFoundEvent&) { count++; });

    bus.emit(NotFoundEvent{"path", "x"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<NotFoundEvent>(id);

    bus.emit(NotFoundEvent{"path", "y"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(NotFoundEvent{"path", "x"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int count = 0;

    bus.subscribe<NotFoundEvent>([](const NotFoundEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<NotFoundEvent>([&](const NotFoundEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(NotFoundEvent{"album", "x"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 0u);

    auto id1 = bus.subscribe<NotFoundEvent>([](const NotFoundEvent&) {});
    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 1u);

    bus.subscribe<NotFoundEvent>([](const NotFoundEvent&) {});
    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 2u);

    bus.unsubscribe<NotFoundEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<NotFoundEvent>([](const NotFoundEvent&) {});
    bus.subscribe<ProgressEvent>([](const ProgressEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<NotFoundEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 0u);
}
