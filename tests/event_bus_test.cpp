#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "placer/core/EventBus.hpp"
#include "placer/core/MainThreadQueue.hpp"

using placer::core::EventBus;
using placer::core::MutationEvent;
using placer::core::Payload;
using placer::core::PayloadAs;
using placer::core::SelectionEvent;

TEST(EventBusTest, DeliversPayloadToEveryHandlerInOrder)
{
    EventBus bus;
    std::vector<std::string> seen;
    const auto first = EventBus::MakeHandler([&](const Payload& payload) {
        const SelectionEvent* event = PayloadAs<SelectionEvent>(payload);
        ASSERT_NE(event, nullptr);
        seen.push_back("first:" + event->assetId.value_or("none"));
    });
    const auto second = EventBus::MakeHandler([&](const Payload&) { seen.push_back("second"); });

    EXPECT_TRUE(bus.On("asset:selected", first));
    EXPECT_TRUE(bus.On("asset:selected", second));
    bus.Emit("asset:selected", SelectionEvent{std::string("crate-1")});

    ASSERT_EQ(seen.size(), 2U);
    EXPECT_EQ(seen[0], "first:crate-1");
    EXPECT_EQ(seen[1], "second");
}

TEST(EventBusTest, SameHandlerRegistersOnlyOnce)
{
    EventBus bus;
    int calls = 0;
    const auto handler = EventBus::MakeHandler([&](const Payload&) { ++calls; });

    EXPECT_TRUE(bus.On("grid:toggle", handler));
    EXPECT_FALSE(bus.On("grid:toggle", handler));
    bus.Emit("grid:toggle");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.HandlerCount("grid:toggle"), 1U);
}

TEST(EventBusTest, OffRemovesOnlyThatHandler)
{
    EventBus bus;
    int a = 0;
    int b = 0;
    const auto handlerA = EventBus::MakeHandler([&](const Payload&) { ++a; });
    const auto handlerB = EventBus::MakeHandler([&](const Payload&) { ++b; });
    bus.On("asset:deleted", handlerA);
    bus.On("asset:deleted", handlerB);

    EXPECT_TRUE(bus.Off("asset:deleted", handlerA));
    EXPECT_FALSE(bus.Off("asset:deleted", handlerA));
    bus.Emit("asset:deleted", MutationEvent{});

    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);
}

TEST(EventBusTest, EmitWithoutHandlersIsNoOp)
{
    EventBus bus;
    bus.Emit("nobody:listens");
    EXPECT_EQ(bus.HandlerCount("nobody:listens"), 0U);
}

TEST(EventBusTest, OnceFiresASingleTimeEvenWhenReentered)
{
    EventBus bus;
    int calls = 0;
    bus.Once("terrain:loaded", [&](const Payload&) {
        ++calls;
        bus.Emit("terrain:loaded");
    });

    bus.Emit("terrain:loaded");
    bus.Emit("terrain:loaded");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.HandlerCount("terrain:loaded"), 0U);
}

TEST(EventBusTest, HandlerRemovedDuringEmitStillSeesCurrentEvent)
{
    EventBus bus;
    int later = 0;
    EventBus::HandlerPtr second = EventBus::MakeHandler([&](const Payload&) { ++later; });
    const auto first = EventBus::MakeHandler([&](const Payload&) { bus.Off("asset:updated", second); });
    bus.On("asset:updated", first);
    bus.On("asset:updated", second);

    bus.Emit("asset:updated");
    bus.Emit("asset:updated");

    // The snapshot of the first emit still contained it; the second emit did not.
    EXPECT_EQ(later, 1);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopDelivery)
{
    EventBus bus;
    int reached = 0;
    bus.On("asset:added", EventBus::MakeHandler([](const Payload&) { throw std::runtime_error("boom"); }));
    bus.On("asset:added", EventBus::MakeHandler([&](const Payload&) { ++reached; }));

    bus.Emit("asset:added", MutationEvent{});
    EXPECT_EQ(reached, 1);

    bus.On("asset:deleted", EventBus::MakeHandler([](const Payload&) { throw 42; }));
    bus.On("asset:deleted", EventBus::MakeHandler([&](const Payload&) { ++reached; }));
    EXPECT_NO_THROW(bus.Emit("asset:deleted", MutationEvent{}));
    EXPECT_EQ(reached, 2);
}

TEST(EventBusTest, ClearDropsOneTopicOrAll)
{
    EventBus bus;
    bus.On("a", EventBus::MakeHandler([](const Payload&) {}));
    bus.On("b", EventBus::MakeHandler([](const Payload&) {}));

    bus.Clear(std::string("a"));
    EXPECT_EQ(bus.HandlerCount("a"), 0U);
    EXPECT_EQ(bus.HandlerCount("b"), 1U);

    bus.Clear();
    EXPECT_EQ(bus.HandlerCount("b"), 0U);
}

TEST(EventBusTest, PayloadAsRejectsOtherTypes)
{
    const Payload payload = SelectionEvent{};
    EXPECT_NE(PayloadAs<SelectionEvent>(payload), nullptr);
    EXPECT_EQ(PayloadAs<MutationEvent>(payload), nullptr);
}

TEST(MainThreadQueueTest, DrainRunsPostedTasksOnce)
{
    placer::core::MainThreadQueue queue;
    int runs = 0;
    queue.Post([&]() { ++runs; });
    queue.Post([&]() { ++runs; });
    queue.Post({});

    EXPECT_EQ(queue.PendingCount(), 2U);
    EXPECT_EQ(queue.Drain(), 2U);
    EXPECT_EQ(queue.Drain(), 0U);
    EXPECT_EQ(runs, 2);
}

TEST(MainThreadQueueTest, TaskPostedWhileDrainingWaitsForNextDrain)
{
    placer::core::MainThreadQueue queue;
    int runs = 0;
    queue.Post([&]() {
        ++runs;
        queue.Post([&]() { ++runs; });
    });

    queue.Drain();
    EXPECT_EQ(runs, 1);
    queue.Drain();
    EXPECT_EQ(runs, 2);
}
