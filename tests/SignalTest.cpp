#include "Signal.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(SignalTest, DeliversInConnectionOrder)
{
    Signal<int> signal;
    std::vector<std::string> calls;

    signal.Connect([&calls](int v) { calls.push_back("a" + std::to_string(v)); });
    signal.Connect([&calls](int v) { calls.push_back("b" + std::to_string(v)); });
    signal.Emit(1);

    std::vector<std::string> expected = { "a1", "b1" };
    EXPECT_EQ(expected, calls);
}

TEST(SignalTest, IdsAreNonZeroAndUnique)
{
    Signal<> signal;
    Signal<>::Id first = signal.Connect([]() {});
    Signal<>::Id second = signal.Connect([]() {});

    EXPECT_NE(0u, first);
    EXPECT_NE(first, second);
    EXPECT_EQ(2u, signal.Size());
}

TEST(SignalTest, DisconnectRemovesObserver)
{
    Signal<> signal;
    int calls = 0;
    Signal<>::Id id = signal.Connect([&calls]() { ++calls; });

    EXPECT_TRUE(signal.Disconnect(id));
    EXPECT_FALSE(signal.Disconnect(id));
    signal.Emit();

    EXPECT_EQ(0, calls);
}

TEST(SignalTest, ObserverRemovedDuringEmitIsSkipped)
{
    Signal<> signal;
    int secondCalls = 0;
    Signal<>::Id second = 0;

    signal.Connect([&]() { signal.Disconnect(second); });
    second = signal.Connect([&secondCalls]() { ++secondCalls; });

    signal.Emit();
    EXPECT_EQ(0, secondCalls);
}

TEST(SignalTest, ObserverAddedDuringEmitWaitsForNextEmit)
{
    Signal<> signal;
    int lateCalls = 0;
    bool added = false;

    signal.Connect([&]()
    {
        if (!added)
        {
            added = true;
            signal.Connect([&lateCalls]() { ++lateCalls; });
        }
    });

    signal.Emit();
    EXPECT_EQ(0, lateCalls);

    signal.Emit();
    EXPECT_EQ(1, lateCalls);
}

TEST(SignalTest, ObserverMayDisconnectItself)
{
    Signal<> signal;
    int calls = 0;
    Signal<>::Id self = 0;
    self = signal.Connect([&]()
    {
        ++calls;
        signal.Disconnect(self);
    });

    signal.Emit();
    signal.Emit();
    EXPECT_EQ(1, calls);
    EXPECT_EQ(0u, signal.Size());
}

TEST(SignalTest, DisconnectAll)
{
    Signal<const std::string&> signal;
    int calls = 0;
    signal.Connect([&calls](const std::string&) { ++calls; });
    signal.Connect([&calls](const std::string&) { ++calls; });

    signal.DisconnectAll();
    signal.Emit("x");

    EXPECT_EQ(0, calls);
    EXPECT_EQ(0u, signal.Size());
}
