#include "SubscriptionRegistry.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{
    class RecordingSender : public IFrameSender
    {
    public:
        bool SendFrame(const Stomp::Frame& frame) override
        {
            if (!connected || failSends)
                return false;
            frames.push_back(frame);
            return true;
        }

        bool IsConnected() const override { return connected; }

        std::vector<Stomp::Frame> Of(Stomp::Command command) const
        {
            std::vector<Stomp::Frame> out;
            for (const Stomp::Frame& frame : frames)
            {
                if (frame.command == command)
                    out.push_back(frame);
            }
            return out;
        }

        bool connected = false;
        bool failSends = false;
        std::vector<Stomp::Frame> frames;
    };

    class SubscriptionRegistryTest : public ::testing::Test
    {
    protected:
        SubscriptionRegistryTest() : mRegistry(mSender) {}

        void GoConnected()
        {
            mSender.connected = true;
            mRegistry.OnConnectionStateChanged(ConnectionState::Connected);
        }

        void GoDisconnected()
        {
            mSender.connected = false;
            mRegistry.OnConnectionStateChanged(ConnectionState::Disconnected);
        }

        SubscriptionRegistry::FrameHandler Recorder(std::vector<std::string>& bodies)
        {
            return [&bodies](const Stomp::Frame& frame) { bodies.push_back(frame.body); };
        }

        Stomp::Frame Message(const std::string& subscription, const std::string& destination,
                             const std::string& body)
        {
            Stomp::Frame frame(Stomp::Command::Message, body);
            if (!subscription.empty())
                frame.SetHeader("subscription", subscription);
            frame.SetHeader("destination", destination);
            return frame;
        }

        RecordingSender mSender;
        SubscriptionRegistry mRegistry;
    };
}

TEST_F(SubscriptionRegistryTest, SubscriptionWaitsForConnected)
{
    std::vector<std::string> bodies;
    SubscriptionRegistry::Handle handle = mRegistry.Subscribe("/queue/messages/42", Recorder(bodies));

    EXPECT_NE(0u, handle);
    EXPECT_TRUE(mRegistry.IsSubscribed("/queue/messages/42"));
    EXPECT_TRUE(mSender.frames.empty());
    EXPECT_TRUE(mRegistry.ActiveSubscriptionIds().empty());

    GoConnected();

    std::vector<Stomp::Frame> subscribes = mSender.Of(Stomp::Command::Subscribe);
    ASSERT_EQ(1u, subscribes.size());
    EXPECT_EQ("/queue/messages/42", subscribes[0].GetHeader("destination"));
    EXPECT_EQ("sub-1", subscribes[0].GetHeader("id"));
    EXPECT_EQ(std::vector<std::string>{ "sub-1" }, mRegistry.ActiveSubscriptionIds());
}

TEST_F(SubscriptionRegistryTest, SubscribeWhileConnectedIsImmediate)
{
    GoConnected();

    std::vector<std::string> bodies;
    mRegistry.Subscribe("/topic/news", Recorder(bodies));

    std::vector<Stomp::Frame> subscribes = mSender.Of(Stomp::Command::Subscribe);
    ASSERT_EQ(1u, subscribes.size());
    EXPECT_EQ("/topic/news", subscribes[0].GetHeader("destination"));
}

TEST_F(SubscriptionRegistryTest, RejectsInvalidOrDuplicateSubscriptions)
{
    std::vector<std::string> bodies;

    EXPECT_EQ(0u, mRegistry.Subscribe("", Recorder(bodies)));
    EXPECT_EQ(0u, mRegistry.Subscribe("/queue/a", SubscriptionRegistry::FrameHandler()));
    EXPECT_NE(0u, mRegistry.Subscribe("/queue/a", Recorder(bodies)));
    EXPECT_EQ(0u, mRegistry.Subscribe("/queue/a", Recorder(bodies)));
    EXPECT_EQ(1u, mRegistry.Size());
}

TEST_F(SubscriptionRegistryTest, ResubscribesSameDestinationsAfterReconnect)
{
    std::vector<std::string> bodies;
    mRegistry.Subscribe("/queue/messages/42", Recorder(bodies));
    mRegistry.Subscribe("/topic/broadcast", Recorder(bodies));

    GoConnected();
    GoDisconnected();

    EXPECT_TRUE(mRegistry.ActiveSubscriptionIds().empty());
    EXPECT_EQ(2u, mRegistry.Size());

    mSender.frames.clear();
    GoConnected();

    std::vector<Stomp::Frame> subscribes = mSender.Of(Stomp::Command::Subscribe);
    ASSERT_EQ(2u, subscribes.size());
    EXPECT_EQ("/queue/messages/42", subscribes[0].GetHeader("destination"));
    EXPECT_EQ("/topic/broadcast", subscribes[1].GetHeader("destination"));

    // Fresh ids for the new session
    EXPECT_EQ("sub-3", subscribes[0].GetHeader("id"));
    EXPECT_EQ("sub-4", subscribes[1].GetHeader("id"));
}

TEST_F(SubscriptionRegistryTest, UnsubscribeSendsUnsubscribeWhenActive)
{
    std::vector<std::string> bodies;
    SubscriptionRegistry::Handle handle = mRegistry.Subscribe("/queue/a", Recorder(bodies));
    GoConnected();

    EXPECT_TRUE(mRegistry.Unsubscribe(handle));
    EXPECT_FALSE(mRegistry.Unsubscribe(handle));

    std::vector<Stomp::Frame> unsubscribes = mSender.Of(Stomp::Command::Unsubscribe);
    ASSERT_EQ(1u, unsubscribes.size());
    EXPECT_EQ("sub-1", unsubscribes[0].GetHeader("id"));
    EXPECT_FALSE(mRegistry.IsSubscribed("/queue/a"));
}

TEST_F(SubscriptionRegistryTest, UnsubscribeWhileDisconnectedSendsNothing)
{
    std::vector<std::string> bodies;
    SubscriptionRegistry::Handle handle = mRegistry.Subscribe("/queue/a", Recorder(bodies));

    EXPECT_TRUE(mRegistry.Unsubscribe(handle));
    EXPECT_TRUE(mSender.frames.empty());
    EXPECT_EQ(0u, mRegistry.Size());
}

TEST_F(SubscriptionRegistryTest, UnsubscribeAllClearsEverything)
{
    std::vector<std::string> bodies;
    mRegistry.Subscribe("/queue/a", Recorder(bodies));
    mRegistry.Subscribe("/queue/b", Recorder(bodies));
    GoConnected();

    mRegistry.UnsubscribeAll();

    EXPECT_EQ(0u, mRegistry.Size());
    EXPECT_EQ(2u, mSender.Of(Stomp::Command::Unsubscribe).size());
}

TEST_F(SubscriptionRegistryTest, RoutesBySubscriptionThenDestination)
{
    std::vector<std::string> aBodies;
    std::vector<std::string> bBodies;
    mRegistry.Subscribe("/queue/a", Recorder(aBodies));
    mRegistry.Subscribe("/queue/b", Recorder(bBodies));
    GoConnected();

    EXPECT_TRUE(mRegistry.Route(Message("sub-2", "/queue/ignored", "by-id")));
    EXPECT_TRUE(mRegistry.Route(Message("", "/queue/a", "by-destination")));
    EXPECT_FALSE(mRegistry.Route(Message("sub-99", "/queue/unknown", "nobody")));

    EXPECT_EQ(std::vector<std::string>{ "by-destination" }, aBodies);
    EXPECT_EQ(std::vector<std::string>{ "by-id" }, bBodies);
}

TEST_F(SubscriptionRegistryTest, HandlerMayUnsubscribeItself)
{
    SubscriptionRegistry::Handle handle = 0;
    int calls = 0;
    handle = mRegistry.Subscribe("/queue/once",
        [&](const Stomp::Frame&)
        {
            ++calls;
            mRegistry.Unsubscribe(handle);
        });
    GoConnected();

    EXPECT_TRUE(mRegistry.Route(Message("sub-1", "/queue/once", "x")));
    EXPECT_FALSE(mRegistry.Route(Message("sub-1", "/queue/once", "y")));
    EXPECT_EQ(1, calls);
}

TEST_F(SubscriptionRegistryTest, FailedSubscribeIsRetriedOnNextConnect)
{
    std::vector<std::string> bodies;
    mRegistry.Subscribe("/queue/a", Recorder(bodies));

    mSender.failSends = true;
    GoConnected();
    EXPECT_TRUE(mRegistry.ActiveSubscriptionIds().empty());

    GoDisconnected();
    mSender.failSends = false;
    GoConnected();
    EXPECT_EQ(1u, mRegistry.ActiveSubscriptionIds().size());
}

TEST_F(SubscriptionRegistryTest, DestinationsKeepRegistrationOrder)
{
    std::vector<std::string> bodies;
    mRegistry.Subscribe("/queue/z", Recorder(bodies));
    mRegistry.Subscribe("/queue/a", Recorder(bodies));

    std::vector<std::string> expected = { "/queue/z", "/queue/a" };
    EXPECT_EQ(expected, mRegistry.Destinations());
}
