#include "TransportAdapter.hpp"
#include "MockWebSocket.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace
{
    class RecordingListener : public ITransportListener
    {
    public:
        void OnTransportOpen() override { events.push_back("open"); }

        void OnTransportMessage(const std::string& payload, bool isBinary) override
        {
            events.push_back(std::string(isBinary ? "binary:" : "text:") + payload);
        }

        void OnTransportClose(int code, const std::string& reason) override
        {
            events.push_back("close:" + std::to_string(code) + ":" + reason);
        }

        void OnTransportError(const std::string& reason) override
        {
            events.push_back("error:" + reason);
        }

        std::vector<std::string> events;
    };

    class TransportAdapterTest : public ::testing::Test
    {
    protected:
        TransportAdapterTest()
        {
            std::unique_ptr<MockWebSocket> socket(new MockWebSocket());
            mSocket = socket.get();
            mAdapter.reset(new TransportAdapter(std::move(socket)));
            mAdapter->SetListener(&mListener);
        }

        void OpenSocket()
        {
            ASSERT_TRUE(mAdapter->Open("ws://localhost/ws"));
            mSocket->SimulateOpen();
        }

        MockWebSocket* mSocket = nullptr;
        std::unique_ptr<TransportAdapter> mAdapter;
        RecordingListener mListener;
    };
}

TEST_F(TransportAdapterTest, FrameIsSentAsBinaryWithTerminator)
{
    OpenSocket();

    Stomp::Frame frame = Stomp::MakeSend("/app/chat/stream", "{\"message\":\"hi\"}");
    ASSERT_TRUE(mAdapter->Send(OutboundPayload::FromFrame(frame)));

    ASSERT_EQ(1u, mSocket->sent.size());
    EXPECT_TRUE(mSocket->sent[0].binary);
    EXPECT_EQ(Stomp::Encode(frame), mSocket->sent[0].data);
    EXPECT_EQ('\0', mSocket->sent[0].data.back());
}

TEST_F(TransportAdapterTest, ProtocolLookingTextIsReclassifiedAsBinary)
{
    OpenSocket();

    const char* commands[] = { "CONNECT", "SEND", "SUBSCRIBE", "UNSUBSCRIBE", "BEGIN",
                               "COMMIT", "ABORT", "ACK", "NACK", "DISCONNECT" };

    for (const char* command : commands)
    {
        std::string text = std::string(command) + "\nid:1\n\n";
        text += '\0';

        mSocket->sent.clear();
        ASSERT_TRUE(mAdapter->SendText(text)) << command;
        ASSERT_EQ(1u, mSocket->sent.size()) << command;
        EXPECT_TRUE(mSocket->sent[0].binary) << command;

        // Byte for byte, terminator included
        EXPECT_EQ(text, mSocket->sent[0].data) << command;
    }
}

TEST_F(TransportAdapterTest, PlainTextPassesThroughAsText)
{
    OpenSocket();

    ASSERT_TRUE(mAdapter->SendText("{\"hello\":\"world\"}"));

    ASSERT_EQ(1u, mSocket->sent.size());
    EXPECT_FALSE(mSocket->sent[0].binary);
    EXPECT_EQ("{\"hello\":\"world\"}", mSocket->sent[0].data);
}

TEST_F(TransportAdapterTest, HeartbeatIsSentAsText)
{
    OpenSocket();

    ASSERT_TRUE(mAdapter->Send(OutboundPayload::Heartbeat()));

    ASSERT_EQ(1u, mSocket->sent.size());
    EXPECT_FALSE(mSocket->sent[0].binary);
    EXPECT_EQ("\n", mSocket->sent[0].data);
}

TEST_F(TransportAdapterTest, OpaqueBinaryIsUnmodified)
{
    OpenSocket();

    std::string bytes("\x01\x00\xff", 3);
    ASSERT_TRUE(mAdapter->Send(OutboundPayload::Binary(bytes)));

    ASSERT_EQ(1u, mSocket->sent.size());
    EXPECT_TRUE(mSocket->sent[0].binary);
    EXPECT_EQ(bytes, mSocket->sent[0].data);
    EXPECT_EQ(3u, mAdapter->BytesSent());
}

TEST_F(TransportAdapterTest, SendFailsFastWhenNotOpen)
{
    Stomp::Frame frame = Stomp::MakeSubscribe("/queue/messages/42", "sub-1");

    EXPECT_FALSE(mAdapter->Send(OutboundPayload::FromFrame(frame)));
    EXPECT_FALSE(mAdapter->SendText("hello"));
    EXPECT_TRUE(mSocket->sent.empty());
}

TEST_F(TransportAdapterTest, SocketRejectionIsReported)
{
    OpenSocket();
    mSocket->failSends = true;

    EXPECT_FALSE(mAdapter->SendText("hello"));
    EXPECT_EQ(0u, mAdapter->BytesSent());
}

TEST_F(TransportAdapterTest, ForwardsSocketEventsInOrder)
{
    OpenSocket();
    mSocket->SimulateMessage("abc", true);
    mSocket->SimulateMessage("\n", false);
    mSocket->SimulateError("boom");
    mSocket->SimulateClose(1006, "");

    std::vector<std::string> expected = { "open", "binary:abc", "text:\n", "error:boom", "close:1006:" };
    EXPECT_EQ(expected, mListener.events);
    EXPECT_EQ(4u, mAdapter->BytesReceived());
}

TEST_F(TransportAdapterTest, CloseClosesTheSocket)
{
    OpenSocket();
    mAdapter->Close(1000, "bye");

    EXPECT_FALSE(mAdapter->IsOpen());
    EXPECT_EQ(1, mSocket->closeCalls);
    EXPECT_EQ(1000, mSocket->lastCloseCode);
    EXPECT_EQ("bye", mSocket->lastCloseReason);
}

TEST(TransportAdapterStaticTest, ProtocolFrameDetection)
{
    EXPECT_TRUE(TransportAdapter::IsProtocolFrameText("SEND\n"));
    EXPECT_TRUE(TransportAdapter::IsProtocolFrameText("NACK\nid:1\n\n"));
    EXPECT_FALSE(TransportAdapter::IsProtocolFrameText("MESSAGE\n"));
    EXPECT_FALSE(TransportAdapter::IsProtocolFrameText("send\n"));
    EXPECT_FALSE(TransportAdapter::IsProtocolFrameText(""));
    EXPECT_FALSE(TransportAdapter::IsProtocolFrameText("hello"));
}
