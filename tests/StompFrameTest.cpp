#include "StompFrame.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace Stomp;

namespace
{
    std::string Bytes(const char* literal, size_t size)
    {
        return std::string(literal, size);
    }
}

TEST(StompFrameTest, EncodesSubscribeWithSingleTerminator)
{
    Frame frame = MakeSubscribe("/queue/messages/42", "sub-1");

    std::string expected = Bytes("SUBSCRIBE\nid:sub-1\ndestination:/queue/messages/42\n\n\0", 52);
    EXPECT_EQ(expected, Encode(frame));
}

TEST(StompFrameTest, EncodesBodyBeforeTerminator)
{
    Frame frame(Command::Send, "{\"a\":1}");
    frame.SetHeader("destination", "/app/chat");

    std::string encoded = Encode(frame);
    EXPECT_EQ(Bytes("SEND\ndestination:/app/chat\n\n{\"a\":1}\0", 36), encoded);
    EXPECT_EQ(kTerminator, encoded.back());
    EXPECT_EQ(1, std::count(encoded.begin(), encoded.end(), '\0'));
}

TEST(StompFrameTest, ConnectFrameCarriesHandshakeHeaders)
{
    Frame frame = MakeConnect("chat.example.com", 10000, 5000,
                              { { "Authorization", "Bearer abc:def" } });

    EXPECT_EQ(Command::Connect, frame.command);
    EXPECT_EQ("1.2,1.1,1.0", frame.GetHeader("accept-version"));
    EXPECT_EQ("chat.example.com", frame.GetHeader("host"));
    EXPECT_EQ("10000,5000", frame.GetHeader("heart-beat"));

    // CONNECT headers are sent unescaped
    std::string encoded = Encode(frame);
    EXPECT_NE(std::string::npos, encoded.find("Authorization:Bearer abc:def\n"));
}

TEST(StompFrameTest, SendBuilderAddsContentHeaders)
{
    Frame frame = MakeSend("/app/chat/stream", "hello");

    EXPECT_EQ("/app/chat/stream", frame.GetHeader("destination"));
    EXPECT_EQ("application/json", frame.GetHeader("content-type"));
    EXPECT_EQ("5", frame.GetHeader("content-length"));
}

TEST(StompFrameTest, DecodesMessageFrame)
{
    std::string data = Bytes("MESSAGE\nsubscription:sub-1\nmessage-id:7\ndestination:/queue/messages/42\n\n{}\0", 75);

    Frame frame;
    std::string error;
    ASSERT_TRUE(Decode(data, frame, &error)) << error;

    EXPECT_EQ(Command::Message, frame.command);
    EXPECT_EQ("sub-1", frame.GetHeader("subscription"));
    EXPECT_EQ("7", frame.GetHeader("message-id"));
    EXPECT_EQ("/queue/messages/42", frame.GetHeader("destination"));
    EXPECT_EQ("{}", frame.body);
}

TEST(StompFrameTest, RejectsFrameWithoutTerminator)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode("MESSAGE\ndestination:/q\n\nbody", frame, &error));
    EXPECT_EQ("missing NUL terminator", error);
}

TEST(StompFrameTest, RejectsUnknownCommand)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("HELLO\n\n\0", 8), frame, &error));
    EXPECT_NE(std::string::npos, error.find("unknown command"));

    // Commands are case-sensitive
    EXPECT_FALSE(Decode(Bytes("message\n\n\0", 10), frame, &error));
}

TEST(StompFrameTest, RejectsMalformedHeaderLine)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("MESSAGE\nno-colon-here\n\n\0", 24), frame, &error));
    EXPECT_NE(std::string::npos, error.find("malformed header"));
}

TEST(StompFrameTest, RejectsUnterminatedHeaderBlock)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("MESSAGE\ndestination:/q\0", 23), frame, &error));
    EXPECT_EQ("header block not terminated before NUL", error);
}

TEST(StompFrameTest, RejectsUndefinedEscapeSequence)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("MESSAGE\nkey:bad\\tvalue\n\n\0", 25), frame, &error));
    EXPECT_NE(std::string::npos, error.find("invalid escape sequence"));
}

TEST(StompFrameTest, HeaderEscapingRoundTrips)
{
    Frame frame(Command::Message, "x");
    frame.SetHeader("weird:name", "line1\nline2\\end\rcolon:");

    std::string encoded = Encode(frame);
    EXPECT_NE(std::string::npos, encoded.find("weird\\cname:line1\\nline2\\\\end\\rcolon\\c\n"));

    Frame decoded;
    ASSERT_TRUE(Decode(encoded, decoded));
    EXPECT_EQ(frame, decoded);
}

TEST(StompFrameTest, ConnectedHeadersAreNotUnescaped)
{
    Frame frame;
    ASSERT_TRUE(Decode(Bytes("CONNECTED\nserver:x\\y\n\n\0", 23), frame));
    EXPECT_EQ("x\\y", frame.GetHeader("server"));
}

TEST(StompFrameTest, ContentLengthBodyMayContainNul)
{
    std::string body = Bytes("ab\0cd", 5);
    Frame frame(Command::Message, body);
    frame.SetHeader("content-length", "5");

    Frame decoded;
    std::string error;
    ASSERT_TRUE(Decode(Encode(frame), decoded, &error)) << error;
    EXPECT_EQ(body, decoded.body);
}

TEST(StompFrameTest, RejectsBodyLongerThanContentLength)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("MESSAGE\ncontent-length:2\n\nabc\0", 30), frame, &error));
    EXPECT_EQ("body longer than content-length", error);

    EXPECT_FALSE(Decode(Bytes("MESSAGE\ncontent-length:x\n\nabc\0", 30), frame, &error));
    EXPECT_NE(std::string::npos, error.find("invalid content-length"));
}

TEST(StompFrameTest, RepeatedHeaderKeepsFirstValue)
{
    Frame frame;
    ASSERT_TRUE(Decode(Bytes("MESSAGE\nfoo:first\nfoo:second\n\n\0", 31), frame));

    ASSERT_EQ(1u, frame.headers.size());
    EXPECT_EQ("first", frame.GetHeader("foo"));
}

TEST(StompFrameTest, AcceptsCrLfLinesAndSurroundingHeartbeats)
{
    Frame frame;
    std::string error;
    ASSERT_TRUE(Decode(Bytes("\r\n\nRECEIPT\r\nreceipt-id:77\r\n\r\n\0\n\n", 32), frame, &error)) << error;

    EXPECT_EQ(Command::Receipt, frame.command);
    EXPECT_EQ("77", frame.GetHeader("receipt-id"));
}

TEST(StompFrameTest, RejectsTrailingDataAfterTerminator)
{
    Frame frame;
    std::string error;

    EXPECT_FALSE(Decode(Bytes("RECEIPT\n\n\0junk", 14), frame, &error));
    EXPECT_EQ("trailing data after frame terminator", error);
}

TEST(StompFrameTest, DecodeAtWalksConsecutiveFrames)
{
    Frame first(Command::Message, "one");
    first.SetHeader("destination", "/a");
    Frame second(Command::Message, "two");
    second.SetHeader("destination", "/b");

    std::string data = Encode(first) + "\n" + Encode(second);

    Frame decoded;
    size_t next = 0;
    ASSERT_TRUE(DecodeAt(data, 0, decoded, nullptr, &next));
    EXPECT_EQ(first, decoded);

    ASSERT_TRUE(DecodeAt(data, next, decoded, nullptr, &next));
    EXPECT_EQ(second, decoded);
    EXPECT_EQ(data.size(), SkipEols(data, next));
}

TEST(StompFrameTest, RecognizesHeartbeats)
{
    EXPECT_TRUE(IsHeartbeat("\n"));
    EXPECT_TRUE(IsHeartbeat("\r\n\n"));
    EXPECT_FALSE(IsHeartbeat(""));
    EXPECT_FALSE(IsHeartbeat("\r"));
    EXPECT_FALSE(IsHeartbeat("\nMESSAGE"));
}

TEST(StompFrameTest, DecodeOfEncodeIsIdentity)
{
    Frame frame = MakeSend("/app/chat/stream", "{\"userId\":\"42\",\"message\":\"hi: there\"}");
    frame.SetHeader("receipt", "r-1");

    Frame decoded;
    ASSERT_TRUE(Decode(Encode(frame), decoded));
    EXPECT_EQ(frame, decoded);

    Frame disconnect = MakeDisconnect("bye");
    ASSERT_TRUE(Decode(Encode(disconnect), decoded));
    EXPECT_EQ(disconnect, decoded);
}

TEST(StompFrameTest, BodyWithNulGetsContentLength)
{
    Frame frame(Command::Message, Bytes("a\0b", 3));
    frame.SetHeader("subscription", "sub-1");

    std::string encoded = Encode(frame);
    EXPECT_EQ(Bytes("MESSAGE\nsubscription:sub-1\ncontent-length:3\n\na\0b\0", 49), encoded);

    Frame decoded;
    std::string error;
    ASSERT_TRUE(Decode(encoded, decoded, &error)) << error;
    EXPECT_EQ(Bytes("a\0b", 3), decoded.body);

    Frame expected = frame;
    expected.SetHeader("content-length", "3");
    EXPECT_EQ(expected, decoded);

    // With the length already present the frame is encoded unchanged
    EXPECT_EQ(encoded, Encode(decoded));
    ASSERT_TRUE(Decode(Encode(expected), decoded));
    EXPECT_EQ(expected, decoded);
}

TEST(StompFrameTest, FrameHeaderHelpers)
{
    Frame frame(Command::Send);
    frame.SetHeader("a", "1");
    frame.SetHeader("b", "2");
    frame.SetHeader("a", "3");

    ASSERT_EQ(2u, frame.headers.size());
    EXPECT_EQ("a", frame.headers[0].first);
    EXPECT_EQ("3", frame.GetHeader("a"));
    EXPECT_EQ("none", frame.GetHeader("c", "none"));
    EXPECT_EQ(nullptr, frame.FindHeader("c"));

    EXPECT_TRUE(frame.RemoveHeader("a"));
    EXPECT_FALSE(frame.RemoveHeader("a"));
    EXPECT_FALSE(frame.HasHeader("a"));
}

TEST(StompFrameTest, CommandNames)
{
    Command command;
    ASSERT_TRUE(ParseCommand("UNSUBSCRIBE", command));
    EXPECT_EQ(Command::Unsubscribe, command);
    EXPECT_EQ("ERROR", CommandToString(Command::Error));
    EXPECT_FALSE(ParseCommand("", command));
}
