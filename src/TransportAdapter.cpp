#include "TransportAdapter.hpp"
#include "Logger.hpp"

/**
 * @file TransportAdapter.cpp
 * @brief Payload classification and event forwarding between IWebSocket and the
 *        connection manager.
 */

namespace
{
    const char* const kClientCommands[] = {
        "CONNECT", "SEND", "SUBSCRIBE", "UNSUBSCRIBE", "BEGIN",
        "COMMIT", "ABORT", "ACK", "NACK", "DISCONNECT"
    };

    // Printable preview for logs: NUL shown as ^@, newlines as \n, capped at 100 chars
    std::string Preview(const std::string& data)
    {
        std::string out;
        for (size_t i = 0; i < data.size() && out.size() < 100; ++i)
        {
            if (data[i] == '\0')
                out += "^@";
            else if (data[i] == '\n')
                out += "\\n";
            else
                out += data[i];
        }
        if (data.size() > 100)
            out += "...";
        return out;
    }
}

OutboundPayload OutboundPayload::FromFrame(const Stomp::Frame& frame)
{
    OutboundPayload payload;
    payload.kind = Kind::Frame;
    payload.data = Stomp::Encode(frame);
    return payload;
}

OutboundPayload OutboundPayload::Heartbeat()
{
    OutboundPayload payload;
    payload.kind = Kind::Heartbeat;
    payload.data = "\n";
    return payload;
}

OutboundPayload OutboundPayload::Text(const std::string& text)
{
    OutboundPayload payload;
    payload.kind = Kind::Text;
    payload.data = text;
    return payload;
}

OutboundPayload OutboundPayload::Binary(const std::string& bytes)
{
    OutboundPayload payload;
    payload.kind = Kind::Binary;
    payload.data = bytes;
    return payload;
}

TransportAdapter::TransportAdapter(std::unique_ptr<IWebSocket> socket)
    : mSocket(std::move(socket))
{
    mSocket->SetListener(this);
}

TransportAdapter::~TransportAdapter()
{
    mSocket->SetListener(nullptr);
}

void TransportAdapter::SetListener(ITransportListener* listener)
{
    mListener = listener;
}

bool TransportAdapter::Open(const std::string& url)
{
    return mSocket->Open(url);
}

void TransportAdapter::Close(int code, const std::string& reason)
{
    mSocket->Close(code, reason);
}

bool TransportAdapter::IsOpen() const
{
    return mSocket->IsOpen();
}

bool TransportAdapter::IsProtocolFrameText(const std::string& text)
{
    for (const char* command : kClientCommands)
    {
        if (text.compare(0, std::char_traits<char>::length(command), command) == 0)
            return true;
    }
    return false;
}

bool TransportAdapter::Send(const OutboundPayload& payload)
{
    if (!mSocket->IsOpen())
    {
        Logger::Instance().Warning("Transport", "Cannot send: connection not open");
        return false;
    }

    switch (payload.kind)
    {
    case OutboundPayload::Kind::Frame:
        return SendBinaryBytes(payload.data, "FRAME");

    case OutboundPayload::Kind::Heartbeat:
        return SendTextBytes(payload.data, "HEARTBEAT");

    case OutboundPayload::Kind::Text:
        // Untagged text that is really a frame would lose its terminator as text
        if (IsProtocolFrameText(payload.data))
            return SendBinaryBytes(payload.data, "FRAME->BINARY");
        return SendTextBytes(payload.data, "TEXT");

    case OutboundPayload::Kind::Binary:
    default:
        return SendBinaryBytes(payload.data, "BINARY");
    }
}

bool TransportAdapter::SendText(const std::string& text)
{
    return Send(OutboundPayload::Text(text));
}

bool TransportAdapter::SendBinaryBytes(const std::string& bytes, const char* what)
{
    if (!mSocket->SendBinary(bytes))
    {
        Logger::Instance().Error("Transport",
            std::string("Binary send failed [") + what + "] " + std::to_string(bytes.size()) + " bytes");
        return false;
    }

    mBytesSent += bytes.size();
    Logger::Instance().Debug("Transport",
        std::string("[SEND][") + what + "] " + Preview(bytes));
    return true;
}

bool TransportAdapter::SendTextBytes(const std::string& text, const char* what)
{
    if (!mSocket->SendText(text))
    {
        Logger::Instance().Error("Transport",
            std::string("Text send failed [") + what + "] " + std::to_string(text.size()) + " bytes");
        return false;
    }

    mBytesSent += text.size();
    Logger::Instance().Debug("Transport",
        std::string("[SEND][") + what + "] " + Preview(text));
    return true;
}

void TransportAdapter::OnSocketOpen()
{
    Logger::Instance().Info("Transport", "WebSocket open");
    if (mListener)
        mListener->OnTransportOpen();
}

void TransportAdapter::OnSocketMessage(const std::string& payload, bool isBinary)
{
    mBytesReceived += payload.size();
    Logger::Instance().Debug("Transport",
        std::string(isBinary ? "[RECV][BINARY] " : "[RECV][TEXT] ") + Preview(payload));

    if (mListener)
        mListener->OnTransportMessage(payload, isBinary);
}

void TransportAdapter::OnSocketClose(int code, const std::string& reason)
{
    if (code == 1006)
        Logger::Instance().Warning("Transport", "WebSocket closed abnormally (1006)");
    else
        Logger::Instance().Info("Transport",
            "WebSocket closed (" + std::to_string(code) + (reason.empty() ? "" : ": " + reason) + ")");

    if (mListener)
        mListener->OnTransportClose(code, reason);
}

void TransportAdapter::OnSocketError(const std::string& reason)
{
    Logger::Instance().Error("Transport", "WebSocket error: " + reason);
    if (mListener)
        mListener->OnTransportError(reason);
}
