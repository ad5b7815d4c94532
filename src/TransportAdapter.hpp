#pragma once

#include "WebSocketConnection.hpp"
#include "StompFrame.hpp"

#include <cstddef>
#include <memory>
#include <string>

/**
 * @struct OutboundPayload
 * @brief An outgoing transport message tagged with what it carries.
 *
 * The sender always knows whether it is sending a protocol frame, so the text/binary
 * decision is made from the tag instead of inspecting the bytes:
 * - Frame: encoded STOMP frame, always sent as binary so the NUL terminator survives
 * - Heartbeat: a single EOL, sent as text
 * - Text: arbitrary text; protocol-looking text is still sent as binary (see
 *   TransportAdapter::IsProtocolFrameText)
 * - Binary: opaque bytes, sent unmodified
 */
struct OutboundPayload
{
    enum class Kind
    {
        Frame,
        Heartbeat,
        Text,
        Binary
    };

    Kind kind = Kind::Text;
    std::string data;

    static OutboundPayload FromFrame(const Stomp::Frame& frame);
    static OutboundPayload Heartbeat();
    static OutboundPayload Text(const std::string& text);
    static OutboundPayload Binary(const std::string& bytes);
};

/**
 * @class ITransportListener
 * @brief Receives transport events from the TransportAdapter.
 */
class ITransportListener
{
public:
    virtual ~ITransportListener() = default;

    virtual void OnTransportOpen() = 0;
    virtual void OnTransportMessage(const std::string& payload, bool isBinary) = 0;
    virtual void OnTransportClose(int code, const std::string& reason) = 0;
    virtual void OnTransportError(const std::string& reason) = 0;
};

/**
 * @class TransportAdapter
 * @brief Uniform send/receive surface over a raw IWebSocket, with the NUL fix.
 *
 * Some host text-frame transports strip the trailing NUL byte from a text message.
 * That byte is the mandatory STOMP frame terminator, so a frame sent as text reaches
 * the broker corrupted. Binary messages are not affected, so the adapter sends every
 * protocol frame as a binary message with exactly the frame's bytes, terminator
 * included. Everything else goes out as it came in.
 *
 * The adapter does not buffer: Send() on a connection that is not open fails at once.
 *
 * @note Owns the raw connection. Scheduler context only.
 */
class TransportAdapter : private IWebSocketListener
{
public:
    /**
     * @param socket Raw connection; ownership is taken
     */
    explicit TransportAdapter(std::unique_ptr<IWebSocket> socket);
    ~TransportAdapter() override;

    TransportAdapter(const TransportAdapter&) = delete;
    TransportAdapter& operator=(const TransportAdapter&) = delete;

    void SetListener(ITransportListener* listener);

    /// @brief Start connecting; see IWebSocket::Open
    bool Open(const std::string& url);

    /// @brief Close without a callback for this connection
    void Close(int code = 1000, const std::string& reason = "");

    bool IsOpen() const;

    /**
     * @brief Send a tagged payload.
     *
     * @return false if the connection is not open or the socket rejected the send
     */
    bool Send(const OutboundPayload& payload);

    /**
     * @brief Send untagged text, reclassifying protocol frames as binary.
     *
     * Equivalent to Send(OutboundPayload::Text(text)).
     */
    bool SendText(const std::string& text);

    /**
     * @brief True if @p text starts with a client command token (CONNECT, SEND,
     *        SUBSCRIBE, UNSUBSCRIBE, BEGIN, COMMIT, ABORT, ACK, NACK, DISCONNECT).
     */
    static bool IsProtocolFrameText(const std::string& text);

    /// @brief Bytes handed to the socket since construction
    size_t BytesSent() const { return mBytesSent; }

    /// @brief Bytes received since construction
    size_t BytesReceived() const { return mBytesReceived; }

private:
    void OnSocketOpen() override;
    void OnSocketMessage(const std::string& payload, bool isBinary) override;
    void OnSocketClose(int code, const std::string& reason) override;
    void OnSocketError(const std::string& reason) override;

    bool SendBinaryBytes(const std::string& bytes, const char* what);
    bool SendTextBytes(const std::string& text, const char* what);

    std::unique_ptr<IWebSocket> mSocket;
    ITransportListener* mListener = nullptr;
    size_t mBytesSent = 0;
    size_t mBytesReceived = 0;
};
