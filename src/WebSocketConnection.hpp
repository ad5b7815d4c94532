#pragma once

#include <string>

/**
 * @class IWebSocketListener
 * @brief Receives events of a raw WebSocket connection.
 *
 * Implementations of IWebSocket deliver every callback on the client's scheduler
 * context, never on a library thread.
 */
class IWebSocketListener
{
public:
    virtual ~IWebSocketListener() = default;

    /// @brief The WebSocket handshake completed
    virtual void OnSocketOpen() = 0;

    /**
     * @brief A complete WebSocket message arrived.
     *
     * @param payload Message bytes
     * @param isBinary true for a binary message, false for text
     */
    virtual void OnSocketMessage(const std::string& payload, bool isBinary) = 0;

    /**
     * @brief The connection closed (remote close or network loss).
     *
     * @param code WebSocket close code (1006 = closed abnormally)
     * @param reason Close reason, may be empty
     */
    virtual void OnSocketClose(int code, const std::string& reason) = 0;

    /// @brief The connection attempt or the connection failed
    virtual void OnSocketError(const std::string& reason) = 0;
};

/**
 * @class IWebSocket
 * @brief Raw bidirectional message-oriented connection.
 *
 * This is the host platform's socket abstraction as seen by the transport adapter.
 * IxWebSocketConnection implements it over IXWebSocket; tests substitute a mock.
 *
 * After Close() returns, no further callbacks are delivered for that connection
 * attempt; the owner performs its own state transition.
 */
class IWebSocket
{
public:
    virtual ~IWebSocket() = default;

    /// @brief Set the event receiver (must outlive the connection, or be reset to nullptr)
    virtual void SetListener(IWebSocketListener* listener) = 0;

    /**
     * @brief Start connecting (non-blocking). The outcome arrives as OnSocketOpen or
     *        OnSocketError.
     *
     * @return false if the attempt could not be started
     */
    virtual bool Open(const std::string& url) = 0;

    /// @brief Close the connection; silently succeeds if not open
    virtual void Close(int code, const std::string& reason) = 0;

    virtual bool IsOpen() const = 0;

    /// @return false if not open or the send failed
    virtual bool SendText(const std::string& text) = 0;

    /// @return false if not open or the send failed
    virtual bool SendBinary(const std::string& data) = 0;
};
