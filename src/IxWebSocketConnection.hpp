#pragma once

#include "WebSocketConnection.hpp"
#include "Scheduler.hpp"
#include "Protocol.hpp"

#include <memory>
#include <string>

/**
 * @class IxWebSocketConnection
 * @brief IWebSocket implemented with the IXWebSocket library.
 *
 * IXWebSocket runs its own network thread and calls back from it. This class posts
 * every event to the client's scheduler, tagged with the connection attempt it
 * belongs to; events of an attempt that was closed or superseded in the meantime are
 * dropped on arrival, so the owner only ever sees events of the current connection.
 *
 * Automatic reconnection of IXWebSocket is disabled: the ConnectionManager decides
 * when to reconnect.
 *
 * Thread Safety:
 * - All public methods: scheduler context only
 * - Listener callbacks: scheduler context
 *
 * @note The scheduler must outlive this object.
 */
class IxWebSocketConnection : public IWebSocket
{
public:
    /**
     * @param scheduler Context on which listener callbacks are delivered
     * @param config Uses connectionTimeoutMs, enableCompression and pingIntervalSeconds
     */
    IxWebSocketConnection(IScheduler& scheduler, const Protocol::Config& config);

    /// @brief Stops the IXWebSocket thread; pending events are dropped
    ~IxWebSocketConnection() override;

    IxWebSocketConnection(const IxWebSocketConnection&) = delete;
    IxWebSocketConnection& operator=(const IxWebSocketConnection&) = delete;

    void SetListener(IWebSocketListener* listener) override;
    bool Open(const std::string& url) override;
    void Close(int code, const std::string& reason) override;
    bool IsOpen() const override;
    bool SendText(const std::string& text) override;
    bool SendBinary(const std::string& data) override;

private:
    class Impl;

    /// Shared with posted events, which hold it weakly
    std::shared_ptr<Impl> mImpl;
};
