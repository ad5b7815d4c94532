#include "IxWebSocketConnection.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <atomic>

// IXWebSocket library includes - low-level WebSocket protocol handling
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>

/**
 * @file IxWebSocketConnection.cpp
 * @brief IXWebSocket-backed raw connection.
 *
 * Event flow:
 *   IXWebSocket thread -> OnMessageCallback -> IScheduler::Post -> Impl::Deliver
 *   -> IWebSocketListener (scheduler context)
 */

/**
 * @class IxWebSocketConnection::Impl
 * @brief Holds the ix::WebSocket and the attempt bookkeeping.
 */
class IxWebSocketConnection::Impl
{
public:
    Impl(IScheduler& s, const Protocol::Config& c)
        : scheduler(s), config(c) {}

    IScheduler& scheduler;
    Protocol::Config config;

    /// Receiver of events; touched on the scheduler context only
    IWebSocketListener* listener = nullptr;

    /// Attempt counter; bumped on Open() and after Close() so stale events are recognized
    std::atomic<uint64_t> generation{ 0 };

    /// Set once ix::initNetSystem() succeeded
    bool netSystemReady = false;

    /// Declared last: destroyed first, which joins the IXWebSocket thread
    ix::WebSocket ws;

    void Deliver(uint64_t eventGeneration, ix::WebSocketMessageType type, const std::string& payload,
                 bool binary, int closeCode, const std::string& reason)
    {
        if (eventGeneration != generation.load())
        {
            Logger::Instance().Debug("IxWebSocket", "Dropping event of a superseded connection");
            return;
        }

        if (!listener)
        {
            Logger::Instance().Warning("IxWebSocket", "No listener set - event dropped");
            return;
        }

        switch (type)
        {
        case ix::WebSocketMessageType::Open:
            listener->OnSocketOpen();
            break;

        case ix::WebSocketMessageType::Message:
            listener->OnSocketMessage(payload, binary);
            break;

        case ix::WebSocketMessageType::Close:
            listener->OnSocketClose(closeCode, reason);
            break;

        case ix::WebSocketMessageType::Error:
            listener->OnSocketError(reason);
            break;

        default:
            break;
        }
    }
};

IxWebSocketConnection::IxWebSocketConnection(IScheduler& scheduler, const Protocol::Config& config)
    : mImpl(std::make_shared<Impl>(scheduler, config))
{
    Impl* impl = mImpl.get();
    std::weak_ptr<Impl> weak = mImpl;

    // Reconnection is owned by the ConnectionManager
    impl->ws.disableAutomaticReconnection();

    if (config.pingIntervalSeconds > 0)
        impl->ws.setPingInterval(config.pingIntervalSeconds);

    if (config.enableCompression)
        impl->ws.enablePerMessageDeflate();
    else
        impl->ws.disablePerMessageDeflate();

    // IXWebSocket counts the handshake timeout in whole seconds
    impl->ws.setHandshakeTimeout(std::max(1, config.connectionTimeoutMs / 1000));

    impl->ws.addSubProtocol("v12.stomp");
    impl->ws.addSubProtocol("v11.stomp");
    impl->ws.addSubProtocol("v10.stomp");

    // Called from IXWebSocket's internal thread: copy what is needed and hand off
    impl->ws.setOnMessageCallback(
        [impl, weak](const ix::WebSocketMessagePtr& msg)
        {
            std::string reason;
            int closeCode = 0;

            switch (msg->type)
            {
            case ix::WebSocketMessageType::Close:
                closeCode = msg->closeInfo.code;
                reason = msg->closeInfo.reason;
                break;

            case ix::WebSocketMessageType::Error:
                reason = msg->errorInfo.reason;
                break;

            case ix::WebSocketMessageType::Ping:
            case ix::WebSocketMessageType::Pong:
                // Pong is sent automatically by IXWebSocket
                Logger::Instance().Debug("IxWebSocket",
                    std::string(msg->type == ix::WebSocketMessageType::Ping ? "[RECV][PING] " : "[RECV][PONG] ") +
                    (msg->str.empty() ? "(empty)" : msg->str));
                return;

            case ix::WebSocketMessageType::Open:
            case ix::WebSocketMessageType::Message:
                break;

            default:
                return;
            }

            uint64_t eventGeneration = impl->generation.load();
            ix::WebSocketMessageType type = msg->type;
            std::string payload = msg->str;
            bool binary = msg->binary;

            impl->scheduler.Post(
                [weak, eventGeneration, type, payload, binary, closeCode, reason]()
                {
                    std::shared_ptr<Impl> self = weak.lock();
                    if (self)
                        self->Deliver(eventGeneration, type, payload, binary, closeCode, reason);
                });
        });

    Logger::Instance().Debug("IxWebSocket",
        "Connection created - handshake timeout=" + std::to_string(config.connectionTimeoutMs) + "ms");
}

IxWebSocketConnection::~IxWebSocketConnection()
{
    mImpl->listener = nullptr;
    mImpl->ws.stop();
    mImpl->generation.fetch_add(1);
}

void IxWebSocketConnection::SetListener(IWebSocketListener* listener)
{
    mImpl->listener = listener;
}

bool IxWebSocketConnection::Open(const std::string& url)
{
    if (!mImpl->netSystemReady)
    {
        if (!ix::initNetSystem())
        {
            Logger::Instance().Error("IxWebSocket", "Failed to initialize network system");
            return false;
        }
        mImpl->netSystemReady = true;
    }

    // Joins the thread of a previous attempt; start() is a no-op while it is joinable
    mImpl->ws.stop();

    mImpl->generation.fetch_add(1);
    mImpl->ws.setUrl(url);
    mImpl->ws.start();

    Logger::Instance().Info("IxWebSocket", "Connection initiated to " + url);
    return true;
}

void IxWebSocketConnection::Close(int code, const std::string& reason)
{
    bool wasClosed = mImpl->ws.getReadyState() == ix::ReadyState::Closed;

    // stop() joins the IXWebSocket thread; bump the generation only afterwards so that
    // events emitted while stopping are recognized as stale
    mImpl->ws.stop(static_cast<uint16_t>(code), reason);
    mImpl->generation.fetch_add(1);

    if (!wasClosed)
        Logger::Instance().Info("IxWebSocket",
        "Connection closed (" + std::to_string(code) + (reason.empty() ? "" : ": " + reason) + ")");
}

bool IxWebSocketConnection::IsOpen() const
{
    return mImpl->ws.getReadyState() == ix::ReadyState::Open;
}

bool IxWebSocketConnection::SendText(const std::string& text)
{
    if (!IsOpen())
        return false;

    ix::WebSocketSendInfo info = mImpl->ws.sendText(text);
    return info.success;
}

bool IxWebSocketConnection::SendBinary(const std::string& data)
{
    if (!IsOpen())
        return false;

    ix::WebSocketSendInfo info = mImpl->ws.sendBinary(data);
    return info.success;
}
