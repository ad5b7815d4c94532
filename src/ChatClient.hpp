#pragma once

#include "ConnectionManager.hpp"
#include "MessageDispatcher.hpp"
#include "OutboundPublisher.hpp"
#include "Protocol.hpp"
#include "Scheduler.hpp"
#include "SubscriptionRegistry.hpp"
#include "WebSocketConnection.hpp"

#include <functional>
#include <memory>
#include <string>

/**
 * @class ChatClient
 * @brief Realtime chat client: STOMP session, per-user queue and streamed replies.
 *
 * Wires the pieces together:
 * @code
 *   SendMessage -> OutboundPublisher -> ConnectionManager -> TransportAdapter -> IWebSocket
 *   IWebSocket -> TransportAdapter -> ConnectionManager -> SubscriptionRegistry
 *              -> MessageDispatcher -> OnMessage observers
 * @endcode
 *
 * The client subscribes to the user's private queue (userQueuePrefix + userId) on
 * every Connect(); the subscription is re-established after each reconnect.
 *
 * Thread Safety:
 * - Not thread-safe. Construct, call and destroy on the scheduler context
 *   (EventLoop::Invoke from other threads).
 * - Observers are called on the scheduler context.
 *
 * Usage Pattern:
 * @code
 *   EventLoop loop;
 *   loop.Start();
 *   std::unique_ptr<ChatClient> client = loop.Invoke([&] {
 *       return std::make_unique<ChatClient>(config, loop,
 *           std::make_unique<IxWebSocketConnection>(loop, config));
 *   });
 *   loop.Invoke([&] {
 *       client->OnMessage([](const ChatEvent& e) { ... });
 *       client->Connect();
 *   });
 * @endcode
 */
class ChatClient
{
public:
    using MessageCallback = std::function<void(const ChatEvent&)>;
    using ConnectionCallback = std::function<void(ConnectionState)>;
    using ObserverId = uint64_t;

    /**
     * @param config Client configuration (copied)
     * @param scheduler Execution context and timers; must outlive the client
     * @param socket Raw connection; ownership is taken
     */
    ChatClient(const Protocol::Config& config, IScheduler& scheduler, std::unique_ptr<IWebSocket> socket);

    /// @brief Disconnects without notifying observers
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    /**
     * @brief Start connecting; the user queue is subscribed once connected.
     * @return false if already connecting or connected
     */
    bool Connect();

    /// @brief Unsubscribe everything, send DISCONNECT and close; no reconnect follows
    void Disconnect();

    /// @brief Send a chat message; false when not connected or @p text is blank
    bool SendMessage(const std::string& text);

    /// @brief Send a broadcast message; false when not connected or @p text is blank
    bool BroadcastMessage(const std::string& text);

    /// @brief Observe chat events; returns an id for RemoveMessageObserver()
    ObserverId OnMessage(MessageCallback callback);

    /// @brief Observe connection state changes; returns an id for RemoveConnectionObserver()
    ObserverId OnConnectionChange(ConnectionCallback callback);

    bool RemoveMessageObserver(ObserverId id);
    bool RemoveConnectionObserver(ObserverId id);

    bool IsConnected() const { return mManager.IsConnected(); }
    ConnectionState GetState() const { return mManager.GetState(); }

    SubscriptionRegistry& Subscriptions() { return mRegistry; }
    const ConnectionManager& Connection() const { return mManager; }
    const Protocol::Config& GetConfig() const { return mConfig; }

private:
    void OnUserQueueMessage(const Stomp::Frame& frame);

    Protocol::Config mConfig;
    ConnectionManager mManager;
    SubscriptionRegistry mRegistry;
    MessageDispatcher mDispatcher;
    OutboundPublisher mPublisher;
};
