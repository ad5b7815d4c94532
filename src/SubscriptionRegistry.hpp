#pragma once

#include "ConnectionManager.hpp"
#include "StompFrame.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/**
 * @class SubscriptionRegistry
 * @brief Set of destinations the client wants to be subscribed to.
 *
 * The registry remembers every subscription independently of the connection. While
 * connected, each entry carries a server-side subscription id (sub-1, sub-2, ...);
 * when the session ends those ids are forgotten and a fresh SUBSCRIBE is sent for
 * every entry on the next Connected, so subscriptions survive reconnects.
 *
 * Inbound MESSAGE frames are routed by their "subscription" header, falling back to
 * "destination" for brokers that omit it.
 *
 * @note Not thread-safe. Scheduler context only.
 */
class SubscriptionRegistry
{
public:
    using Handle = uint64_t;
    using FrameHandler = std::function<void(const Stomp::Frame&)>;

    /// Never returned by a successful Subscribe()
    static const Handle kInvalidHandle = 0;

    /**
     * @param sender Session used for SUBSCRIBE / UNSUBSCRIBE; must outlive the registry
     */
    explicit SubscriptionRegistry(IFrameSender& sender);

    /**
     * @brief Register a destination.
     *
     * SUBSCRIBE is sent immediately when connected, otherwise on the next Connected.
     *
     * @return Handle for Unsubscribe(), or kInvalidHandle if the destination is empty,
     *         the handler is empty or the destination is already registered
     */
    Handle Subscribe(const std::string& destination, FrameHandler handler);

    /**
     * @brief Remove a subscription; UNSUBSCRIBE is sent when it is active.
     * @return false if the handle is unknown
     */
    bool Unsubscribe(Handle handle);

    /// @brief Remove every subscription, unsubscribing the active ones
    void UnsubscribeAll();

    bool IsSubscribed(const std::string& destination) const;

    /// @brief Registered destinations in registration order
    std::vector<std::string> Destinations() const;

    /// @brief Server-side ids currently active (empty while disconnected)
    std::vector<std::string> ActiveSubscriptionIds() const;

    size_t Size() const { return mEntries.size(); }

    /**
     * @brief Feed connection state changes.
     *
     * Connected: every entry is (re)subscribed with a new id.
     * Anything else: ids are forgotten, entries are kept.
     */
    void OnConnectionStateChanged(ConnectionState state);

    /**
     * @brief Deliver a MESSAGE frame to the matching handler.
     * @return false if no subscription matches
     */
    bool Route(const Stomp::Frame& frame);

private:
    struct Entry
    {
        Handle handle = kInvalidHandle;
        std::string destination;
        std::string subscriptionId;   ///< Empty while not subscribed on the server
        FrameHandler handler;
    };

    bool Activate(Entry& entry);
    const Entry* FindForFrame(const Stomp::Frame& frame) const;

    IFrameSender& mSender;
    std::vector<Entry> mEntries;
    Handle mNextHandle = 1;
    uint64_t mNextSubscriptionId = 1;
};
