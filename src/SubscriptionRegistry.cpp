#include "SubscriptionRegistry.hpp"
#include "Logger.hpp"

#include <algorithm>

SubscriptionRegistry::SubscriptionRegistry(IFrameSender& sender)
    : mSender(sender)
{
}

SubscriptionRegistry::Handle SubscriptionRegistry::Subscribe(const std::string& destination,
                                                             FrameHandler handler)
{
    if (destination.empty())
    {
        Logger::Instance().Warning("Subscriptions", "Rejected subscription with empty destination");
        return kInvalidHandle;
    }
    if (!handler)
    {
        Logger::Instance().Warning("Subscriptions", "Rejected subscription without handler: " + destination);
        return kInvalidHandle;
    }
    if (IsSubscribed(destination))
    {
        Logger::Instance().Warning("Subscriptions", "Already subscribed: " + destination);
        return kInvalidHandle;
    }

    Entry entry;
    entry.handle = mNextHandle++;
    entry.destination = destination;
    entry.handler = std::move(handler);
    mEntries.push_back(std::move(entry));

    Logger::Instance().Info("Subscriptions", "Registered " + destination);

    if (mSender.IsConnected())
        Activate(mEntries.back());

    return mEntries.back().handle;
}

bool SubscriptionRegistry::Unsubscribe(Handle handle)
{
    auto it = std::find_if(mEntries.begin(), mEntries.end(),
        [handle](const Entry& entry) { return entry.handle == handle; });
    if (it == mEntries.end())
        return false;

    if (!it->subscriptionId.empty() && mSender.IsConnected())
    {
        if (!mSender.SendFrame(Stomp::MakeUnsubscribe(it->subscriptionId)))
            Logger::Instance().Warning("Subscriptions", "UNSUBSCRIBE failed for " + it->destination);
    }

    Logger::Instance().Info("Subscriptions", "Removed " + it->destination);
    mEntries.erase(it);
    return true;
}

void SubscriptionRegistry::UnsubscribeAll()
{
    while (!mEntries.empty())
        Unsubscribe(mEntries.front().handle);
}

bool SubscriptionRegistry::IsSubscribed(const std::string& destination) const
{
    return std::any_of(mEntries.begin(), mEntries.end(),
        [&destination](const Entry& entry) { return entry.destination == destination; });
}

std::vector<std::string> SubscriptionRegistry::Destinations() const
{
    std::vector<std::string> destinations;
    for (const Entry& entry : mEntries)
        destinations.push_back(entry.destination);
    return destinations;
}

std::vector<std::string> SubscriptionRegistry::ActiveSubscriptionIds() const
{
    std::vector<std::string> ids;
    for (const Entry& entry : mEntries)
    {
        if (!entry.subscriptionId.empty())
            ids.push_back(entry.subscriptionId);
    }
    return ids;
}

void SubscriptionRegistry::OnConnectionStateChanged(ConnectionState state)
{
    if (state == ConnectionState::Connected)
    {
        for (Entry& entry : mEntries)
        {
            entry.subscriptionId.clear();
            Activate(entry);
        }
        return;
    }

    // Server-side ids die with the session
    for (Entry& entry : mEntries)
        entry.subscriptionId.clear();
}

bool SubscriptionRegistry::Route(const Stomp::Frame& frame)
{
    const Entry* entry = FindForFrame(frame);
    if (!entry)
    {
        Logger::Instance().Warning("Subscriptions",
            "No subscription for MESSAGE (subscription=" + frame.GetHeader("subscription", "-") +
            ", destination=" + frame.GetHeader("destination", "-") + ")");
        return false;
    }

    // The handler may unsubscribe, which invalidates the entry
    FrameHandler handler = entry->handler;
    handler(frame);
    return true;
}

bool SubscriptionRegistry::Activate(Entry& entry)
{
    std::string id = "sub-" + std::to_string(mNextSubscriptionId++);

    if (!mSender.SendFrame(Stomp::MakeSubscribe(entry.destination, id)))
    {
        Logger::Instance().Error("Subscriptions", "SUBSCRIBE failed for " + entry.destination);
        return false;
    }

    entry.subscriptionId = id;
    Logger::Instance().Info("Subscriptions", "Subscribed to " + entry.destination + " as " + id);
    return true;
}

const SubscriptionRegistry::Entry* SubscriptionRegistry::FindForFrame(const Stomp::Frame& frame) const
{
    const std::string* subscription = frame.FindHeader("subscription");
    if (subscription)
    {
        for (const Entry& entry : mEntries)
        {
            if (!entry.subscriptionId.empty() && entry.subscriptionId == *subscription)
                return &entry;
        }
    }

    const std::string* destination = frame.FindHeader("destination");
    if (destination)
    {
        for (const Entry& entry : mEntries)
        {
            if (entry.destination == *destination)
                return &entry;
        }
    }
    return nullptr;
}
