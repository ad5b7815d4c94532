#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

/**
 * @class Signal
 * @brief Ordered observer list.
 *
 * Observers are invoked in the order they were connected. An observer removed
 * during an Emit() is not invoked afterwards in that Emit(); an observer added
 * during an Emit() is first invoked by the next one.
 *
 * Not thread-safe: connect, disconnect and emit from the owning context only.
 *
 * @example
 *   Signal<ConnectionState> stateChanged;
 *   auto id = stateChanged.Connect([](ConnectionState s) { ... });
 *   stateChanged.Emit(ConnectionState::Connected);
 *   stateChanged.Disconnect(id);
 */
template <typename... Args>
class Signal
{
public:
    using Slot = std::function<void(Args...)>;
    using Id = uint64_t;

    /**
     * @brief Add an observer.
     * @return Id for Disconnect(); never 0
     */
    Id Connect(Slot slot)
    {
        Id id = mNextId++;
        mSlots.push_back(Entry{ id, std::make_shared<Slot>(std::move(slot)) });
        return id;
    }

    /**
     * @brief Remove an observer.
     * @return false if the id is unknown
     */
    bool Disconnect(Id id)
    {
        auto it = std::find_if(mSlots.begin(), mSlots.end(),
            [id](const Entry& entry) { return entry.id == id; });
        if (it == mSlots.end())
            return false;

        mSlots.erase(it);
        return true;
    }

    void DisconnectAll() { mSlots.clear(); }

    size_t Size() const { return mSlots.size(); }

    void Emit(Args... args) const
    {
        // Snapshot: observers may connect or disconnect while being notified
        std::vector<Entry> snapshot = mSlots;

        for (const auto& entry : snapshot)
        {
            if (!IsConnected(entry.id))
                continue;
            (*entry.slot)(args...);
        }
    }

private:
    struct Entry
    {
        Id id;
        std::shared_ptr<Slot> slot;
    };

    bool IsConnected(Id id) const
    {
        return std::any_of(mSlots.begin(), mSlots.end(),
            [id](const Entry& entry) { return entry.id == id; });
    }

    std::vector<Entry> mSlots;
    Id mNextId = 1;
};
