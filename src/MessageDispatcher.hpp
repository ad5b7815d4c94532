#pragma once

#include "Protocol.hpp"
#include "Signal.hpp"

#include <cstdint>
#include <set>
#include <string>

/**
 * @struct ChatEvent
 * @brief Application-level event produced from one streaming envelope.
 */
struct ChatEvent
{
    enum class Type
    {
        Typing,     ///< Response started (START)
        Message,    ///< A piece of response text (CHUNK with content)
        End,        ///< Response complete (END)
        Error       ///< Response failed (ERROR); content holds the error text
    };

    Type type = Type::Message;
    std::string content;
    int64_t timestamp = 0;
    std::string correlationId;
};

/// @brief Lower-case event name ("typing", "message", "end", "error")
std::string ChatEventTypeToString(ChatEvent::Type type);

/**
 * @class MessageDispatcher
 * @brief Maps JSON envelopes from MESSAGE frame bodies to ChatEvents.
 *
 * Mapping:
 * - START -> Typing
 * - CHUNK -> Message, only when content is non-empty
 * - END   -> End
 * - ERROR -> Error with the "error" field, or "Unknown error" when it is absent or empty
 *
 * Malformed JSON, non-object JSON and missing or unknown "type" drop the single message
 * with a log line; nothing propagates to the caller.
 *
 * Streams are tracked per correlation id (an empty id is the single anonymous stream)
 * so that each response yields at most one Typing and one terminal event: a repeated
 * START is dropped, END without an open stream is dropped, a CHUNK opens the stream
 * if START was missed. ERROR is always delivered and closes the stream.
 *
 * @example
 *   MessageDispatcher dispatcher;
 *   dispatcher.Events().Connect([](const ChatEvent& e) { ... });
 *   dispatcher.Dispatch(R"({"type":"CHUNK","content":"hello"})");
 */
class MessageDispatcher
{
public:
    using EventSignal = Signal<const ChatEvent&>;

    MessageDispatcher() = default;

    /**
     * @brief Parse one frame body and emit the resulting event.
     * @return true if an event was emitted
     */
    bool Dispatch(const std::string& body);

    EventSignal& Events() { return mEvents; }

    /// @brief Messages dropped since construction (malformed or filtered)
    size_t DroppedCount() const { return mDropped; }

    /// @brief Forget every open stream (a new session starts clean)
    void Reset();

    bool IsStreamOpen(const std::string& correlationId) const;

private:
    bool Drop(const std::string& reason);
    void Emit(ChatEvent::Type type, const Protocol::StreamEnvelope& envelope, const std::string& content);

    EventSignal mEvents;
    std::set<std::string> mOpenStreams;
    size_t mDropped = 0;
};
