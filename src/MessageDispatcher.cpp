#include "MessageDispatcher.hpp"
#include "Logger.hpp"

/**
 * @file MessageDispatcher.cpp
 * @brief Routing of streaming envelopes to chat events.
 */

std::string ChatEventTypeToString(ChatEvent::Type type)
{
    switch (type)
    {
    case ChatEvent::Type::Typing:  return "typing";
    case ChatEvent::Type::Message: return "message";
    case ChatEvent::Type::End:     return "end";
    case ChatEvent::Type::Error:   return "error";
    default:                       return "unknown";
    }
}

bool MessageDispatcher::Dispatch(const std::string& body)
{
    Protocol::StreamEnvelope envelope;
    std::string error;

    if (!Protocol::ParseStreamEnvelope(body, envelope, &error))
        return Drop("unparseable body (" + error + ")");

    const std::string& stream = envelope.correlationId;

    switch (envelope.type)
    {
    case Protocol::StreamType::Start:
        if (!mOpenStreams.insert(stream).second)
            return Drop("duplicate START for stream '" + stream + "'");

        Emit(ChatEvent::Type::Typing, envelope, "");
        return true;

    case Protocol::StreamType::Chunk:
        if (envelope.content.empty())
        {
            Logger::Instance().Debug("Dispatcher", "Empty CHUNK ignored");
            ++mDropped;
            return false;
        }

        // START may have been lost; the first chunk opens the stream
        mOpenStreams.insert(stream);
        Emit(ChatEvent::Type::Message, envelope, envelope.content);
        return true;

    case Protocol::StreamType::End:
        if (mOpenStreams.erase(stream) == 0)
            return Drop("END for stream '" + stream + "' that is not open");

        Emit(ChatEvent::Type::End, envelope, "");
        return true;

    case Protocol::StreamType::Error:
        mOpenStreams.erase(stream);
        Logger::Instance().Warning("Dispatcher",
            "Stream error: " + (envelope.error.empty() ? std::string(Protocol::kUnknownError) : envelope.error));
        Emit(ChatEvent::Type::Error, envelope,
            envelope.error.empty() ? std::string(Protocol::kUnknownError) : envelope.error);
        return true;

    case Protocol::StreamType::Unknown:
    default:
        return Drop("missing or unknown envelope type");
    }
}

void MessageDispatcher::Reset()
{
    if (!mOpenStreams.empty())
        Logger::Instance().Debug("Dispatcher",
            "Discarding " + std::to_string(mOpenStreams.size()) + " open stream(s)");
    mOpenStreams.clear();
}

bool MessageDispatcher::IsStreamOpen(const std::string& correlationId) const
{
    return mOpenStreams.count(correlationId) != 0;
}

bool MessageDispatcher::Drop(const std::string& reason)
{
    ++mDropped;
    Logger::Instance().Warning("Dispatcher", "Message dropped: " + reason);
    return false;
}

void MessageDispatcher::Emit(ChatEvent::Type type, const Protocol::StreamEnvelope& envelope,
                             const std::string& content)
{
    ChatEvent event;
    event.type = type;
    event.content = content;
    event.timestamp = envelope.timestamp;
    event.correlationId = envelope.correlationId;

    Logger::Instance().Debug("Dispatcher",
        "Event " + ChatEventTypeToString(type) +
        (event.correlationId.empty() ? "" : " [" + event.correlationId + "]"));

    mEvents.Emit(event);
}
