#include "OutboundPublisher.hpp"
#include "Logger.hpp"
#include "StompFrame.hpp"

namespace
{
    bool IsBlank(const std::string& text)
    {
        return text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
}

OutboundPublisher::OutboundPublisher(const Protocol::Config& config, IFrameSender& sender,
                                     IdGenerator idGenerator)
    : mConfig(config),
      mSender(sender),
      mIdGenerator(std::move(idGenerator))
{
}

bool OutboundPublisher::SendChatMessage(const std::string& text)
{
    if (!CanSend(text, "chat message"))
        return false;

    Protocol::ChatRequest request;
    request.userId = mConfig.userId;
    request.message = text;
    request.messageId = mIdGenerator ? mIdGenerator() : Protocol::GenerateRequestId();
    request.token = mConfig.authToken;

    if (!mSender.SendFrame(Stomp::MakeSend(mConfig.chatDestination, Protocol::SerializeChatRequest(request))))
    {
        Logger::Instance().Error("Publisher", "Chat message " + request.messageId + " could not be sent");
        return false;
    }

    mLastRequestId = request.messageId;
    Logger::Instance().Info("Publisher",
        "Chat message " + request.messageId + " sent to " + mConfig.chatDestination);
    return true;
}

bool OutboundPublisher::BroadcastMessage(const std::string& text)
{
    if (!CanSend(text, "broadcast"))
        return false;

    if (!mSender.SendFrame(Stomp::MakeSend(mConfig.broadcastDestination,
                                           Protocol::SerializeBroadcast(mConfig.userId, text))))
    {
        Logger::Instance().Error("Publisher", "Broadcast could not be sent");
        return false;
    }

    Logger::Instance().Info("Publisher", "Broadcast sent to " + mConfig.broadcastDestination);
    return true;
}

bool OutboundPublisher::CanSend(const std::string& text, const char* what) const
{
    if (!mSender.IsConnected())
    {
        Logger::Instance().Warning("Publisher", std::string("Cannot send ") + what + ": not connected");
        return false;
    }
    if (IsBlank(text))
    {
        Logger::Instance().Warning("Publisher", std::string("Rejected empty ") + what);
        return false;
    }
    return true;
}
