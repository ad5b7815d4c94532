#pragma once

#include "ConnectionManager.hpp"
#include "Protocol.hpp"

#include <functional>
#include <string>

/**
 * @class OutboundPublisher
 * @brief Turns application requests into SEND frames.
 *
 * Nothing is queued: a request made while the session is not connected fails at once
 * and produces no frame.
 */
class OutboundPublisher
{
public:
    using IdGenerator = std::function<std::string()>;

    /**
     * @param config Source of user id, token and destinations (copied)
     * @param sender Session; must outlive the publisher
     * @param idGenerator Request id source, Protocol::GenerateRequestId by default
     */
    OutboundPublisher(const Protocol::Config& config, IFrameSender& sender,
                      IdGenerator idGenerator = Protocol::GenerateRequestId);

    /**
     * @brief Send {userId, message, messageId, token?} to the chat destination.
     * @return false if not connected, if @p text is blank or if the send failed
     */
    bool SendChatMessage(const std::string& text);

    /**
     * @brief Send {userId, message} to the broadcast destination.
     * @return false if not connected, if @p text is blank or if the send failed
     */
    bool BroadcastMessage(const std::string& text);

    /// @brief Request id of the last chat message handed to the session
    const std::string& LastRequestId() const { return mLastRequestId; }

private:
    bool CanSend(const std::string& text, const char* what) const;

    Protocol::Config mConfig;
    IFrameSender& mSender;
    IdGenerator mIdGenerator;
    std::string mLastRequestId;
};
