#include "ConnectionManager.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>

/**
 * @file ConnectionManager.cpp
 * @brief STOMP session lifecycle: handshake, heartbeats, reconnection.
 */

namespace
{
    const int kNormalClosure = 1000;

    bool ParseInterval(const std::string& text, int& value)
    {
        if (text.empty() || text.size() > 9)
            return false;

        value = 0;
        for (char c : text)
        {
            if (c < '0' || c > '9')
                return false;
            value = value * 10 + (c - '0');
        }
        return true;
    }

    // "cx,cy" from a heart-beat header
    bool ParseHeartbeatHeader(const std::string& header, int& first, int& second)
    {
        size_t comma = header.find(',');
        if (comma == std::string::npos)
            return false;

        return ParseInterval(header.substr(0, comma), first) &&
               ParseInterval(header.substr(comma + 1), second);
    }

    // Both sides must be willing; the slower of the two wins
    int Negotiate(int client, int server)
    {
        if (client <= 0 || server <= 0)
            return 0;
        return std::max(client, server);
    }
}

std::string ConnectionStateToString(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected:  return "Disconnected";
    case ConnectionState::Connecting:    return "Connecting";
    case ConnectionState::Connected:     return "Connected";
    case ConnectionState::Error:         return "Error";
    case ConnectionState::ProtocolError: return "ProtocolError";
    default:                             return "Unknown";
    }
}

ConnectionManager::ConnectionManager(const Protocol::Config& config, IScheduler& scheduler,
                                     std::unique_ptr<IWebSocket> socket)
    : mConfig(config),
      mScheduler(scheduler),
      mTransport(std::move(socket))
{
    mTransport.SetListener(this);

    Logger::Instance().Debug("ConnectionManager",
        "Created for " + mConfig.brokerUrl +
        " - timeout=" + std::to_string(mConfig.connectionTimeoutMs) + "ms" +
        ", heartbeat=" + std::to_string(mConfig.heartbeatOutgoingMs) + "/" +
        std::to_string(mConfig.heartbeatIncomingMs) + "ms" +
        ", reconnect=" + std::to_string(mConfig.reconnectDelayMs) + "ms");
}

ConnectionManager::~ConnectionManager()
{
    StopSessionTimers();
    CancelTimer(mReconnectTimer);
    mTransport.SetListener(nullptr);
    mTransport.Close(kNormalClosure, "client destroyed");
}

bool ConnectionManager::Connect()
{
    if (mState == ConnectionState::Connecting ||
        mState == ConnectionState::Connected ||
        mState == ConnectionState::ProtocolError)
    {
        Logger::Instance().Warning("ConnectionManager",
            "Cannot connect: already in state " + ConnectionStateToString(mState));
        return false;
    }

    // An explicit connect replaces the pending automatic one
    CancelTimer(mReconnectTimer);
    return StartAttempt();
}

void ConnectionManager::Disconnect()
{
    if (mState == ConnectionState::Disconnected && mReconnectTimer == 0)
        return;

    if (mState == ConnectionState::Connected)
    {
        if (!SendFrame(Stomp::MakeDisconnect()))
            Logger::Instance().Warning("ConnectionManager", "DISCONNECT frame could not be sent");
    }

    StopSessionTimers();
    CancelTimer(mReconnectTimer);
    mTransport.Close(kNormalClosure, "client disconnect");
    mFailedAttempts = 0;

    Logger::Instance().Info("ConnectionManager", "Disconnected by client");
    SetState(ConnectionState::Disconnected);
}

bool ConnectionManager::SendFrame(const Stomp::Frame& frame)
{
    if (mState != ConnectionState::Connected)
    {
        Logger::Instance().Warning("ConnectionManager",
            "Cannot send " + Stomp::CommandToString(frame.command) +
            ": not connected (state=" + ConnectionStateToString(mState) + ")");
        return false;
    }

    return mTransport.Send(OutboundPayload::FromFrame(frame));
}

int64_t ConnectionManager::NextReconnectDelayMs() const
{
    int64_t delay = mConfig.reconnectDelayMs;
    if (mConfig.reconnectBackoffMultiplier <= 1.0 || mFailedAttempts <= 1)
        return delay;

    double scaled = delay * std::pow(mConfig.reconnectBackoffMultiplier, mFailedAttempts - 1);
    return static_cast<int64_t>(std::min(scaled, static_cast<double>(mConfig.maxReconnectDelayMs)));
}

bool ConnectionManager::StartAttempt()
{
    mLastError.clear();
    SetState(ConnectionState::Connecting);

    // An observer may have called Disconnect() from the Connecting notification
    if (mState != ConnectionState::Connecting)
    {
        Logger::Instance().Info("ConnectionManager", "Connect attempt abandoned before opening the transport");
        return false;
    }

    mHandshakeTimer = mScheduler.Schedule(mConfig.connectionTimeoutMs,
        [this]()
        {
            mHandshakeTimer = 0;
            if (mState == ConnectionState::Connecting)
                FailAttempt("no CONNECTED frame within " + std::to_string(mConfig.connectionTimeoutMs) + "ms");
        });

    if (!mTransport.Open(mConfig.brokerUrl))
    {
        FailAttempt("transport could not start connecting to " + mConfig.brokerUrl);
        return false;
    }
    return true;
}

void ConnectionManager::OnTransportOpen()
{
    if (mState != ConnectionState::Connecting)
    {
        Logger::Instance().Debug("ConnectionManager",
            "Ignoring transport open in state " + ConnectionStateToString(mState));
        return;
    }

    Stomp::Frame connect = Stomp::MakeConnect(mConfig.EffectiveHost(),
        mConfig.heartbeatOutgoingMs, mConfig.heartbeatIncomingMs, mConfig.connectHeaders);

    if (!mTransport.Send(OutboundPayload::FromFrame(connect)))
    {
        FailAttempt("CONNECT frame could not be sent");
        return;
    }

    Logger::Instance().Debug("ConnectionManager", "CONNECT sent, waiting for CONNECTED");
}

void ConnectionManager::OnTransportMessage(const std::string& payload, bool isBinary)
{
    (void)isBinary;
    mLastActivityMs = mScheduler.NowMs();

    if (payload.size() > mConfig.maxFrameSize)
    {
        Logger::Instance().Error("ConnectionManager",
            "Inbound message exceeds max size: " + std::to_string(payload.size()) +
            " > " + std::to_string(mConfig.maxFrameSize));
        if (mState == ConnectionState::Connecting)
            FailAttempt("oversized frame during handshake");
        return;
    }

    if (Stomp::IsHeartbeat(payload))
    {
        Logger::Instance().Debug("ConnectionManager", "[RECV][HEARTBEAT]");
        return;
    }

    // A single transport message may carry several frames
    size_t offset = 0;
    while (Stomp::SkipEols(payload, offset) < payload.size())
    {
        Stomp::Frame frame;
        std::string error;
        size_t next = 0;

        if (!Stomp::DecodeAt(payload, offset, frame, &error, &next))
        {
            Logger::Instance().Error("ConnectionManager", "Protocol violation: " + error);
            if (mState == ConnectionState::Connecting)
                FailAttempt("malformed frame during handshake: " + error);
            return;
        }

        HandleFrame(frame);

        // The frame may have ended the session
        if (mState == ConnectionState::Disconnected || mState == ConnectionState::Error)
            return;

        offset = next;
    }
}

void ConnectionManager::OnTransportClose(int code, const std::string& reason)
{
    std::string detail = "transport closed (" + std::to_string(code) +
                         (reason.empty() ? "" : ": " + reason) + ")";

    switch (mState)
    {
    case ConnectionState::Connecting:
        FailAttempt(detail);
        break;

    case ConnectionState::Connected:
    case ConnectionState::ProtocolError:
        LoseConnection(ConnectionState::Disconnected, detail);
        break;

    default:
        Logger::Instance().Debug("ConnectionManager",
            "Ignoring " + detail + " in state " + ConnectionStateToString(mState));
        break;
    }
}

void ConnectionManager::OnTransportError(const std::string& reason)
{
    switch (mState)
    {
    case ConnectionState::Connecting:
        FailAttempt("transport error: " + reason);
        break;

    case ConnectionState::Connected:
    case ConnectionState::ProtocolError:
        LoseConnection(ConnectionState::Error, "transport error: " + reason);
        break;

    default:
        Logger::Instance().Debug("ConnectionManager",
            "Ignoring transport error in state " + ConnectionStateToString(mState) + ": " + reason);
        break;
    }
}

void ConnectionManager::HandleFrame(const Stomp::Frame& frame)
{
    switch (frame.command)
    {
    case Stomp::Command::Connected:
        if (mState == ConnectionState::Connecting)
            CompleteHandshake(frame);
        else
            Logger::Instance().Warning("ConnectionManager", "Unexpected CONNECTED frame ignored");
        break;

    case Stomp::Command::Message:
        if (mState == ConnectionState::Connected)
            mFrameReceived.Emit(frame);
        else
            Logger::Instance().Warning("ConnectionManager",
                "MESSAGE dropped in state " + ConnectionStateToString(mState));
        break;

    case Stomp::Command::Receipt:
        Logger::Instance().Debug("ConnectionManager",
            "RECEIPT " + frame.GetHeader("receipt-id", "(no id)"));
        break;

    case Stomp::Command::Error:
        HandleServerError(frame);
        break;

    default:
        Logger::Instance().Warning("ConnectionManager",
            "Unexpected " + Stomp::CommandToString(frame.command) + " frame from server ignored");
        break;
    }
}

void ConnectionManager::CompleteHandshake(const Stomp::Frame& connected)
{
    int serverOutgoing = 0;
    int serverIncoming = 0;

    const std::string* heartbeat = connected.FindHeader("heart-beat");
    if (heartbeat && !ParseHeartbeatHeader(*heartbeat, serverOutgoing, serverIncoming))
    {
        FailAttempt("malformed CONNECTED heart-beat header '" + *heartbeat + "'");
        return;
    }

    CancelTimer(mHandshakeTimer);

    mOutgoingMs = Negotiate(mConfig.heartbeatOutgoingMs, serverIncoming);
    mIncomingMs = Negotiate(mConfig.heartbeatIncomingMs, serverOutgoing);
    mVersion = connected.GetHeader("version", "1.0");
    mSessionId = connected.GetHeader("session");
    mLastActivityMs = mScheduler.NowMs();
    mFailedAttempts = 0;

    Logger::Instance().Info("ConnectionManager",
        "Session established - version=" + mVersion +
        (mSessionId.empty() ? "" : ", session=" + mSessionId) +
        ", heartbeat out/in=" + std::to_string(mOutgoingMs) + "/" + std::to_string(mIncomingMs) + "ms");

    ScheduleHeartbeatSend();
    ScheduleHeartbeatCheck();
    SetState(ConnectionState::Connected);
}

void ConnectionManager::HandleServerError(const Stomp::Frame& frame)
{
    std::string message = frame.GetHeader("message");
    if (message.empty())
        message = frame.body.empty() ? "(no message)" : frame.body;

    mLastError = "broker error: " + message;
    Logger::Instance().Error("ConnectionManager", "ERROR frame: " + message);

    if (mState == ConnectionState::Connecting)
    {
        // The session never came up; retry like any handshake failure
        StopSessionTimers();
        mTransport.Close(kNormalClosure, "handshake rejected");
        ++mFailedAttempts;
        SetState(ConnectionState::ProtocolError);
        ScheduleReconnect();
        return;
    }

    // The broker closes the connection after ERROR; the close drives the reconnect
    SetState(ConnectionState::ProtocolError);
}

void ConnectionManager::FailAttempt(const std::string& reason)
{
    mLastError = reason;
    Logger::Instance().Error("ConnectionManager", "Connection attempt failed: " + reason);

    StopSessionTimers();
    mTransport.Close(kNormalClosure, "handshake failed");
    ++mFailedAttempts;

    SetState(ConnectionState::Error);
    ScheduleReconnect();
}

void ConnectionManager::LoseConnection(ConnectionState next, const std::string& reason)
{
    mLastError = reason;
    Logger::Instance().Error("ConnectionManager", "Connection lost: " + reason);

    StopSessionTimers();
    mTransport.Close(kNormalClosure, reason);
    ++mFailedAttempts;

    SetState(next);
    ScheduleReconnect();
}

void ConnectionManager::ScheduleReconnect()
{
    // The state may have changed again from inside an observer
    if (mState == ConnectionState::Connecting || mState == ConnectionState::Connected)
        return;

    if (mConfig.reconnectDelayMs <= 0)
    {
        Logger::Instance().Info("ConnectionManager", "Automatic reconnect disabled");
        return;
    }

    CancelTimer(mReconnectTimer);

    int64_t delay = NextReconnectDelayMs();
    Logger::Instance().Info("ConnectionManager",
        "Reconnecting in " + std::to_string(delay) + "ms (attempt " +
        std::to_string(mFailedAttempts + 1) + ")");

    mReconnectTimer = mScheduler.Schedule(delay,
        [this]()
        {
            mReconnectTimer = 0;
            if (mState != ConnectionState::Connecting && mState != ConnectionState::Connected)
                StartAttempt();
        });
}

void ConnectionManager::ScheduleHeartbeatSend()
{
    if (mOutgoingMs <= 0)
        return;

    mHeartbeatSendTimer = mScheduler.Schedule(mOutgoingMs,
        [this]()
        {
            mHeartbeatSendTimer = 0;
            if (mState != ConnectionState::Connected && mState != ConnectionState::ProtocolError)
                return;

            if (!mTransport.Send(OutboundPayload::Heartbeat()))
            {
                LoseConnection(ConnectionState::Disconnected, "heartbeat could not be sent");
                return;
            }
            ScheduleHeartbeatSend();
        });
}

void ConnectionManager::ScheduleHeartbeatCheck()
{
    if (mIncomingMs <= 0)
        return;

    mHeartbeatCheckTimer = mScheduler.Schedule(mIncomingMs,
        [this]()
        {
            mHeartbeatCheckTimer = 0;
            if (mState != ConnectionState::Connected && mState != ConnectionState::ProtocolError)
                return;

            int64_t silence = mScheduler.NowMs() - mLastActivityMs;
            int64_t limit = static_cast<int64_t>(mIncomingMs) * mConfig.heartbeatTolerance;
            if (silence > limit)
            {
                LoseConnection(ConnectionState::Disconnected,
                    "no heartbeat from server for " + std::to_string(silence) + "ms");
                return;
            }
            ScheduleHeartbeatCheck();
        });
}

void ConnectionManager::CancelTimer(IScheduler::TimerId& id)
{
    if (id != 0)
    {
        mScheduler.Cancel(id);
        id = 0;
    }
}

void ConnectionManager::StopSessionTimers()
{
    CancelTimer(mHandshakeTimer);
    CancelTimer(mHeartbeatSendTimer);
    CancelTimer(mHeartbeatCheckTimer);
}

void ConnectionManager::SetState(ConnectionState state)
{
    if (state == mState)
        return;

    Logger::Instance().Info("ConnectionManager",
        "State: " + ConnectionStateToString(mState) + " -> " + ConnectionStateToString(state));

    mState = state;
    mStateChanged.Emit(state);
}
