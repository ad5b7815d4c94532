#pragma once

#include "Protocol.hpp"
#include "Scheduler.hpp"
#include "Signal.hpp"
#include "StompFrame.hpp"
#include "TransportAdapter.hpp"

#include <memory>
#include <string>

/**
 * @enum ConnectionState
 * @brief Lifecycle of a STOMP session.
 */
enum class ConnectionState
{
    Disconnected,   ///< No session; a reconnect may be pending
    Connecting,     ///< Transport opening or CONNECT sent, waiting for CONNECTED
    Connected,      ///< Session established; frames may be sent
    Error,          ///< Transport error or handshake failure; a reconnect may be pending
    ProtocolError   ///< The broker sent an ERROR frame
};

/// @brief Human-readable state name (e.g. "Connected")
std::string ConnectionStateToString(ConnectionState state);

/**
 * @class IFrameSender
 * @brief Send surface of an established session.
 *
 * The subscription registry and the publisher only see this interface, never the
 * transport itself.
 */
class IFrameSender
{
public:
    virtual ~IFrameSender() = default;

    /**
     * @brief Encode and send a frame.
     * @return false if not connected or the transport rejected it
     */
    virtual bool SendFrame(const Stomp::Frame& frame) = 0;

    virtual bool IsConnected() const = 0;
};

/**
 * @class ConnectionManager
 * @brief Owns the transport and drives the session state machine.
 *
 * State transitions:
 * @code
 *   Disconnected --Connect()------------------------------> Connecting
 *   Connecting   --transport open + CONNECTED--------------> Connected
 *   Connecting   --timeout/close/error/malformed CONNECTED--> Error        (reconnect scheduled)
 *   Connecting   --ERROR frame----------------------------> ProtocolError (reconnect scheduled)
 *   Connected    --transport close / heartbeat loss--------> Disconnected (reconnect scheduled)
 *   Connected    --transport error------------------------> Error        (reconnect scheduled)
 *   Connected    --ERROR frame----------------------------> ProtocolError (waits for the broker to close)
 *   any          --Disconnect()---------------------------> Disconnected (no reconnect)
 * @endcode
 *
 * Handshake: on transport open a CONNECT frame is sent with the configured heartbeat
 * offer. CONNECTED must arrive within connectionTimeoutMs of the attempt start.
 *
 * Heartbeats: intervals are negotiated from the CONNECT offer and the CONNECTED
 * heart-beat header. An EOL is sent every outgoing interval. Any inbound data counts
 * as activity; silence longer than incoming * heartbeatTolerance is a connection loss.
 *
 * Reconnect: after reconnectDelayMs (fixed unless reconnectBackoffMultiplier > 1).
 *
 * @note Not thread-safe. All calls and all transport events on the scheduler context.
 */
class ConnectionManager : public IFrameSender, private ITransportListener
{
public:
    using StateSignal = Signal<ConnectionState>;
    using FrameSignal = Signal<const Stomp::Frame&>;

    /**
     * @param config Client configuration (copied)
     * @param scheduler Timer source and execution context; must outlive the manager
     * @param socket Raw connection; ownership is taken
     */
    ConnectionManager(const Protocol::Config& config, IScheduler& scheduler,
                      std::unique_ptr<IWebSocket> socket);

    /// @brief Cancels timers and closes the transport without notifying observers
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Start a connection attempt.
     *
     * Allowed from Disconnected or Error (a pending reconnect is replaced by this
     * attempt).
     *
     * @return false if already connecting or connected, or if the transport could not
     *         start (the attempt then fails as a transport error)
     */
    bool Connect();

    /**
     * @brief End the session: DISCONNECT if connected, close the transport, cancel
     *        every timer. No reconnect follows.
     */
    void Disconnect();

    ConnectionState GetState() const { return mState; }

    bool IsConnected() const override { return mState == ConnectionState::Connected; }

    /// @brief Send a frame; only while Connected
    bool SendFrame(const Stomp::Frame& frame) override;

    /// @brief Fired on every state change, with the new state
    StateSignal& StateChanged() { return mStateChanged; }

    /// @brief Fired for every MESSAGE frame received while Connected
    FrameSignal& FrameReceived() { return mFrameReceived; }

    /// @brief Description of the last failure (transport, handshake or ERROR frame)
    const std::string& LastError() const { return mLastError; }

    /// @brief Negotiated interval at which the client sends heartbeats (0 = off)
    int NegotiatedOutgoingMs() const { return mOutgoingMs; }

    /// @brief Negotiated interval at which the broker sends heartbeats (0 = off)
    int NegotiatedIncomingMs() const { return mIncomingMs; }

    /// @brief STOMP version from the CONNECTED frame
    const std::string& ProtocolVersion() const { return mVersion; }

    /// @brief Session id from the CONNECTED frame
    const std::string& SessionId() const { return mSessionId; }

    /// @brief Consecutive failed attempts since the last successful handshake
    int FailedAttempts() const { return mFailedAttempts; }

    /// @brief True while an automatic reconnect is scheduled
    bool IsReconnectPending() const { return mReconnectTimer != 0; }

    /// @brief Delay that the next automatic reconnect would use
    int64_t NextReconnectDelayMs() const;

private:
    void OnTransportOpen() override;
    void OnTransportMessage(const std::string& payload, bool isBinary) override;
    void OnTransportClose(int code, const std::string& reason) override;
    void OnTransportError(const std::string& reason) override;

    bool StartAttempt();
    void HandleFrame(const Stomp::Frame& frame);
    void CompleteHandshake(const Stomp::Frame& connected);
    void HandleServerError(const Stomp::Frame& frame);

    /// Handshake failure: close transport, Error, reconnect
    void FailAttempt(const std::string& reason);

    /// Loss of an established session: close transport, @p next state, reconnect
    void LoseConnection(ConnectionState next, const std::string& reason);

    void ScheduleReconnect();
    void ScheduleHeartbeatSend();
    void ScheduleHeartbeatCheck();

    void CancelTimer(IScheduler::TimerId& id);
    void StopSessionTimers();
    void SetState(ConnectionState state);

    Protocol::Config mConfig;
    IScheduler& mScheduler;
    TransportAdapter mTransport;

    ConnectionState mState = ConnectionState::Disconnected;
    std::string mLastError;

    IScheduler::TimerId mHandshakeTimer = 0;
    IScheduler::TimerId mReconnectTimer = 0;
    IScheduler::TimerId mHeartbeatSendTimer = 0;
    IScheduler::TimerId mHeartbeatCheckTimer = 0;

    int mOutgoingMs = 0;
    int mIncomingMs = 0;
    int64_t mLastActivityMs = 0;
    int mFailedAttempts = 0;

    std::string mVersion;
    std::string mSessionId;

    StateSignal mStateChanged;
    FrameSignal mFrameReceived;
};
