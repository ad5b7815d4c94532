#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstddef>
#include <cstdint>

/**
 * @namespace Protocol
 * @brief Application-level definitions for the chat transport.
 *
 * This namespace handles:
 * - Client configuration and its validation (Config, LoadConfigFile)
 * - The streaming response envelope pushed by the server (StreamEnvelope)
 * - The outbound chat and broadcast requests (ChatRequest)
 * - JSON parsing and serialization of those envelopes (nlohmann/json)
 *
 * Frame-level concerns live in the Stomp namespace; this layer only deals with
 * the JSON carried inside frame bodies.
 */
namespace Protocol
{
    /// Prefix of the per-user private queue; the user id is appended
    const char* const kUserQueuePrefix = "/queue/messages/";

    /// Destination of streaming chat requests
    const char* const kChatStreamDestination = "/app/chat/stream";

    /// Destination of the non-streaming chat variant
    const char* const kChatDestination = "/app/chat";

    /// Destination of broadcast messages
    const char* const kBroadcastDestination = "/app/chat.broadcast";

    /// Error text used when the server sends ERROR without an "error" field
    const char* const kUnknownError = "Unknown error";

    /**
     * @enum StreamType
     * @brief Discriminator of an inbound streaming envelope.
     */
    enum class StreamType
    {
        Start,      ///< "START" - the AI started producing a response
        Chunk,      ///< "CHUNK" - one piece of response text
        End,        ///< "END" - response complete
        Error,      ///< "ERROR" - response failed
        Unknown     ///< Missing or unrecognized discriminator
    };

    /**
     * @struct StreamEnvelope
     * @brief Parsed JSON body of a MESSAGE frame.
     *
     * Wire form: {"type":"CHUNK","content":"...","error":"...","timestamp":123,"correlationId":"..."}
     */
    struct StreamEnvelope
    {
        StreamType type = StreamType::Unknown;
        std::string content;        ///< Empty when absent
        std::string error;          ///< Empty when absent
        bool hasError = false;      ///< True if the "error" field was present
        int64_t timestamp = 0;      ///< Server timestamp, 0 when absent
        std::string correlationId;  ///< Logical response id, empty when absent
    };

    /**
     * @struct ChatRequest
     * @brief Outbound chat request.
     *
     * Wire form: {"userId":"42","message":"hi","messageId":"msg_...","token":"..."}
     * The token field is omitted when empty.
     */
    struct ChatRequest
    {
        std::string userId;
        std::string message;
        std::string messageId;
        std::string token;
    };

    /**
     * @struct Config
     * @brief Connection, heartbeat and routing parameters of a chat client.
     *
     * Defaults match the server the client was built against: 15 s connection
     * timeout, 10 s heartbeats both ways, 3 s fixed reconnect delay.
     */
    struct Config
    {
        /// WebSocket URL of the STOMP broker (e.g. "ws://10.0.2.2:8080/ws")
        std::string brokerUrl = "ws://localhost:8080/ws";

        /// User identifier; selects the private queue and is sent in every request
        std::string userId;

        /// Optional auth token, copied into chat requests
        std::string authToken;

        /// Value of the CONNECT "host" header; derived from brokerUrl when empty
        std::string host;

        /// Extra CONNECT headers (e.g. login/passcode)
        std::vector<std::pair<std::string, std::string>> connectHeaders;

        /// Time allowed from Connect() to the CONNECTED frame
        int connectionTimeoutMs = 15000;

        /// Heartbeat interval the client wants to receive (0 disables)
        int heartbeatIncomingMs = 10000;

        /// Heartbeat interval the client offers to send (0 disables)
        int heartbeatOutgoingMs = 10000;

        /// Missed-heartbeat tolerance, as a multiple of the negotiated incoming interval
        int heartbeatTolerance = 2;

        /// Delay before an automatic reconnect; 0 disables automatic reconnection
        int reconnectDelayMs = 3000;

        /// 1.0 keeps the delay fixed; > 1.0 enables bounded exponential backoff
        double reconnectBackoffMultiplier = 1.0;

        /// Upper bound of the reconnect delay when backoff is enabled
        int maxReconnectDelayMs = 30000;

        std::string chatDestination = kChatStreamDestination;
        std::string broadcastDestination = kBroadcastDestination;
        std::string userQueuePrefix = kUserQueuePrefix;

        /// Largest inbound transport message accepted
        size_t maxFrameSize = 1024 * 1024;

        /// Per-message deflate on the WebSocket
        bool enableCompression = false;

        /// WebSocket-level ping interval in seconds (0 disables); independent of STOMP heartbeats
        int pingIntervalSeconds = 0;

        /// @brief Validate configuration values
        /// @param reason Receives the first problem found (optional)
        /// @return true if all values are within acceptable bounds
        bool IsValid(std::string* reason = nullptr) const;

        /// @brief Per-user private queue, e.g. "/queue/messages/42"
        std::string UserQueue() const { return userQueuePrefix + userId; }

        /// @brief CONNECT host header: explicit host, else the host part of brokerUrl
        std::string EffectiveHost() const;
    };

    /**
     * @brief Load a Config from a JSON file.
     *
     * Keys mirror the Config member names. Absent keys keep their defaults,
     * unknown keys are ignored, a key with the wrong JSON type is an error.
     *
     * @param path File path
     * @param config Receives the loaded values (modified only on success)
     * @param error Receives a description on failure (optional)
     * @return true on success
     */
    bool LoadConfigFile(const std::string& path, Config& config, std::string* error = nullptr);

    /**
     * @brief Same as LoadConfigFile() but from JSON text.
     */
    bool LoadConfigJson(const std::string& json, Config& config, std::string* error = nullptr);

    /**
     * @brief Wire name of a stream type ("START", "CHUNK", ...).
     */
    std::string StreamTypeToString(StreamType type);

    /**
     * @brief Parses a MESSAGE body into a StreamEnvelope.
     *
     * @param json Frame body
     * @param envelope Receives the parsed envelope
     * @param error Receives a description on failure (optional)
     * @return false if the body is not a JSON object (malformed JSON included);
     *         an unknown "type" still parses, with StreamType::Unknown
     */
    bool ParseStreamEnvelope(const std::string& json, StreamEnvelope& envelope,
                             std::string* error = nullptr);

    /**
     * @brief Serializes a ChatRequest into its JSON body.
     */
    std::string SerializeChatRequest(const ChatRequest& request);

    /**
     * @brief Serializes a broadcast body: {"userId":"...","message":"..."}.
     */
    std::string SerializeBroadcast(const std::string& userId, const std::string& message);

    /**
     * @brief Generate a request id of the form "msg_<epoch ms>_<9 base36 chars>".
     *
     * Used to correlate requests in logs; not guaranteed globally unique.
     */
    std::string GenerateRequestId();
}
