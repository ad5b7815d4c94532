#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstddef>

/**
 * @namespace Stomp
 * @brief STOMP frame model and the stateless frame codec.
 *
 * A frame on the wire is:
 * @code
 *   COMMAND\n
 *   name:value\n        (zero or more header lines)
 *   \n
 *   body^@              (^@ is the NUL terminator)
 * @endcode
 *
 * Encoding and decoding are pure functions over byte strings so they can be
 * tested against literal byte sequences without any connection.
 */
namespace Stomp
{
    /// NUL byte terminating every frame
    const char kTerminator = '\0';

    /// Versions offered in CONNECT
    const char* const kAcceptVersion = "1.2,1.1,1.0";

    /**
     * @enum Command
     * @brief Known frame commands, client and server side.
     */
    enum class Command
    {
        Connect,        ///< CONNECT (client handshake)
        Stomp,          ///< STOMP (1.2 alias of CONNECT)
        Connected,      ///< CONNECTED (server handshake acknowledgment)
        Send,           ///< SEND
        Subscribe,      ///< SUBSCRIBE
        Unsubscribe,    ///< UNSUBSCRIBE
        Begin,          ///< BEGIN
        Commit,         ///< COMMIT
        Abort,          ///< ABORT
        Ack,            ///< ACK
        Nack,           ///< NACK
        Disconnect,     ///< DISCONNECT
        Message,        ///< MESSAGE (server push)
        Receipt,        ///< RECEIPT
        Error           ///< ERROR (server protocol error)
    };

    using Header = std::pair<std::string, std::string>;

    /**
     * @struct Frame
     * @brief One protocol message unit: command, ordered headers, body.
     *
     * Header names are unique within a frame: SetHeader() replaces an existing value
     * in place and keeps the original position.
     */
    struct Frame
    {
        Command command = Command::Send;
        std::vector<Header> headers;
        std::string body;

        Frame() = default;

        explicit Frame(Command c, const std::string& b = "")
            : command(c), body(b) {}

        /// @brief Value of a header, or nullptr if absent
        const std::string* FindHeader(const std::string& name) const;

        /// @brief Value of a header, or @p fallback if absent
        std::string GetHeader(const std::string& name, const std::string& fallback = "") const;

        bool HasHeader(const std::string& name) const;

        /// @brief Set or replace a header
        void SetHeader(const std::string& name, const std::string& value);

        /// @return true if the header existed
        bool RemoveHeader(const std::string& name);

        bool operator==(const Frame& other) const;
        bool operator!=(const Frame& other) const { return !(*this == other); }
    };

    /**
     * @brief Wire token of a command (e.g. "SUBSCRIBE").
     */
    std::string CommandToString(Command command);

    /**
     * @brief Look up a wire token.
     *
     * @param token Exact, case-sensitive command token
     * @param command Receives the command on success
     * @return false if the token is not a known command
     */
    bool ParseCommand(const std::string& token, Command& command);

    /**
     * @brief Serialize a frame.
     *
     * Header names and values are escaped as STOMP 1.2 requires, except for
     * CONNECT and CONNECTED frames. Exactly one NUL byte is appended after the body.
     * A content-length header is added only when the body contains NUL and the frame
     * carries none, so such a frame decodes with that one extra header.
     *
     * @param frame Frame to encode
     * @return Encoded bytes, always ending in kTerminator
     */
    std::string Encode(const Frame& frame);

    /**
     * @brief Decode the single frame held in @p data.
     *
     * Leading EOLs (heartbeats) are skipped and trailing EOLs after the terminator are
     * accepted; anything else after the terminator is an error.
     *
     * @param data Raw payload (text or binary transport message)
     * @param frame Receives the decoded frame on success
     * @param error Receives a description on failure (optional)
     * @return false if the payload is not exactly one valid, terminated frame
     */
    bool Decode(const std::string& data, Frame& frame, std::string* error = nullptr);

    /**
     * @brief Decode the frame starting at @p offset.
     *
     * Used to walk a payload carrying several frames back to back.
     *
     * @param data Buffer
     * @param offset Position to start from; leading EOLs are skipped
     * @param frame Receives the decoded frame on success
     * @param error Receives a description on failure (optional)
     * @param next Receives the offset just past the terminator (optional)
     * @return false on any protocol violation: missing terminator, unknown command,
     *         malformed header line, bad escape sequence, bad content-length
     */
    bool DecodeAt(const std::string& data, size_t offset, Frame& frame,
                  std::string* error = nullptr, size_t* next = nullptr);

    /**
     * @brief Position of the first byte at or after @p offset that is not an EOL.
     */
    size_t SkipEols(const std::string& data, size_t offset);

    /**
     * @brief True if the payload is a heartbeat (non-empty, only "\n" or "\r\n").
     */
    bool IsHeartbeat(const std::string& data);

    /// @brief Escape a header name or value (STOMP 1.2)
    std::string EscapeHeader(const std::string& text);

    /**
     * @brief Reverse EscapeHeader().
     * @return false on an undefined escape sequence
     */
    bool UnescapeHeader(const std::string& text, std::string& out);

    // Client frame builders

    Frame MakeConnect(const std::string& host, int heartbeatOutgoingMs, int heartbeatIncomingMs,
                      const std::vector<Header>& extraHeaders = std::vector<Header>());

    Frame MakeSubscribe(const std::string& destination, const std::string& subscriptionId);

    Frame MakeUnsubscribe(const std::string& subscriptionId);

    /// @brief SEND with destination, content-type and content-length headers
    Frame MakeSend(const std::string& destination, const std::string& body,
                   const std::string& contentType = "application/json");

    Frame MakeDisconnect(const std::string& receiptId = "");
}
