#include "StompFrame.hpp"

/**
 * @file StompFrame.cpp
 * @brief STOMP frame encoding and decoding.
 *
 * Decoding never trusts the payload: every structural element (command line, header
 * block, body, terminator) is checked, and the first violation fails the whole frame.
 */

namespace Stomp
{
    namespace
    {
        struct CommandName
        {
            Command command;
            const char* token;
        };

        const CommandName kCommandNames[] = {
            { Command::Connect,     "CONNECT" },
            { Command::Stomp,       "STOMP" },
            { Command::Connected,   "CONNECTED" },
            { Command::Send,        "SEND" },
            { Command::Subscribe,   "SUBSCRIBE" },
            { Command::Unsubscribe, "UNSUBSCRIBE" },
            { Command::Begin,       "BEGIN" },
            { Command::Commit,      "COMMIT" },
            { Command::Abort,       "ABORT" },
            { Command::Ack,         "ACK" },
            { Command::Nack,        "NACK" },
            { Command::Disconnect,  "DISCONNECT" },
            { Command::Message,     "MESSAGE" },
            { Command::Receipt,     "RECEIPT" },
            { Command::Error,       "ERROR" },
        };

        // CONNECT and CONNECTED predate header escaping
        bool UsesEscaping(Command command)
        {
            return command != Command::Connect && command != Command::Connected;
        }

        void SetError(std::string* error, const std::string& message)
        {
            if (error)
                *error = message;
        }

        // Reads the line starting at pos; strips an optional trailing '\r'.
        bool ReadLine(const std::string& data, size_t pos, size_t limit,
                      std::string& line, size_t& next)
        {
            size_t nl = data.find('\n', pos);
            if (nl == std::string::npos || nl > limit)
                return false;

            size_t end = nl;
            if (end > pos && data[end - 1] == '\r')
                --end;

            line = data.substr(pos, end - pos);
            next = nl + 1;
            return true;
        }

        bool ParseContentLength(const std::string& text, size_t& length)
        {
            if (text.empty() || text.size() > 18)
                return false;

            length = 0;
            for (char c : text)
            {
                if (c < '0' || c > '9')
                    return false;
                length = length * 10 + static_cast<size_t>(c - '0');
            }
            return true;
        }
    }

    const std::string* Frame::FindHeader(const std::string& name) const
    {
        for (const auto& header : headers)
        {
            if (header.first == name)
                return &header.second;
        }
        return nullptr;
    }

    std::string Frame::GetHeader(const std::string& name, const std::string& fallback) const
    {
        const std::string* value = FindHeader(name);
        return value ? *value : fallback;
    }

    bool Frame::HasHeader(const std::string& name) const
    {
        return FindHeader(name) != nullptr;
    }

    void Frame::SetHeader(const std::string& name, const std::string& value)
    {
        for (auto& header : headers)
        {
            if (header.first == name)
            {
                header.second = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    bool Frame::RemoveHeader(const std::string& name)
    {
        for (auto it = headers.begin(); it != headers.end(); ++it)
        {
            if (it->first == name)
            {
                headers.erase(it);
                return true;
            }
        }
        return false;
    }

    bool Frame::operator==(const Frame& other) const
    {
        return command == other.command &&
               headers == other.headers &&
               body == other.body;
    }

    std::string CommandToString(Command command)
    {
        for (const auto& entry : kCommandNames)
        {
            if (entry.command == command)
                return entry.token;
        }
        return "UNKNOWN";
    }

    bool ParseCommand(const std::string& token, Command& command)
    {
        for (const auto& entry : kCommandNames)
        {
            if (token == entry.token)
            {
                command = entry.command;
                return true;
            }
        }
        return false;
    }

    std::string EscapeHeader(const std::string& text)
    {
        std::string out;
        out.reserve(text.size());

        for (char c : text)
        {
            switch (c)
            {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case ':':  out += "\\c";  break;
            default:   out += c;      break;
            }
        }
        return out;
    }

    bool UnescapeHeader(const std::string& text, std::string& out)
    {
        out.clear();
        out.reserve(text.size());

        for (size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] != '\\')
            {
                out += text[i];
                continue;
            }

            if (i + 1 >= text.size())
                return false;

            switch (text[++i])
            {
            case '\\': out += '\\'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 'c':  out += ':';  break;
            default:
                return false;
            }
        }
        return true;
    }

    std::string Encode(const Frame& frame)
    {
        const bool escape = UsesEscaping(frame.command);

        std::string out = CommandToString(frame.command);
        out += '\n';

        for (const auto& header : frame.headers)
        {
            out += escape ? EscapeHeader(header.first) : header.first;
            out += ':';
            out += escape ? EscapeHeader(header.second) : header.second;
            out += '\n';
        }

        // Without a length the body would end at its first NUL
        if (frame.body.find(kTerminator) != std::string::npos && !frame.HasHeader("content-length"))
            out += "content-length:" + std::to_string(frame.body.size()) + "\n";

        out += '\n';
        out += frame.body;
        out += kTerminator;
        return out;
    }

    size_t SkipEols(const std::string& data, size_t offset)
    {
        size_t pos = offset;
        while (pos < data.size())
        {
            if (data[pos] == '\n')
                ++pos;
            else if (data[pos] == '\r' && pos + 1 < data.size() && data[pos + 1] == '\n')
                pos += 2;
            else
                break;
        }
        return pos;
    }

    bool IsHeartbeat(const std::string& data)
    {
        return !data.empty() && SkipEols(data, 0) == data.size();
    }

    bool DecodeAt(const std::string& data, size_t offset, Frame& frame,
                  std::string* error, size_t* next)
    {
        size_t pos = SkipEols(data, offset);
        if (pos >= data.size())
        {
            SetError(error, "empty payload");
            return false;
        }

        // The header block can never contain NUL, so it must end before the first one
        size_t firstNul = data.find(kTerminator, pos);
        if (firstNul == std::string::npos)
        {
            SetError(error, "missing NUL terminator");
            return false;
        }

        std::string line;
        if (!ReadLine(data, pos, firstNul, line, pos))
        {
            SetError(error, "command line not terminated before NUL");
            return false;
        }

        Frame decoded;
        if (!ParseCommand(line, decoded.command))
        {
            SetError(error, "unknown command '" + line.substr(0, 32) + "'");
            return false;
        }

        const bool escape = UsesEscaping(decoded.command);

        while (true)
        {
            if (!ReadLine(data, pos, firstNul, line, pos))
            {
                SetError(error, "header block not terminated before NUL");
                return false;
            }

            if (line.empty())
                break;

            size_t colon = line.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                SetError(error, "malformed header line '" + line.substr(0, 64) + "'");
                return false;
            }

            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);

            if (escape)
            {
                std::string rawName = name;
                std::string rawValue = value;
                if (!UnescapeHeader(rawName, name) || !UnescapeHeader(rawValue, value))
                {
                    SetError(error, "invalid escape sequence in header '" + rawName + "'");
                    return false;
                }
            }

            // Repeated header: the first occurrence wins
            if (!decoded.HasHeader(name))
                decoded.headers.emplace_back(name, value);
        }

        size_t terminator = firstNul;
        const std::string* contentLength = decoded.FindHeader("content-length");
        if (contentLength)
        {
            size_t length = 0;
            if (!ParseContentLength(*contentLength, length))
            {
                SetError(error, "invalid content-length '" + *contentLength + "'");
                return false;
            }

            if (length > data.size() - pos || pos + length >= data.size())
            {
                SetError(error, "missing NUL terminator after content-length body");
                return false;
            }

            terminator = pos + length;
            if (data[terminator] != kTerminator)
            {
                SetError(error, "body longer than content-length");
                return false;
            }
        }

        decoded.body = data.substr(pos, terminator - pos);
        frame = std::move(decoded);

        if (next)
            *next = terminator + 1;
        return true;
    }

    bool Decode(const std::string& data, Frame& frame, std::string* error)
    {
        size_t next = 0;
        if (!DecodeAt(data, 0, frame, error, &next))
            return false;

        if (SkipEols(data, next) != data.size())
        {
            SetError(error, "trailing data after frame terminator");
            return false;
        }
        return true;
    }

    Frame MakeConnect(const std::string& host, int heartbeatOutgoingMs, int heartbeatIncomingMs,
                      const std::vector<Header>& extraHeaders)
    {
        Frame frame(Command::Connect);
        frame.SetHeader("accept-version", kAcceptVersion);
        frame.SetHeader("host", host);
        frame.SetHeader("heart-beat",
            std::to_string(heartbeatOutgoingMs) + "," + std::to_string(heartbeatIncomingMs));

        for (const auto& header : extraHeaders)
            frame.SetHeader(header.first, header.second);

        return frame;
    }

    Frame MakeSubscribe(const std::string& destination, const std::string& subscriptionId)
    {
        Frame frame(Command::Subscribe);
        frame.SetHeader("id", subscriptionId);
        frame.SetHeader("destination", destination);
        return frame;
    }

    Frame MakeUnsubscribe(const std::string& subscriptionId)
    {
        Frame frame(Command::Unsubscribe);
        frame.SetHeader("id", subscriptionId);
        return frame;
    }

    Frame MakeSend(const std::string& destination, const std::string& body,
                   const std::string& contentType)
    {
        Frame frame(Command::Send, body);
        frame.SetHeader("destination", destination);
        if (!contentType.empty())
            frame.SetHeader("content-type", contentType);
        frame.SetHeader("content-length", std::to_string(body.size()));
        return frame;
    }

    Frame MakeDisconnect(const std::string& receiptId)
    {
        Frame frame(Command::Disconnect);
        if (!receiptId.empty())
            frame.SetHeader("receipt", receiptId);
        return frame;
    }
}
