#include "Protocol.hpp"
#include "Logger.hpp"

#include <chrono>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>

/**
 * @file Protocol.cpp
 * @brief Configuration loading and JSON envelope handling.
 *
 * All JSON goes through nlohmann/json. Exceptions from the library are caught here,
 * at the parsing boundary, and turned into a false return plus an error string.
 */

namespace Protocol
{
    using json = nlohmann::json;

    namespace
    {
        void SetError(std::string* error, const std::string& message)
        {
            if (error)
                *error = message;
        }

        bool ReadString(const json& obj, const char* key, std::string& out, std::string* error)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return true;
            if (!it->is_string())
            {
                SetError(error, std::string("'") + key + "' must be a string");
                return false;
            }
            out = it->get<std::string>();
            return true;
        }

        bool ReadInt(const json& obj, const char* key, int& out, std::string* error)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return true;
            if (!it->is_number_integer())
            {
                SetError(error, std::string("'") + key + "' must be an integer");
                return false;
            }
            const bool inRange = it->is_number_unsigned()
                ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
                  it->get<int64_t>() <= std::numeric_limits<int>::max();
            if (!inRange)
            {
                SetError(error, std::string("'") + key + "' is out of range");
                return false;
            }
            out = static_cast<int>(it->get<int64_t>());
            return true;
        }

        bool ReadSize(const json& obj, const char* key, size_t& out, std::string* error)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return true;
            if (!it->is_number_unsigned())
            {
                SetError(error, std::string("'") + key + "' must be a non-negative integer");
                return false;
            }
            out = it->get<size_t>();
            return true;
        }

        bool ReadDouble(const json& obj, const char* key, double& out, std::string* error)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return true;
            if (!it->is_number())
            {
                SetError(error, std::string("'") + key + "' must be a number");
                return false;
            }
            out = it->get<double>();
            return true;
        }

        bool ReadBool(const json& obj, const char* key, bool& out, std::string* error)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return true;
            if (!it->is_boolean())
            {
                SetError(error, std::string("'") + key + "' must be a boolean");
                return false;
            }
            out = it->get<bool>();
            return true;
        }

        bool IsDestination(const std::string& destination)
        {
            return !destination.empty() && destination[0] == '/';
        }
    }

    bool Config::IsValid(std::string* reason) const
    {
        if (brokerUrl.compare(0, 5, "ws://") != 0 && brokerUrl.compare(0, 6, "wss://") != 0)
        {
            SetError(reason, "brokerUrl must start with ws:// or wss://");
            return false;
        }
        if (userId.empty())
        {
            SetError(reason, "userId is required");
            return false;
        }
        if (connectionTimeoutMs <= 0)
        {
            SetError(reason, "connectionTimeoutMs must be > 0");
            return false;
        }
        if (heartbeatIncomingMs < 0 || heartbeatOutgoingMs < 0)
        {
            SetError(reason, "heartbeat intervals must be >= 0");
            return false;
        }
        if (heartbeatTolerance < 1)
        {
            SetError(reason, "heartbeatTolerance must be >= 1");
            return false;
        }
        if (reconnectDelayMs < 0)
        {
            SetError(reason, "reconnectDelayMs must be >= 0");
            return false;
        }
        if (reconnectBackoffMultiplier < 1.0)
        {
            SetError(reason, "reconnectBackoffMultiplier must be >= 1.0");
            return false;
        }
        if (maxReconnectDelayMs < reconnectDelayMs)
        {
            SetError(reason, "maxReconnectDelayMs must be >= reconnectDelayMs");
            return false;
        }
        if (!IsDestination(chatDestination) || !IsDestination(broadcastDestination) ||
            !IsDestination(userQueuePrefix))
        {
            SetError(reason, "destinations must start with '/'");
            return false;
        }
        if (maxFrameSize == 0 || maxFrameSize > 64ULL * 1024 * 1024)
        {
            SetError(reason, "maxFrameSize must be in (0, 64MB]");
            return false;
        }
        if (pingIntervalSeconds < 0)
        {
            SetError(reason, "pingIntervalSeconds must be >= 0");
            return false;
        }
        return true;
    }

    std::string Config::EffectiveHost() const
    {
        if (!host.empty())
            return host;

        size_t start = brokerUrl.find("://");
        start = (start == std::string::npos) ? 0 : start + 3;

        size_t end = brokerUrl.find_first_of("/?#", start);
        std::string authority = brokerUrl.substr(start,
            end == std::string::npos ? std::string::npos : end - start);

        // Strip credentials and port; keep IPv6 literals intact
        size_t at = authority.rfind('@');
        if (at != std::string::npos)
            authority = authority.substr(at + 1);

        if (!authority.empty() && authority[0] == '[')
        {
            size_t close = authority.find(']');
            return close == std::string::npos ? authority : authority.substr(0, close + 1);
        }

        size_t colon = authority.find(':');
        return colon == std::string::npos ? authority : authority.substr(0, colon);
    }

    bool LoadConfigJson(const std::string& text, Config& config, std::string* error)
    {
        json root;
        try
        {
            root = json::parse(text);
        }
        catch (const json::exception& e)
        {
            SetError(error, std::string("invalid JSON: ") + e.what());
            return false;
        }

        if (!root.is_object())
        {
            SetError(error, "configuration must be a JSON object");
            return false;
        }

        Config loaded = config;
        bool ok =
            ReadString(root, "brokerUrl", loaded.brokerUrl, error) &&
            ReadString(root, "userId", loaded.userId, error) &&
            ReadString(root, "authToken", loaded.authToken, error) &&
            ReadString(root, "host", loaded.host, error) &&
            ReadInt(root, "connectionTimeoutMs", loaded.connectionTimeoutMs, error) &&
            ReadInt(root, "heartbeatIncomingMs", loaded.heartbeatIncomingMs, error) &&
            ReadInt(root, "heartbeatOutgoingMs", loaded.heartbeatOutgoingMs, error) &&
            ReadInt(root, "heartbeatTolerance", loaded.heartbeatTolerance, error) &&
            ReadInt(root, "reconnectDelayMs", loaded.reconnectDelayMs, error) &&
            ReadDouble(root, "reconnectBackoffMultiplier", loaded.reconnectBackoffMultiplier, error) &&
            ReadInt(root, "maxReconnectDelayMs", loaded.maxReconnectDelayMs, error) &&
            ReadString(root, "chatDestination", loaded.chatDestination, error) &&
            ReadString(root, "broadcastDestination", loaded.broadcastDestination, error) &&
            ReadString(root, "userQueuePrefix", loaded.userQueuePrefix, error) &&
            ReadSize(root, "maxFrameSize", loaded.maxFrameSize, error) &&
            ReadBool(root, "enableCompression", loaded.enableCompression, error) &&
            ReadInt(root, "pingIntervalSeconds", loaded.pingIntervalSeconds, error);
        if (!ok)
            return false;

        auto headers = root.find("connectHeaders");
        if (headers != root.end())
        {
            if (!headers->is_object())
            {
                SetError(error, "'connectHeaders' must be an object");
                return false;
            }

            loaded.connectHeaders.clear();
            for (auto it = headers->begin(); it != headers->end(); ++it)
            {
                if (!it.value().is_string())
                {
                    SetError(error, "connect header '" + it.key() + "' must be a string");
                    return false;
                }
                loaded.connectHeaders.emplace_back(it.key(), it.value().get<std::string>());
            }
        }

        std::string reason;
        if (!loaded.IsValid(&reason))
        {
            SetError(error, "invalid configuration: " + reason);
            return false;
        }

        config = loaded;
        return true;
    }

    bool LoadConfigFile(const std::string& path, Config& config, std::string* error)
    {
        std::ifstream file(path);
        if (!file)
        {
            SetError(error, "cannot open " + path);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        if (!LoadConfigJson(buffer.str(), config, error))
            return false;

        Logger::Instance().Info("Protocol", "Configuration loaded from " + path);
        return true;
    }

    std::string StreamTypeToString(StreamType type)
    {
        switch (type)
        {
        case StreamType::Start:   return "START";
        case StreamType::Chunk:   return "CHUNK";
        case StreamType::End:     return "END";
        case StreamType::Error:   return "ERROR";
        case StreamType::Unknown:
        default:                  return "UNKNOWN";
        }
    }

    bool ParseStreamEnvelope(const std::string& text, StreamEnvelope& envelope, std::string* error)
    {
        json root;
        try
        {
            root = json::parse(text);
        }
        catch (const json::exception& e)
        {
            SetError(error, std::string("malformed JSON: ") + e.what());
            return false;
        }

        if (!root.is_object())
        {
            SetError(error, "envelope is not a JSON object");
            return false;
        }

        StreamEnvelope parsed;

        auto type = root.find("type");
        if (type != root.end() && type->is_string())
        {
            const std::string& name = type->get_ref<const std::string&>();
            if (name == "START")
                parsed.type = StreamType::Start;
            else if (name == "CHUNK")
                parsed.type = StreamType::Chunk;
            else if (name == "END")
                parsed.type = StreamType::End;
            else if (name == "ERROR")
                parsed.type = StreamType::Error;
        }

        auto content = root.find("content");
        if (content != root.end() && content->is_string())
            parsed.content = content->get<std::string>();

        auto errorField = root.find("error");
        if (errorField != root.end() && errorField->is_string())
        {
            parsed.error = errorField->get<std::string>();
            parsed.hasError = true;
        }

        auto timestamp = root.find("timestamp");
        if (timestamp != root.end())
        {
            // Values that do not fit in int64_t leave the timestamp at 0
            if (timestamp->is_number_unsigned())
            {
                uint64_t value = timestamp->get<uint64_t>();
                if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    parsed.timestamp = static_cast<int64_t>(value);
            }
            else if (timestamp->is_number_integer())
            {
                parsed.timestamp = timestamp->get<int64_t>();
            }
            else if (timestamp->is_number_float())
            {
                const double limit = 9223372036854775808.0;
                double value = timestamp->get<double>();
                if (value > -limit && value < limit)
                    parsed.timestamp = static_cast<int64_t>(value);
            }
        }

        auto correlation = root.find("correlationId");
        if (correlation != root.end())
        {
            if (correlation->is_string())
                parsed.correlationId = correlation->get<std::string>();
            else if (correlation->is_number())
                parsed.correlationId = correlation->dump();
        }

        envelope = parsed;
        return true;
    }

    std::string SerializeChatRequest(const ChatRequest& request)
    {
        json body = {
            { "userId", request.userId },
            { "message", request.message },
            { "messageId", request.messageId },
        };

        if (!request.token.empty())
            body["token"] = request.token;

        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string SerializeBroadcast(const std::string& userId, const std::string& message)
    {
        json body = {
            { "userId", userId },
            { "message", message },
        };
        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string GenerateRequestId()
    {
        static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        thread_local std::mt19937 generator(std::random_device{}());
        std::uniform_int_distribution<int> pick(0, 35);

        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        std::string suffix;
        for (int i = 0; i < 9; ++i)
            suffix += kAlphabet[pick(generator)];

        return "msg_" + std::to_string(now) + "_" + suffix;
    }
}
