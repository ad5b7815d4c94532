#include <iostream>
#include <memory>
#include <string>
#include "ChatClient.hpp"
#include "EventLoop.hpp"
#include "IxWebSocketConnection.hpp"
#include "Logger.hpp"

namespace
{
    void PrintUsage(const char* program)
    {
        std::cerr << "Usage: " << program
                  << " <config.json> [--url URL] [--user ID] [--token TOKEN] [--verbose]\n"
                  << "  Each stdin line is sent as a chat message.\n"
                  << "  /broadcast <text>  send a broadcast\n"
                  << "  /quit              disconnect and exit\n";
    }

    // Applies --url/--user/--token/--verbose; false on an unknown or incomplete option
    bool ApplyOverrides(int argc, char** argv, Protocol::Config& config, bool& verbose)
    {
        for (int i = 2; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--verbose")
            {
                verbose = true;
                continue;
            }

            if (i + 1 >= argc)
                return false;

            if (arg == "--url")
                config.brokerUrl = argv[++i];
            else if (arg == "--user")
                config.userId = argv[++i];
            else if (arg == "--token")
                config.authToken = argv[++i];
            else
                return false;
        }
        return true;
    }
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        PrintUsage(argv[0]);
        return 1;
    }

    Protocol::Config config;
    std::string error;
    if (!Protocol::LoadConfigFile(argv[1], config, &error))
    {
        Logger::Instance().Error("Main", "Failed to load configuration: " + error);
        return 1;
    }

    bool verbose = false;
    if (!ApplyOverrides(argc, argv, config, verbose))
    {
        PrintUsage(argv[0]);
        return 1;
    }

    // Overrides may have broken what the file got right
    if (!config.IsValid(&error))
    {
        Logger::Instance().Error("Main", "Invalid configuration: " + error);
        return 1;
    }

    Logger::Instance().SetMinLevel(verbose ? Logger::Level::Debug : Logger::Level::Info);
    Logger::Instance().Info("Main", "Starting chat client for user " + config.userId);

    EventLoop loop;
    if (!loop.Start())
    {
        Logger::Instance().Error("Main", "Failed to start event loop");
        return 1;
    }

    // The client lives on the loop thread; every call below goes through Invoke()
    std::unique_ptr<ChatClient> client = loop.Invoke([&]()
    {
        return std::make_unique<ChatClient>(config, loop,
            std::make_unique<IxWebSocketConnection>(loop, config));
    });

    loop.Invoke([&]()
    {
        client->OnConnectionChange([](ConnectionState state)
        {
            Logger::Instance().Info("App", "Connection: " + ConnectionStateToString(state));
        });

        client->OnMessage([](const ChatEvent& event)
        {
            switch (event.type)
            {
            case ChatEvent::Type::Typing:
                Logger::Instance().Info("App", "Assistant is typing...");
                break;
            case ChatEvent::Type::Message:
                std::cout << event.content << std::flush;
                break;
            case ChatEvent::Type::End:
                std::cout << std::endl;
                Logger::Instance().Info("App", "Response complete");
                break;
            case ChatEvent::Type::Error:
                Logger::Instance().Error("App", "Response failed: " + event.content);
                break;
            }
        });

        client->Connect();
    });

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line == "/quit")
            break;

        if (line.empty())
            continue;

        bool sent = false;
        if (line.compare(0, 11, "/broadcast ") == 0)
        {
            std::string text = line.substr(11);
            sent = loop.Invoke([&]() { return client->BroadcastMessage(text); });
        }
        else
        {
            sent = loop.Invoke([&]() { return client->SendMessage(line); });
        }

        if (!sent)
            Logger::Instance().Warning("Main", "Message not sent (state: " +
                ConnectionStateToString(loop.Invoke([&]() { return client->GetState(); })) + ")");
    }

    // Clean shutdown: the client must be destroyed on the loop thread
    loop.Invoke([&]()
    {
        client->Disconnect();
        client.reset();
    });
    loop.Stop();

    Logger::Instance().Info("Main", "Chat client stopped");
    return 0;
}
