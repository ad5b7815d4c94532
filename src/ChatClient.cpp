#include "ChatClient.hpp"
#include "Logger.hpp"

ChatClient::ChatClient(const Protocol::Config& config, IScheduler& scheduler,
                       std::unique_ptr<IWebSocket> socket)
    : mConfig(config),
      mManager(config, scheduler, std::move(socket)),
      mRegistry(mManager),
      mPublisher(config, mManager)
{
    // Internal observers first: subscriptions are restored before the application hears
    // about Connected
    mManager.StateChanged().Connect(
        [this](ConnectionState state) { mRegistry.OnConnectionStateChanged(state); });

    mManager.StateChanged().Connect(
        [this](ConnectionState state)
        {
            if (state == ConnectionState::Connected)
                mDispatcher.Reset();
        });

    mManager.FrameReceived().Connect(
        [this](const Stomp::Frame& frame) { mRegistry.Route(frame); });

    Logger::Instance().Info("ChatClient", "Created for user " + mConfig.userId + " at " + mConfig.brokerUrl);
}

ChatClient::~ChatClient()
{
    mDispatcher.Events().DisconnectAll();
    mManager.StateChanged().DisconnectAll();
    mManager.FrameReceived().DisconnectAll();

    if (mManager.GetState() != ConnectionState::Disconnected || mManager.IsReconnectPending())
    {
        mRegistry.UnsubscribeAll();
        mManager.Disconnect();
    }
}

bool ChatClient::Connect()
{
    std::string queue = mConfig.UserQueue();
    if (!mRegistry.IsSubscribed(queue))
    {
        mRegistry.Subscribe(queue,
            [this](const Stomp::Frame& frame) { OnUserQueueMessage(frame); });
    }

    Logger::Instance().Info("ChatClient", "Connecting as " + mConfig.userId);
    return mManager.Connect();
}

void ChatClient::Disconnect()
{
    Logger::Instance().Info("ChatClient", "Disconnecting");
    mRegistry.UnsubscribeAll();
    mManager.Disconnect();
}

bool ChatClient::SendMessage(const std::string& text)
{
    return mPublisher.SendChatMessage(text);
}

bool ChatClient::BroadcastMessage(const std::string& text)
{
    return mPublisher.BroadcastMessage(text);
}

ChatClient::ObserverId ChatClient::OnMessage(MessageCallback callback)
{
    return mDispatcher.Events().Connect(std::move(callback));
}

ChatClient::ObserverId ChatClient::OnConnectionChange(ConnectionCallback callback)
{
    return mManager.StateChanged().Connect(std::move(callback));
}

bool ChatClient::RemoveMessageObserver(ObserverId id)
{
    return mDispatcher.Events().Disconnect(id);
}

bool ChatClient::RemoveConnectionObserver(ObserverId id)
{
    return mManager.StateChanged().Disconnect(id);
}

void ChatClient::OnUserQueueMessage(const Stomp::Frame& frame)
{
    mDispatcher.Dispatch(frame.body);
}
