#pragma once

#include "command_sink.h"
#include "log.h"
#include "protocol.h"
#include "shared_state.h"
#include "transport.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bbd {

class SyncClient : public CommandSink {
public:
    enum class ConnectionState {
        Disconnected,
        Connecting,
        Unauthenticated,
        Authenticated,
    };

    struct Options {
        std::string endpoint = "wss://soulsdeaths.somework.dev/ws";
        std::string profile;
        std::string password;
        int connect_timeout_ms = 5000;
        int reconnect_delay_ms = 3000;
        int max_reconnect_delay_ms = 30000;
    };

    using ConnectFn = std::function<void()>;
    using DisconnectFn = std::function<void()>;
    using AuthResultFn = std::function<void(bool success, const std::string& error)>;
    using ConnectionStateFn = std::function<void(ConnectionState state)>;

    struct Callbacks {
        ConnectFn on_connect;
        DisconnectFn on_disconnect;
        AuthResultFn on_auth_result;
        ConnectionStateFn on_connection_state;
    };

    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    SyncClient(SharedState& state, TransportFactory transport_factory);
    ~SyncClient() override;

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    // Options and callbacks are read by the worker; set them before Connect().
    void SetOptions(Options options);
    void SetLogger(LogFn logger);
    void SetCallbacks(Callbacks callbacks);

    void Connect();
    void Disconnect();
    bool IsRunning() const;
    ConnectionState State() const;
    std::string Url() const;
    std::uint64_t ReconnectCount() const;

    bool Submit(const Command& command) override;

    bool ReportDeath();
    bool ReportBossDeath();
    bool BossStart();
    bool BossPause();
    bool BossResume();
    bool BossVictory(const std::string& boss_name);
    bool BossCancel();
    bool StartTimer();
    bool StopTimer();
    bool ResetTimer();

private:
    void WorkerLoop();
    void ConnectedSessionLoop(Transport& transport);
    void OnTransportOpened();
    void OnSessionEnded();
    void ScheduleReconnect(int delay_ms);
    void SleepInterruptible(int ms);
    bool DrainPendingCommands(Transport& transport);
    bool HandleIncomingMessage(Transport& transport, const std::string& text);
    bool SendAuth(Transport& transport);
    void MarkAuthenticated(bool authenticated);
    void SetConnectionState(ConnectionState state);

    void Log(LogLevel level, const std::string& msg) const;

    SharedState& state_;
    TransportFactory transport_factory_;
    Options options_;
    LogFn logger_;
    Callbacks callbacks_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::atomic<std::uint64_t> reconnect_count_{0};

    // Guards connection_state_, pending_commands_ and active_transport_ so that a
    // command is never admitted after its session has ended.
    mutable std::mutex mu_;
    ConnectionState connection_state_ = ConnectionState::Disconnected;
    std::vector<Command> pending_commands_;
    Transport* active_transport_ = nullptr;

    // Worker-thread only.
    bool auth_sent_ = false;
};

const char* ConnectionStateName(SyncClient::ConnectionState state);

} // namespace bbd
