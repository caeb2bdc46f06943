#include "sync_client.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

namespace {
constexpr int kReadPollMs = 50;
constexpr int kSleepSliceMs = 50;
constexpr const char* kDefaultProfile = "default";
}

namespace bbd {

const char* ConnectionStateName(SyncClient::ConnectionState state) {
    switch (state) {
    case SyncClient::ConnectionState::Disconnected:
        return "disconnected";
    case SyncClient::ConnectionState::Connecting:
        return "connecting";
    case SyncClient::ConnectionState::Unauthenticated:
        return "unauthenticated";
    case SyncClient::ConnectionState::Authenticated:
        return "authenticated";
    }
    return "unknown";
}

SyncClient::SyncClient(SharedState& state, TransportFactory transport_factory)
    : state_(state), transport_factory_(std::move(transport_factory)) {}

SyncClient::~SyncClient() {
    Disconnect();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void SyncClient::SetOptions(Options options) {
    options_ = std::move(options);
}

void SyncClient::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

void SyncClient::SetCallbacks(Callbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

bool SyncClient::IsRunning() const {
    return running_.load();
}

SyncClient::ConnectionState SyncClient::State() const {
    std::lock_guard<std::mutex> lock(mu_);
    return connection_state_;
}

std::string SyncClient::Url() const {
    return BuildSessionUrl(options_.endpoint, options_.profile.empty() ? kDefaultProfile : options_.profile);
}

std::uint64_t SyncClient::ReconnectCount() const {
    return reconnect_count_.load();
}

void SyncClient::Connect() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this] { WorkerLoop(); });
}

void SyncClient::Disconnect() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (active_transport_) {
            active_transport_->Cancel();
        }
    }
    // Called from one of our own callbacks: the worker winds down by itself.
    if (worker_.get_id() == std::this_thread::get_id()) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SyncClient::Submit(const Command& command) {
    ConnectionState current = ConnectionState::Disconnected;
    {
        std::lock_guard<std::mutex> lock(mu_);
        current = connection_state_;
        if (current == ConnectionState::Authenticated) {
            pending_commands_.push_back(command);
            return true;
        }
    }
    std::ostringstream oss;
    oss << "dropped command type=" << CommandWireType(command.type)
        << " state=" << ConnectionStateName(current);
    Log(LogLevel::Debug, oss.str());
    return false;
}

bool SyncClient::ReportDeath() {
    return Submit(Command::Of(CommandType::Death));
}

bool SyncClient::ReportBossDeath() {
    return Submit(Command::Of(CommandType::BossDeath));
}

bool SyncClient::BossStart() {
    return Submit(Command::Of(CommandType::BossStart));
}

bool SyncClient::BossPause() {
    return Submit(Command::Of(CommandType::BossPause));
}

bool SyncClient::BossResume() {
    return Submit(Command::Of(CommandType::BossResume));
}

bool SyncClient::BossVictory(const std::string& boss_name) {
    return Submit(Command::BossVictory(boss_name));
}

bool SyncClient::BossCancel() {
    return Submit(Command::Of(CommandType::BossCancel));
}

bool SyncClient::StartTimer() {
    return Submit(Command::Of(CommandType::StartTimer));
}

bool SyncClient::StopTimer() {
    return Submit(Command::Of(CommandType::StopTimer));
}

bool SyncClient::ResetTimer() {
    return Submit(Command::Of(CommandType::ResetTimer));
}

void SyncClient::WorkerLoop() {
    const std::string url = Url();
    Log(LogLevel::Info, "sync worker started url=" + url);

    int delay_ms = options_.reconnect_delay_ms;
    while (running_.load()) {
        SetConnectionState(ConnectionState::Connecting);
        std::unique_ptr<Transport> transport = transport_factory_ ? transport_factory_() : nullptr;
        if (!transport) {
            Log(LogLevel::Warning, "no transport available");
            SetConnectionState(ConnectionState::Disconnected);
            ScheduleReconnect(delay_ms);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            active_transport_ = transport.get();
        }
        // Disconnect() may have run before the transport was published.
        if (!running_.load()) {
            transport->Cancel();
        }

        if (!transport->Open(url, options_.connect_timeout_ms)) {
            {
                std::lock_guard<std::mutex> lock(mu_);
                active_transport_ = nullptr;
            }
            transport.reset();
            SetConnectionState(ConnectionState::Disconnected);
            if (!running_.load()) {
                break;
            }
            std::ostringstream oss;
            oss << "connect failed url=" << url << " retry_in_ms=" << delay_ms;
            Log(LogLevel::Info, oss.str());
            ScheduleReconnect(delay_ms);
            delay_ms = std::min(delay_ms * 2, std::max(options_.max_reconnect_delay_ms, options_.reconnect_delay_ms));
            continue;
        }

        delay_ms = options_.reconnect_delay_ms;
        OnTransportOpened();
        ConnectedSessionLoop(*transport);
        transport->Close();
        {
            std::lock_guard<std::mutex> lock(mu_);
            active_transport_ = nullptr;
        }
        transport.reset();
        OnSessionEnded();

        if (!running_.load()) {
            break;
        }
        ScheduleReconnect(delay_ms);
    }
    SetConnectionState(ConnectionState::Disconnected);
    Log(LogLevel::Info, "sync worker stopped");
}

void SyncClient::ConnectedSessionLoop(Transport& transport) {
    auth_sent_ = false;
    while (running_.load()) {
        if (!DrainPendingCommands(transport)) {
            Log(LogLevel::Warning, "command send failed; ending session for reconnect");
            break;
        }

        std::string text;
        const Transport::ReadResult read_result = transport.Read(text, kReadPollMs);
        if (read_result == Transport::ReadResult::Message) {
            if (!HandleIncomingMessage(transport, text)) {
                Log(LogLevel::Warning, "bb-auth send failed; ending session for reconnect");
                break;
            }
            continue;
        }
        if (read_result == Transport::ReadResult::Closed) {
            if (running_.load()) {
                Log(LogLevel::Info, "connection closed; ending session for reconnect");
            }
            break;
        }
        // timeout: poll again
    }
}

void SyncClient::OnTransportOpened() {
    SetConnectionState(ConnectionState::Unauthenticated);
    state_.Set(Field::Connected, true);
    Log(LogLevel::Info, "connected");
    if (callbacks_.on_connect) {
        callbacks_.on_connect();
    }
}

void SyncClient::OnSessionEnded() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        dropped = pending_commands_.size();
        pending_commands_.clear();
        connection_state_ = ConnectionState::Disconnected;
    }
    if (callbacks_.on_connection_state) {
        callbacks_.on_connection_state(ConnectionState::Disconnected);
    }
    // canEdit first: canEdit implies connected at every observable point.
    state_.Merge(StatePatch{{Field::CanEdit, false}, {Field::Connected, false}});

    std::ostringstream oss;
    oss << "disconnected";
    if (dropped > 0) {
        oss << " dropped_commands=" << dropped;
    }
    Log(LogLevel::Info, oss.str());
    if (callbacks_.on_disconnect) {
        callbacks_.on_disconnect();
    }
}

void SyncClient::ScheduleReconnect(int delay_ms) {
    reconnect_count_.fetch_add(1);
    std::ostringstream oss;
    oss << "reconnect scheduled delay_ms=" << delay_ms;
    Log(LogLevel::Debug, oss.str());
    SleepInterruptible(delay_ms);
}

void SyncClient::SleepInterruptible(int ms) {
    int remaining = ms;
    while (running_.load() && remaining > 0) {
        const int step = remaining < kSleepSliceMs ? remaining : kSleepSliceMs;
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        remaining -= step;
    }
}

bool SyncClient::DrainPendingCommands(Transport& transport) {
    std::vector<Command> pending;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (connection_state_ != ConnectionState::Authenticated || pending_commands_.empty()) {
            return true;
        }
        pending.swap(pending_commands_);
    }
    for (const auto& command : pending) {
        if (!transport.Send(EncodeCommand(command))) {
            std::ostringstream oss;
            oss << "failed to send command type=" << CommandWireType(command.type);
            Log(LogLevel::Warning, oss.str());
            return false;
        }
        std::ostringstream oss;
        oss << "sent command type=" << CommandWireType(command.type);
        Log(LogLevel::Info, oss.str());
    }
    return true;
}

bool SyncClient::HandleIncomingMessage(Transport& transport, const std::string& text) {
    const InboundMessage msg = DecodeInbound(text);
    switch (msg.kind) {
    case InboundMessage::Kind::Invalid: {
        std::ostringstream oss;
        oss << "discarded malformed message bytes=" << text.size();
        Log(LogLevel::Warning, oss.str());
        return true;
    }
    case InboundMessage::Kind::State: {
        const bool grants_edit = msg.state.has_can_edit && msg.state.can_edit;
        if (grants_edit) {
            MarkAuthenticated(true);
        }
        const bool authenticated = State() == ConnectionState::Authenticated;

        StatePatch patch = SnapshotToPatch(msg.state);
        patch.emplace_back(Field::Connected, true);
        patch.emplace_back(Field::CanEdit, authenticated);
        state_.Merge(patch);

        std::ostringstream oss;
        oss << "received bb-state deaths=" << msg.state.deaths
            << " boss_mode=" << (msg.state.boss_fight_mode ? "true" : "false")
            << " can_edit=" << (authenticated ? "true" : "false");
        Log(LogLevel::Debug, oss.str());

        if (!authenticated && !auth_sent_ && !options_.password.empty()) {
            return SendAuth(transport);
        }
        return true;
    }
    case InboundMessage::Kind::AuthResult: {
        MarkAuthenticated(msg.auth_success);
        if (msg.auth_success) {
            Log(LogLevel::Info, "authenticated");
        } else {
            Log(LogLevel::Warning, "authentication failed error=" + msg.error);
        }
        if (callbacks_.on_auth_result) {
            callbacks_.on_auth_result(msg.auth_success, msg.error);
        }
        return true;
    }
    case InboundMessage::Kind::Error: {
        std::ostringstream oss;
        oss << "server error=" << msg.error;
        if (!msg.code.empty()) {
            oss << " code=" << msg.code;
        }
        Log(LogLevel::Warning, oss.str());
        return true;
    }
    case InboundMessage::Kind::Other:
        Log(LogLevel::Debug, "ignored message type=" + msg.type);
        return true;
    }
    return true;
}

bool SyncClient::SendAuth(Transport& transport) {
    // Once per connection, even if this send fails.
    auth_sent_ = true;
    if (!transport.Send(EncodeAuth(options_.password))) {
        return false;
    }
    Log(LogLevel::Info, "sent bb-auth");
    return true;
}

void SyncClient::MarkAuthenticated(bool authenticated) {
    bool changed = false;
    ConnectionState next = ConnectionState::Disconnected;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (connection_state_ != ConnectionState::Unauthenticated &&
            connection_state_ != ConnectionState::Authenticated) {
            return;
        }
        next = authenticated ? ConnectionState::Authenticated : ConnectionState::Unauthenticated;
        changed = connection_state_ != next;
        connection_state_ = next;
    }
    state_.Set(Field::CanEdit, authenticated);
    if (changed && callbacks_.on_connection_state) {
        callbacks_.on_connection_state(next);
    }
}

void SyncClient::SetConnectionState(ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (connection_state_ == state) {
            return;
        }
        connection_state_ = state;
    }
    Log(LogLevel::Debug, std::string("connection state=") + ConnectionStateName(state));
    if (callbacks_.on_connection_state) {
        callbacks_.on_connection_state(state);
    }
}

void SyncClient::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
