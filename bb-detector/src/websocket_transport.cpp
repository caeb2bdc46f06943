#include "websocket_transport.h"

#include <QtCore/QEventLoop>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtWebSockets/QWebSocket>

#include <algorithm>
#include <chrono>

namespace {
constexpr int kWaitSliceMs = 50;
constexpr int kCloseTimeoutMs = 500;
}

namespace bbd {

WebSocketTransport::WebSocketTransport() = default;

WebSocketTransport::~WebSocketTransport() {
    if (socket_) {
        socket_->abort();
    }
}

bool WebSocketTransport::Open(const std::string& url, int timeout_ms) {
    inbox_.clear();
    closed_ = false;
    socket_ = std::make_unique<QWebSocket>();

    QObject::connect(socket_.get(), &QWebSocket::textMessageReceived, [this](const QString& message) {
        inbox_.push_back(message.toStdString());
    });
    QObject::connect(socket_.get(), &QWebSocket::stateChanged, [this](QAbstractSocket::SocketState state) {
        if (state == QAbstractSocket::UnconnectedState) {
            closed_ = true;
        }
    });

    socket_->open(QUrl(QString::fromStdString(url)));
    WaitUntil(
        [this] { return closed_ || socket_->state() == QAbstractSocket::ConnectedState; },
        timeout_ms);
    if (socket_->state() == QAbstractSocket::ConnectedState) {
        return true;
    }
    socket_->abort();
    socket_.reset();
    return false;
}

bool WebSocketTransport::Send(const std::string& text) {
    if (!socket_ || closed_ || socket_->state() != QAbstractSocket::ConnectedState) {
        return false;
    }
    const QString payload = QString::fromStdString(text);
    const qint64 sent = socket_->sendTextMessage(payload);
    if (sent != static_cast<qint64>(payload.toUtf8().size())) {
        return false;
    }
    socket_->flush();
    return socket_->state() == QAbstractSocket::ConnectedState;
}

Transport::ReadResult WebSocketTransport::Read(std::string& out, int timeout_ms) {
    out.clear();
    if (!socket_) {
        return ReadResult::Closed;
    }
    if (inbox_.empty() && !closed_) {
        WaitUntil([this] { return !inbox_.empty() || closed_; }, timeout_ms);
    }
    if (!inbox_.empty()) {
        out = std::move(inbox_.front());
        inbox_.pop_front();
        return ReadResult::Message;
    }
    if (closed_ || cancelled_.load()) {
        return ReadResult::Closed;
    }
    return ReadResult::Timeout;
}

void WebSocketTransport::Close() {
    if (!socket_) {
        return;
    }
    if (!closed_) {
        socket_->close();
        WaitUntil([this] { return closed_; }, kCloseTimeoutMs);
    }
    socket_->abort();
    socket_.reset();
    inbox_.clear();
}

void WebSocketTransport::Cancel() {
    cancelled_.store(true);
}

bool WebSocketTransport::WaitUntil(const std::function<bool()>& done, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (cancelled_.load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int slice = static_cast<int>(std::min<long long>(kWaitSliceMs, remaining + 1));

        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        QObject::connect(socket_.get(), &QWebSocket::textMessageReceived, &loop, &QEventLoop::quit);
        QObject::connect(socket_.get(), &QWebSocket::stateChanged, &loop, &QEventLoop::quit);
        timer.start(slice);
        loop.exec();
    }
    return true;
}

} // namespace bbd
