#pragma once

#include "transport.h"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

class QWebSocket;

namespace bbd {

// QWebSocket driven synchronously from a plain worker thread: every wait spins a
// short local QEventLoop so the socket's signals are delivered on this thread.
class WebSocketTransport : public Transport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool Open(const std::string& url, int timeout_ms) override;
    bool Send(const std::string& text) override;
    ReadResult Read(std::string& out, int timeout_ms) override;
    void Close() override;
    void Cancel() override;

private:
    bool WaitUntil(const std::function<bool()>& done, int timeout_ms);

    std::unique_ptr<QWebSocket> socket_;
    std::deque<std::string> inbox_;
    bool closed_ = false;
    std::atomic<bool> cancelled_{false};
};

} // namespace bbd
