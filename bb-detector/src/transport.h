#pragma once

#include <string>

namespace bbd {

// One duplex text-message connection. All calls except Cancel() come from the
// sync client's I/O worker thread.
class Transport {
public:
    enum class ReadResult {
        Timeout,
        Message,
        Closed,
    };

    virtual ~Transport() = default;

    virtual bool Open(const std::string& url, int timeout_ms) = 0;
    virtual bool Send(const std::string& text) = 0;
    virtual ReadResult Read(std::string& out, int timeout_ms) = 0;
    virtual void Close() = 0;

    // Thread-safe. Makes pending and future waits return promptly.
    virtual void Cancel() = 0;
};

} // namespace bbd
