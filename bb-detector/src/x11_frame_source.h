#pragma once

#include "frame_source.h"
#include "log.h"

#include <mutex>
#include <string>

typedef struct _XDisplay Display;

namespace bbd {

// Root-window capture through XGetImage. Frames come back as 3-channel BGR.
class X11FrameSource : public FrameSource {
public:
    X11FrameSource();
    ~X11FrameSource() override;

    X11FrameSource(const X11FrameSource&) = delete;
    X11FrameSource& operator=(const X11FrameSource&) = delete;

    // display_name empty means $DISPLAY.
    bool Open(const std::string& display_name = std::string());
    void Close();
    bool IsOpen() const;

    void SetLogger(LogFn logger);

    cv::Mat Grab() override;
    cv::Mat GrabRegion(int x, int y, int width, int height) override;

private:
    cv::Mat Capture(int x, int y, int width, int height);
    void Log(LogLevel level, const std::string& msg) const;

    mutable std::mutex mu_;
    Display* display_ = nullptr;
    unsigned long root_ = 0;
    int screen_width_ = 0;
    int screen_height_ = 0;
    bool warned_format_ = false;
    LogFn logger_;
};

} // namespace bbd
