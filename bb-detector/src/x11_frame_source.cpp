#include "x11_frame_source.h"

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace {

// Xlib's default handler exits the process; a failed XGetImage just yields no frame.
int IgnoreXError(Display*, XErrorEvent*) {
    return 0;
}

} // namespace

namespace bbd {

X11FrameSource::X11FrameSource() = default;

X11FrameSource::~X11FrameSource() {
    Close();
}

bool X11FrameSource::Open(const std::string& display_name) {
    std::lock_guard<std::mutex> lock(mu_);
    if (display_) {
        return true;
    }
    display_ = XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
    if (!display_) {
        Log(LogLevel::Warning, "capture open failed display=" + display_name);
        return false;
    }
    XSetErrorHandler(&IgnoreXError);
    const int screen = DefaultScreen(display_);
    root_ = RootWindow(display_, screen);
    screen_width_ = DisplayWidth(display_, screen);
    screen_height_ = DisplayHeight(display_, screen);

    std::ostringstream oss;
    oss << "capture opened width=" << screen_width_ << " height=" << screen_height_;
    Log(LogLevel::Info, oss.str());
    return true;
}

void X11FrameSource::Close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (display_) {
        XCloseDisplay(display_);
        display_ = nullptr;
    }
}

bool X11FrameSource::IsOpen() const {
    std::lock_guard<std::mutex> lock(mu_);
    return display_ != nullptr;
}

void X11FrameSource::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

cv::Mat X11FrameSource::Grab() {
    std::lock_guard<std::mutex> lock(mu_);
    return Capture(0, 0, screen_width_, screen_height_);
}

cv::Mat X11FrameSource::GrabRegion(int x, int y, int width, int height) {
    std::lock_guard<std::mutex> lock(mu_);
    const int left = std::max(0, x);
    const int top = std::max(0, y);
    const int right = std::min(screen_width_, x + width);
    const int bottom = std::min(screen_height_, y + height);
    if (right <= left || bottom <= top) {
        return cv::Mat();
    }
    return Capture(left, top, right - left, bottom - top);
}

cv::Mat X11FrameSource::Capture(int x, int y, int width, int height) {
    if (!display_ || width <= 0 || height <= 0) {
        return cv::Mat();
    }
    XImage* image = XGetImage(display_, root_, x, y, static_cast<unsigned int>(width),
                              static_cast<unsigned int>(height), AllPlanes, ZPixmap);
    if (!image) {
        return cv::Mat();
    }

    cv::Mat bgr;
    if (image->bits_per_pixel == 32) {
        const cv::Mat bgra(height, width, CV_8UC4, image->data, static_cast<size_t>(image->bytes_per_line));
        cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    } else if (!warned_format_) {
        warned_format_ = true;
        std::ostringstream oss;
        oss << "capture unsupported format bits_per_pixel=" << image->bits_per_pixel;
        Log(LogLevel::Warning, oss.str());
    }
    XDestroyImage(image);
    return bgr;
}

void X11FrameSource::Log(LogLevel level, const std::string& msg) const {
    if (logger_) {
        logger_(level, msg);
    }
}

} // namespace bbd
