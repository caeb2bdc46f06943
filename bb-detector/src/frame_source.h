#pragma once

#include <opencv2/core.hpp>

namespace bbd {

// Screen capture backend. An empty Mat means no frame this tick.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual cv::Mat Grab() = 0;
    virtual cv::Mat GrabRegion(int x, int y, int width, int height) = 0;
};

} // namespace bbd
