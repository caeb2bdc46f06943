#include "template_matcher.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace {

// Single intensity channel, 32-bit float. Empty on unsupported layouts.
cv::Mat ToGrayFloat(const cv::Mat& image) {
    if (image.empty()) {
        return cv::Mat();
    }
    cv::Mat gray;
    switch (image.channels()) {
    case 1:
        gray = image;
        break;
    case 3:
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        return cv::Mat();
    }
    cv::Mat out;
    gray.convertTo(out, CV_32F);
    return out;
}

double ScoreGray(const cv::Mat& frame_gray, const cv::Mat& tmpl_gray) {
    if (frame_gray.empty() || tmpl_gray.empty()) {
        return 0.0;
    }
    if (frame_gray.cols < tmpl_gray.cols || frame_gray.rows < tmpl_gray.rows) {
        return 0.0;
    }
    cv::Mat result;
    cv::matchTemplate(frame_gray, tmpl_gray, result, cv::TM_CCOEFF_NORMED);
    double max_val = 0.0;
    cv::minMaxLoc(result, nullptr, &max_val, nullptr, nullptr);
    if (!std::isfinite(max_val)) {
        return 0.0;
    }
    return std::max(-1.0, std::min(1.0, max_val));
}

} // namespace

namespace bbd {

bool MeetsThreshold(double score, double threshold) {
    return score >= threshold;
}

void TemplateMatcher::Reload(const cv::Mat& image, double threshold) {
    auto next = std::make_shared<Reference>();
    next->gray = ToGrayFloat(image);
    next->threshold = threshold;
    std::lock_guard<std::mutex> lock(mu_);
    reference_ = std::move(next);
}

bool TemplateMatcher::ReloadFromFile(const std::string& path, double threshold) {
    const cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        Clear();
        return false;
    }
    Reload(image, threshold);
    return true;
}

void TemplateMatcher::Clear() {
    std::lock_guard<std::mutex> lock(mu_);
    reference_.reset();
}

bool TemplateMatcher::HasTemplate() const {
    const auto ref = Current();
    return ref && !ref->gray.empty();
}

double TemplateMatcher::Threshold() const {
    const auto ref = Current();
    return ref ? ref->threshold : kDefaultThreshold;
}

MatchResult TemplateMatcher::IsMatch(const cv::Mat& frame) const {
    MatchResult result;
    const auto ref = Current();
    if (!ref || ref->gray.empty()) {
        return result;
    }
    const cv::Mat frame_gray = ToGrayFloat(frame);
    if (frame_gray.empty() || frame_gray.cols < ref->gray.cols || frame_gray.rows < ref->gray.rows) {
        return result;
    }
    result.confidence = ScoreGray(frame_gray, ref->gray);
    result.matched = MeetsThreshold(result.confidence, ref->threshold);
    return result;
}

double TemplateMatcher::Score(const cv::Mat& frame, const cv::Mat& tmpl) {
    return ScoreGray(ToGrayFloat(frame), ToGrayFloat(tmpl));
}

std::shared_ptr<const TemplateMatcher::Reference> TemplateMatcher::Current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reference_;
}

} // namespace bbd
