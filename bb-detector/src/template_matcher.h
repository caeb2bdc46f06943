#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace bbd {

struct MatchResult {
    bool matched = false;
    double confidence = 0.0;
};

class FrameMatcher {
public:
    virtual ~FrameMatcher() = default;
    virtual MatchResult IsMatch(const cv::Mat& frame) const = 0;
};

// Inclusive: a score equal to the threshold matches.
bool MeetsThreshold(double score, double threshold);

// Normalized-correlation matcher against one reference template. Reload swaps
// the template and threshold together; IsMatch works on whichever pair was
// current when it started.
class TemplateMatcher : public FrameMatcher {
public:
    static constexpr double kDefaultThreshold = 0.75;

    TemplateMatcher() = default;

    TemplateMatcher(const TemplateMatcher&) = delete;
    TemplateMatcher& operator=(const TemplateMatcher&) = delete;

    void Reload(const cv::Mat& image, double threshold);
    bool ReloadFromFile(const std::string& path, double threshold);
    void Clear();

    bool HasTemplate() const;
    double Threshold() const;

    MatchResult IsMatch(const cv::Mat& frame) const override;

    // Best TM_CCOEFF_NORMED score of tmpl anywhere inside frame, in [-1, 1].
    // Empty inputs or a template larger than the frame score 0.
    static double Score(const cv::Mat& frame, const cv::Mat& tmpl);

private:
    struct Reference {
        cv::Mat gray;
        double threshold = kDefaultThreshold;
    };

    std::shared_ptr<const Reference> Current() const;

    mutable std::mutex mu_;
    std::shared_ptr<const Reference> reference_;
};

} // namespace bbd
