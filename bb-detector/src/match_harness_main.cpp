#include "template_matcher.h"

#include <opencv2/imgcodecs.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cout << "usage: bbd_match_harness <template.png> <frame.png> [threshold]\n";
        return 2;
    }

    double threshold = bbd::TemplateMatcher::kDefaultThreshold;
    if (argc == 4) {
        char* end = nullptr;
        threshold = std::strtod(argv[3], &end);
        if (end == argv[3] || *end != '\0') {
            std::cout << "invalid threshold: " << argv[3] << "\n";
            return 2;
        }
    }

    bbd::TemplateMatcher matcher;
    if (!matcher.ReloadFromFile(argv[1], threshold)) {
        std::cout << "cannot read template: " << argv[1] << "\n";
        return 1;
    }
    const cv::Mat frame = cv::imread(argv[2], cv::IMREAD_UNCHANGED);
    if (frame.empty()) {
        std::cout << "cannot read frame: " << argv[2] << "\n";
        return 1;
    }

    const bbd::MatchResult result = matcher.IsMatch(frame);
    std::cout << "score=" << result.confidence << " threshold=" << threshold
              << " matched=" << (result.matched ? "true" : "false") << "\n";
    return result.matched ? 0 : 3;
}
