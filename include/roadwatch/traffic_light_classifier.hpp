#pragma once

#include <opencv2/core.hpp>

#include "roadwatch/types.hpp"

namespace roadwatch {

// Color of a traffic light crop from HSV pixel counts. DetectionIntake runs it
// on light detections that carry a crop but no detector-assigned color.
class TrafficLightClassifier {
public:
    struct Params {
        int min_saturation{50};
        int min_value{50};
        float min_lit_fraction{0.02f};  // lit pixels / crop pixels below this -> unknown
    };

    TrafficLightClassifier() = default;
    explicit TrafficLightClassifier(const Params& params) : params_(params) {}

    // confidence = share of the dominant color among lit pixels.
    TrafficLightState classify(const cv::Mat& bgr_roi) const;

private:
    Params params_{};
};

}  // namespace roadwatch
