#include "roadwatch/traffic_light_classifier.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace roadwatch {

TrafficLightState TrafficLightClassifier::classify(const cv::Mat& bgr_roi) const {
    TrafficLightState state;
    if (bgr_roi.empty() || bgr_roi.channels() != 3) return state;

    cv::Mat hsv;
    cv::cvtColor(bgr_roi, hsv, cv::COLOR_BGR2HSV);

    const int s = params_.min_saturation;
    const int v = params_.min_value;
    cv::Mat red_low, red_high, yellow, green;
    cv::inRange(hsv, cv::Scalar(0, s, v), cv::Scalar(10, 255, 255), red_low);
    cv::inRange(hsv, cv::Scalar(170, s, v), cv::Scalar(180, 255, 255), red_high);
    cv::inRange(hsv, cv::Scalar(20, s, v), cv::Scalar(30, 255, 255), yellow);
    cv::inRange(hsv, cv::Scalar(40, s, v), cv::Scalar(80, 255, 255), green);

    cv::Mat red = red_low | red_high;
    const int red_px = cv::countNonZero(red);
    const int yellow_px = cv::countNonZero(yellow);
    const int green_px = cv::countNonZero(green);
    const int lit = red_px + yellow_px + green_px;
    const int total = bgr_roi.rows * bgr_roi.cols;
    if (lit == 0 || static_cast<float>(lit) / static_cast<float>(total) < params_.min_lit_fraction) {
        return state;
    }

    int dominant = green_px;
    state.color = TrafficLightColor::GREEN;
    if (red_px > std::max(yellow_px, green_px)) {
        dominant = red_px;
        state.color = TrafficLightColor::RED;
    } else if (yellow_px > green_px) {
        dominant = yellow_px;
        state.color = TrafficLightColor::YELLOW;
    }
    state.confidence = static_cast<float>(dominant) / static_cast<float>(lit);
    return state;
}

}  // namespace roadwatch
