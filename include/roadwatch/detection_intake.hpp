#pragma once

#include <cstdint>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/traffic_light_classifier.hpp"
#include "roadwatch/types.hpp"

namespace roadwatch {

// Per-frame detections that passed the confidence gates, grouped by class.
struct FrameObservations {
    int64_t frame_index{0};
    double timestamp_sec{0.0};
    int width{0};
    int height{0};
    std::vector<Detection> vehicles;
    std::vector<Detection> persons;
    std::vector<Detection> helmets;
    std::vector<Detection> plates;
    std::vector<Detection> traffic_lights;
    TrafficLightState light{};
    int dropped_low_confidence{0};
    int dropped_malformed{0};
};

// Single gate for false-positive pressure: nothing below its class threshold
// and no malformed box is forwarded downstream. Traffic lights that arrive
// with a pixel crop but no color are colored here.
class DetectionIntake {
public:
    explicit DetectionIntake(const PipelineConfig& cfg);

    FrameObservations normalize(const Frame& frame) const;

private:
    float threshold_for(ObjectClass c) const;
    bool sanitize(const Frame& frame, Detection& det) const;

    PipelineConfig cfg_;
    TrafficLightClassifier light_classifier_;
};

}  // namespace roadwatch
