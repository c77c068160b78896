#include "roadwatch/detection_intake.hpp"

#include <algorithm>
#include <cmath>

namespace roadwatch {

DetectionIntake::DetectionIntake(const PipelineConfig& cfg) : cfg_(cfg) {}

float DetectionIntake::threshold_for(ObjectClass c) const {
    switch (c) {
        case ObjectClass::VEHICLE: return cfg_.vehicle_confidence;
        case ObjectClass::PERSON: return cfg_.person_confidence;
        case ObjectClass::HELMET: return cfg_.helmet_confidence;
        case ObjectClass::TRAFFIC_LIGHT: return cfg_.traffic_light_confidence;
        case ObjectClass::PLATE: return cfg_.plate_confidence;
    }
    return 1.0f;
}

bool DetectionIntake::sanitize(const Frame& frame, Detection& det) const {
    const cv::Rect2f& b = det.bbox;
    if (!std::isfinite(b.x) || !std::isfinite(b.y) || !std::isfinite(b.width) || !std::isfinite(b.height)) {
        return false;
    }
    if (!std::isfinite(det.confidence) || det.confidence < 0.0f || det.confidence > 1.0f) return false;
    if (b.width <= 0.0f || b.height <= 0.0f) return false;

    if (frame.width > 0 && frame.height > 0) {
        const cv::Rect2f bounds(0.0f, 0.0f, static_cast<float>(frame.width), static_cast<float>(frame.height));
        const cv::Rect2f clipped = b & bounds;
        if (clipped.width <= 0.0f || clipped.height <= 0.0f) return false;
        det.bbox = clipped;
    }
    return true;
}

FrameObservations DetectionIntake::normalize(const Frame& frame) const {
    FrameObservations out;
    out.frame_index = frame.index;
    out.timestamp_sec = frame.timestamp_sec;
    out.width = frame.width;
    out.height = frame.height;

    for (const auto& raw : frame.detections) {
        Detection det = raw;
        if (!sanitize(frame, det)) {
            out.dropped_malformed++;
            continue;
        }
        if (det.confidence < threshold_for(det.object_class)) {
            out.dropped_low_confidence++;
            continue;
        }

        switch (det.object_class) {
            case ObjectClass::VEHICLE: out.vehicles.push_back(det); break;
            case ObjectClass::PERSON: out.persons.push_back(det); break;
            case ObjectClass::HELMET: out.helmets.push_back(det); break;
            case ObjectClass::PLATE: out.plates.push_back(det); break;
            case ObjectClass::TRAFFIC_LIGHT: {
                float light_confidence = det.confidence;
                if (det.light_color == TrafficLightColor::UNKNOWN && !det.crop.empty()) {
                    const TrafficLightState classified = light_classifier_.classify(det.crop);
                    det.light_color = classified.color;
                    light_confidence = std::min(det.confidence, classified.confidence);
                }
                out.traffic_lights.push_back(det);
                if (det.light_color != TrafficLightColor::UNKNOWN && light_confidence > out.light.confidence) {
                    out.light.color = det.light_color;
                    out.light.confidence = light_confidence;
                }
                break;
            }
        }
    }
    return out;
}

}  // namespace roadwatch
