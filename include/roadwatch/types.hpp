#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace roadwatch {

enum class ObjectClass { VEHICLE, PERSON, HELMET, TRAFFIC_LIGHT, PLATE };

enum class VehicleType { UNKNOWN, CAR, TRUCK, BUS, MOTORCYCLE, BICYCLE };

enum class TrafficLightColor { UNKNOWN, RED, YELLOW, GREEN };

enum class ViolationKind { HELMET, RED_LIGHT, SPEED, PLATE };

enum class TrackStatus { ACTIVE, LOST };

inline const char* object_class_to_string(ObjectClass c) {
    switch (c) {
        case ObjectClass::VEHICLE: return "vehicle";
        case ObjectClass::PERSON: return "person";
        case ObjectClass::HELMET: return "helmet";
        case ObjectClass::TRAFFIC_LIGHT: return "traffic_light";
        case ObjectClass::PLATE: return "plate";
    }
    return "vehicle";
}

inline const char* light_color_to_string(TrafficLightColor c) {
    switch (c) {
        case TrafficLightColor::RED: return "red";
        case TrafficLightColor::YELLOW: return "yellow";
        case TrafficLightColor::GREEN: return "green";
        default: return "unknown";
    }
}

inline const char* violation_kind_to_string(ViolationKind k) {
    switch (k) {
        case ViolationKind::HELMET: return "helmet";
        case ViolationKind::RED_LIGHT: return "red_light";
        case ViolationKind::SPEED: return "speed";
        case ViolationKind::PLATE: return "plate";
    }
    return "helmet";
}

// Maps detector labels ("car", "motorbike", ...) to a vehicle type.
VehicleType vehicle_type_from_label(const std::string& label);
const char* vehicle_type_to_string(VehicleType t);

inline bool is_two_wheeler(VehicleType t) {
    return t == VehicleType::MOTORCYCLE || t == VehicleType::BICYCLE;
}

struct Detection {
    ObjectClass object_class{ObjectClass::VEHICLE};
    std::string label;          // raw detector label, e.g. "motorcycle"
    cv::Rect2f bbox;            // x, y, w, h in pixels
    float confidence{0.0f};
    TrafficLightColor light_color{TrafficLightColor::UNKNOWN};  // traffic lights only
    cv::Mat crop;               // optional BGR pixels of a traffic light, classified when no color is given
};

struct Frame {
    int64_t index{0};
    double timestamp_sec{0.0};  // index / nominal fps
    int width{0};               // 0 when the producer does not know the frame size
    int height{0};
    std::vector<Detection> detections;
};

struct TrafficLightState {
    TrafficLightColor color{TrafficLightColor::UNKNOWN};
    float confidence{0.0f};
};

// Stop line in pixel space. Points with positive signed distance lie on the
// "after" side (left-hand normal of p1->p2, i.e. below a left-to-right
// horizontal line in image coordinates).
struct ViolationLine {
    cv::Point2f p1;
    cv::Point2f p2;
    float tolerance{15.0f};

    float signed_distance(const cv::Point2f& p) const;
    float length() const;
};

struct Observation {
    int64_t frame_index{0};
    cv::Rect2f bbox;
    float confidence{0.0f};
};

struct Track {
    int id{0};
    ObjectClass object_class{ObjectClass::VEHICLE};
    VehicleType vehicle_type{VehicleType::UNKNOWN};
    std::vector<Observation> observations;  // strictly increasing frame_index
    TrackStatus status{TrackStatus::ACTIVE};
    int64_t last_seen_frame{0};
    int consecutive_misses{0};

    const Observation& last() const { return observations.back(); }
};

struct ViolationEvent {
    int track_id{0};
    ViolationKind kind{ViolationKind::HELMET};
    int64_t frame_index{0};
    double timestamp_sec{0.0};
    cv::Rect2f bbox;
    float confidence{0.0f};
    double metric{0.0};      // km/h, signed crossing distance, or missing-helmet streak
    std::string detail;      // plate text, crossing point, rider ids
    std::string plate_text;  // resolved plate of the track, when known
};

// Reference point used for motion and line crossing: bottom-center of the box.
inline cv::Point2f reference_point(const cv::Rect2f& box) {
    return cv::Point2f(box.x + box.width * 0.5f, box.y + box.height);
}

inline cv::Point2f center_of(const cv::Rect2f& box) {
    return cv::Point2f(box.x + box.width * 0.5f, box.y + box.height * 0.5f);
}

float iou(const cv::Rect2f& lhs, const cv::Rect2f& rhs);

}  // namespace roadwatch
