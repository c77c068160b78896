#include "roadwatch/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace roadwatch {

VehicleType vehicle_type_from_label(const std::string& label) {
    std::string c;
    c.reserve(label.size());
    for (char ch : label) c.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (c == "car") return VehicleType::CAR;
    if (c == "truck") return VehicleType::TRUCK;
    if (c == "bus") return VehicleType::BUS;
    if (c == "motorcycle" || c == "motorbike" || c == "scooter") return VehicleType::MOTORCYCLE;
    if (c == "bicycle" || c == "bike") return VehicleType::BICYCLE;
    return VehicleType::UNKNOWN;
}

const char* vehicle_type_to_string(VehicleType t) {
    switch (t) {
        case VehicleType::CAR: return "car";
        case VehicleType::TRUCK: return "truck";
        case VehicleType::BUS: return "bus";
        case VehicleType::MOTORCYCLE: return "motorcycle";
        case VehicleType::BICYCLE: return "bicycle";
        default: return "unknown";
    }
}

float iou(const cv::Rect2f& lhs, const cv::Rect2f& rhs) {
    const cv::Rect2f inter = lhs & rhs;
    if (inter.empty()) return 0.0f;
    const float inter_area = inter.area();
    const float union_area = lhs.area() + rhs.area() - inter_area;
    if (union_area <= 0.0f) return 0.0f;
    return inter_area / union_area;
}

float ViolationLine::length() const {
    const cv::Point2f d = p2 - p1;
    return std::sqrt(d.dot(d));
}

float ViolationLine::signed_distance(const cv::Point2f& p) const {
    const float len = length();
    if (len <= 0.0f) return 0.0f;
    const cv::Point2f d = p2 - p1;
    const cv::Point2f v = p - p1;
    return (d.x * v.y - d.y * v.x) / len;
}

}  // namespace roadwatch
