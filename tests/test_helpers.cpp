#include "test_helpers.hpp"

namespace roadwatch {
namespace test {

namespace {

Detection make(ObjectClass c, const std::string& label, float x, float y, float w, float h, float conf) {
    Detection d;
    d.object_class = c;
    d.label = label;
    d.bbox = cv::Rect2f(x, y, w, h);
    d.confidence = conf;
    return d;
}

}  // namespace

Detection vehicle(float x, float y, float w, float h, const std::string& label, float conf) {
    return make(ObjectClass::VEHICLE, label, x, y, w, h, conf);
}

Detection person(float x, float y, float w, float h, float conf) {
    return make(ObjectClass::PERSON, "person", x, y, w, h, conf);
}

Detection helmet(float x, float y, float w, float h, float conf) {
    return make(ObjectClass::HELMET, "helmet", x, y, w, h, conf);
}

Detection plate(float x, float y, float w, float h, float conf) {
    return make(ObjectClass::PLATE, "plate", x, y, w, h, conf);
}

Detection light(TrafficLightColor color, float conf) {
    Detection d = make(ObjectClass::TRAFFIC_LIGHT, "traffic_light", 600.0f, 20.0f, 30.0f, 80.0f, conf);
    d.light_color = color;
    return d;
}

Frame make_frame(int64_t index, std::vector<Detection> detections, int width, int height, double fps) {
    Frame f;
    f.index = index;
    f.timestamp_sec = static_cast<double>(index) / fps;
    f.width = width;
    f.height = height;
    f.detections = std::move(detections);
    return f;
}

PipelineConfig config_with_line() {
    PipelineConfig cfg;
    cfg.has_configured_line = true;
    cfg.line.p1 = cv::Point2f(0.0f, 320.0f);
    cfg.line.p2 = cv::Point2f(1280.0f, 320.0f);
    cfg.line_tolerance = 15.0f;
    cfg.line.tolerance = 15.0f;
    return cfg;
}

Track moving_track(int id, const std::vector<int64_t>& frames, const cv::Rect2f& first, float step,
                   VehicleType type) {
    Track t;
    t.id = id;
    t.object_class = ObjectClass::VEHICLE;
    t.vehicle_type = type;
    cv::Rect2f box = first;
    for (int64_t f : frames) {
        t.observations.push_back(Observation{f, box, 0.9f});
        box.y += step;
    }
    if (!frames.empty()) t.last_seen_frame = frames.back();
    return t;
}

}  // namespace test
}  // namespace roadwatch
