#include "roadwatch/detection_source.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "roadwatch.pb.h"

namespace roadwatch {

namespace {

constexpr float kSamePlateIou = 0.5f;

ObjectClass class_from_string(const std::string& cls) {
    if (cls == "vehicle") return ObjectClass::VEHICLE;
    if (cls == "person") return ObjectClass::PERSON;
    if (cls == "helmet") return ObjectClass::HELMET;
    if (cls == "traffic_light") return ObjectClass::TRAFFIC_LIGHT;
    if (cls == "plate") return ObjectClass::PLATE;
    throw std::runtime_error("unknown detection class '" + cls + "'");
}

TrafficLightColor color_from_string(const std::string& color) {
    if (color == "red") return TrafficLightColor::RED;
    if (color == "yellow" || color == "amber") return TrafficLightColor::YELLOW;
    if (color == "green") return TrafficLightColor::GREEN;
    return TrafficLightColor::UNKNOWN;
}

}  // namespace

FrameBundle parse_frame_record(const std::string& line, double fps) {
    proto::FrameRecord record;
    google::protobuf::util::JsonParseOptions opts;
    opts.ignore_unknown_fields = true;
    const auto status = google::protobuf::util::JsonStringToMessage(line, &record, opts);
    if (!status.ok()) {
        throw std::runtime_error("malformed frame record: " + status.ToString());
    }

    FrameBundle bundle;
    Frame& frame = bundle.frame;
    frame.index = record.frame();
    frame.timestamp_sec = fps > 0.0 ? static_cast<double>(record.frame()) / fps : 0.0;
    frame.width = record.width();
    frame.height = record.height();
    frame.detections.reserve(record.detections_size());

    for (const auto& d : record.detections()) {
        Detection det;
        det.object_class = class_from_string(d.cls());
        det.label = d.label();
        det.bbox = cv::Rect2f(d.box().x(), d.box().y(), d.box().w(), d.box().h());
        det.confidence = d.conf();
        det.light_color = color_from_string(d.light_color());
        frame.detections.push_back(det);

        if (det.object_class == ObjectClass::PLATE) {
            PlateReading reading;
            reading.box = det.bbox;
            reading.result.status = d.ocr_failed() ? OcrResult::Status::FAILED : OcrResult::Status::OK;
            reading.result.text = d.ocr_text();
            reading.result.confidence = d.ocr_conf();
            bundle.plates.push_back(reading);
        }
    }
    return bundle;
}

DetectionSource::DetectionSource(const std::string& path) : path_(path), in_(path) {
    if (!in_) {
        throw std::runtime_error("unable to open detections file: " + path);
    }
}

bool DetectionSource::next_line(int64_t& sequence, std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    while (std::getline(in_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        sequence = sequence_++;
        return true;
    }
    return false;
}

void RecordedOcr::set_frame(int64_t frame_index, std::vector<PlateReading> readings) {
    frame_index_ = frame_index;
    readings_ = std::move(readings);
}

OcrResult RecordedOcr::recognize(int64_t frame_index, const cv::Rect2f& plate_box) {
    OcrResult none;
    if (frame_index != frame_index_) return none;

    const PlateReading* best = nullptr;
    float best_iou = kSamePlateIou;
    for (const auto& r : readings_) {
        const float overlap = iou(r.box, plate_box);
        if (overlap >= best_iou) {
            best_iou = overlap;
            best = &r;
        }
    }
    return best ? best->result : none;
}

}  // namespace roadwatch
