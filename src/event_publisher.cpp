#include "roadwatch/event_publisher.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "roadwatch.pb.h"

namespace roadwatch {

EventPublisher::EventPublisher(const std::string& path) : path_(path) {
    try {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Unable to create directory for " << path_ << ": " << e.what() << std::endl;
    }
}

std::string EventPublisher::to_json(const ViolationEvent& event) {
    proto::ViolationRecord record;
    record.set_track_id(event.track_id);
    record.set_kind(violation_kind_to_string(event.kind));
    record.set_frame(event.frame_index);
    record.set_timestamp_sec(event.timestamp_sec);
    auto* box = record.mutable_box();
    box->set_x(event.bbox.x);
    box->set_y(event.bbox.y);
    box->set_w(event.bbox.width);
    box->set_h(event.bbox.height);
    record.set_confidence(event.confidence);
    record.set_metric(event.metric);
    record.set_detail(event.detail);
    record.set_plate(event.plate_text);

    google::protobuf::util::JsonPrintOptions opts;
    opts.preserve_proto_field_names = true;
    std::string out;
    const auto status = google::protobuf::util::MessageToJsonString(record, &out, opts);
    if (!status.ok()) {
        throw std::runtime_error("unable to serialize violation: " + status.ToString());
    }
    return out;
}

void EventPublisher::publish(const ViolationEvent& event) {
    const std::string line = to_json(event);

    std::lock_guard<std::mutex> lock(mu_);
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[WARN] Unable to open events file: " << path_ << std::endl;
        return;
    }
    f << line << "\n";
    published_++;
}

}  // namespace roadwatch
