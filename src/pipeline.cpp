#include "roadwatch/pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace roadwatch {

namespace {

const PipelineConfig& checked(const PipelineConfig& cfg) {
    validate(cfg);
    return cfg;
}

}  // namespace

ViolationPipeline::ViolationPipeline(const PipelineConfig& cfg, OcrEngine* ocr, ViolationSink sink)
    : cfg_(checked(cfg)),
      intake_(cfg_),
      associator_(cfg_),
      line_engine_(cfg_),
      aggregator_(std::move(sink)) {
    // Plate first so events raised later in the same frame carry the plate text
    rules_.emplace_back(std::in_place_type<PlateResolver>, cfg_, ocr);
    rules_.emplace_back(std::in_place_type<HelmetRule>, cfg_);
    rules_.emplace_back(std::in_place_type<RedLightRule>);
    rules_.emplace_back(std::in_place_type<SpeedRule>, cfg_);
}

std::vector<ViolationEvent> ViolationPipeline::process(const Frame& frame) {
    if (stopped_) throw std::logic_error("pipeline was stopped");
    if (last_frame_ && frame.index <= *last_frame_) {
        throw std::invalid_argument("frame " + std::to_string(frame.index) + " arrived after frame " +
                                    std::to_string(*last_frame_));
    }
    last_frame_ = frame.index;
    frames_processed_++;

    const FrameObservations obs = intake_.normalize(frame);
    if (obs.dropped_malformed > 0) {
        std::cerr << "[WARN] Frame " << frame.index << ": dropped " << obs.dropped_malformed
                  << " malformed detection(s)" << std::endl;
    }

    const std::vector<int> vehicle_ids = associator_.update(frame.index, ObjectClass::VEHICLE, obs.vehicles);
    const std::vector<int> person_ids = associator_.update(frame.index, ObjectClass::PERSON, obs.persons);
    line_engine_.observe(obs, associator_.table(), vehicle_ids);

    const TrackTable& table = associator_.table();
    const FrameContext ctx{obs, table, line_engine_, person_ids};

    std::vector<ViolationEvent> candidates;
    for (const auto& entry : table.tracks()) {
        const Track& track = entry.second;
        if (track.object_class != ObjectClass::VEHICLE) continue;

        for (auto& rule : rules_) {
            std::visit(
                [&](auto& r) {
                    if (aggregator_.already_emitted(track.id, r.kind())) return;
                    if (auto ev = r.evaluate(track, ctx)) candidates.push_back(std::move(*ev));
                },
                rule);
        }
    }

    const auto& plates = std::get<PlateResolver>(rules_.front());
    for (auto& ev : candidates) {
        if (ev.plate_text.empty()) {
            if (auto text = plates.plate_for(ev.track_id)) ev.plate_text = *text;
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const ViolationEvent& a, const ViolationEvent& b) {
        if (a.track_id != b.track_id) return a.track_id < b.track_id;
        return a.kind < b.kind;
    });

    std::vector<ViolationEvent> emitted;
    for (const auto& ev : candidates) {
        if (aggregator_.submit(ev)) {
            const Track* track = table.find(ev.track_id);
            std::cout << "[INFO] Frame " << ev.frame_index << ": " << violation_kind_to_string(ev.kind)
                      << " violation, " << (track ? vehicle_type_to_string(track->vehicle_type) : "vehicle")
                      << " track " << ev.track_id << " (" << ev.detail << ")" << std::endl;
            emitted.push_back(ev);
        }
    }

    for (auto& rule : rules_) {
        std::visit([&](auto& r) { r.prune(table); }, rule);
    }
    return emitted;
}

void ViolationPipeline::stop() {
    if (stopped_) return;
    stopped_ = true;
    associator_.reset();
    aggregator_.reset();
    rules_.clear();
}

}  // namespace roadwatch
