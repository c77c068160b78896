#include "roadwatch/violation_aggregator.hpp"

#include <iostream>

namespace roadwatch {

bool DeduplicationLedger::contains(int track_id, ViolationKind kind) const {
    return entries_.count(std::make_pair(track_id, kind)) > 0;
}

bool DeduplicationLedger::record(int track_id, ViolationKind kind) {
    return entries_.insert(std::make_pair(track_id, kind)).second;
}

ViolationAggregator::ViolationAggregator(ViolationSink sink) : sink_(std::move(sink)) {}

bool ViolationAggregator::submit(const ViolationEvent& event) {
    if (event.frame_index < last_frame_) {
        std::cerr << "[WARN] Dropping " << violation_kind_to_string(event.kind) << " event for track "
                  << event.track_id << " at frame " << event.frame_index << ", log is already at frame "
                  << last_frame_ << std::endl;
        return false;
    }
    if (!ledger_.record(event.track_id, event.kind)) return false;

    last_frame_ = event.frame_index;
    log_.push_back(event);
    if (sink_) sink_(event);
    return true;
}

std::map<ViolationKind, int> ViolationAggregator::summary() const {
    std::map<ViolationKind, int> counts;
    for (const auto& ev : log_) counts[ev.kind]++;
    return counts;
}

void ViolationAggregator::reset() {
    ledger_.clear();
    log_.clear();
    last_frame_ = INT64_MIN;
}

}  // namespace roadwatch
