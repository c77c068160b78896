#include "roadwatch/track_association.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace roadwatch {

namespace {

struct Candidate {
    int track_id;
    size_t detection_index;
    float affinity;
    float confidence;
};

bool better(const Candidate& lhs, const Candidate& rhs) {
    if (lhs.affinity != rhs.affinity) return lhs.affinity > rhs.affinity;
    if (lhs.confidence != rhs.confidence) return lhs.confidence > rhs.confidence;
    if (lhs.track_id != rhs.track_id) return lhs.track_id < rhs.track_id;
    return lhs.detection_index < rhs.detection_index;
}

}  // namespace

const Track* TrackTable::find(int id) const {
    auto it = tracks_.find(id);
    return it == tracks_.end() ? nullptr : &it->second;
}

TrackAssociator::TrackAssociator(const PipelineConfig& cfg)
    : affinity_floor_(cfg.track_affinity_floor),
      max_missed_frames_(cfg.max_missed_frames),
      lost_retention_frames_(cfg.lost_retention_frames) {}

int TrackAssociator::spawn(int64_t frame_index, ObjectClass object_class, const Detection& det) {
    Track track;
    track.id = next_track_id_++;
    track.object_class = object_class;
    track.vehicle_type = object_class == ObjectClass::VEHICLE ? vehicle_type_from_label(det.label)
                                                             : VehicleType::UNKNOWN;
    track.observations.push_back(Observation{frame_index, det.bbox, det.confidence});
    track.last_seen_frame = frame_index;
    const int id = track.id;
    table_.tracks_.emplace(id, std::move(track));
    return id;
}

std::vector<int> TrackAssociator::update(int64_t frame_index, ObjectClass object_class,
                                         const std::vector<Detection>& detections) {
    auto& tracks = table_.tracks_;

    std::vector<Candidate> candidates;
    for (const auto& entry : tracks) {
        const Track& track = entry.second;
        if (track.object_class != object_class || track.status != TrackStatus::ACTIVE) continue;
        if (track.last_seen_frame >= frame_index) {
            throw std::invalid_argument("frame " + std::to_string(frame_index) +
                                        " is not after " + object_class_to_string(object_class) +
                                        " track " + std::to_string(track.id) +
                                        "'s last observation");
        }
        // Missed more frames than allowed since its last observation: lost, not a candidate
        if (frame_index - track.last_seen_frame - 1 > max_missed_frames_) continue;
        for (size_t j = 0; j < detections.size(); ++j) {
            const float affinity = iou(track.last().bbox, detections[j].bbox);
            if (affinity >= affinity_floor_ && affinity > 0.0f) {
                candidates.push_back(Candidate{track.id, j, affinity, detections[j].confidence});
            }
        }
    }
    std::sort(candidates.begin(), candidates.end(), better);

    std::vector<bool> detection_used(detections.size(), false);
    std::vector<int> updated;
    for (const auto& c : candidates) {
        if (detection_used[c.detection_index]) continue;
        Track& track = tracks.at(c.track_id);
        if (track.last_seen_frame == frame_index) continue;  // already matched this frame

        const Detection& det = detections[c.detection_index];
        track.observations.push_back(Observation{frame_index, det.bbox, det.confidence});
        track.last_seen_frame = frame_index;
        track.consecutive_misses = 0;
        if (track.vehicle_type == VehicleType::UNKNOWN && object_class == ObjectClass::VEHICLE) {
            track.vehicle_type = vehicle_type_from_label(det.label);
        }
        detection_used[c.detection_index] = true;
        updated.push_back(track.id);
    }

    // Age unmatched tracks of this class before spawning so new ones start clean
    for (auto it = tracks.begin(); it != tracks.end();) {
        Track& track = it->second;
        if (track.object_class != object_class || track.last_seen_frame == frame_index) {
            ++it;
            continue;
        }
        // Frame indices may jump; a gap counts as that many missed frames
        track.consecutive_misses = static_cast<int>(frame_index - track.last_seen_frame);
        if (track.status == TrackStatus::ACTIVE && track.consecutive_misses > max_missed_frames_) {
            track.status = TrackStatus::LOST;
        }
        if (track.consecutive_misses > max_missed_frames_ + lost_retention_frames_) {
            it = tracks.erase(it);
        } else {
            ++it;
        }
    }

    for (size_t j = 0; j < detections.size(); ++j) {
        if (!detection_used[j]) {
            updated.push_back(spawn(frame_index, object_class, detections[j]));
        }
    }

    std::sort(updated.begin(), updated.end());
    return updated;
}

void TrackAssociator::reset() {
    table_.tracks_.clear();
}

}  // namespace roadwatch
