#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/types.hpp"

namespace roadwatch {

// Arena of tracks indexed by id. Only TrackAssociator appends to it; rule
// evaluators get a const reference.
class TrackTable {
public:
    const Track* find(int id) const;
    const std::map<int, Track>& tracks() const { return tracks_; }
    size_t size() const { return tracks_.size(); }

private:
    friend class TrackAssociator;

    std::map<int, Track> tracks_;
};

// Greedy IoU association. Pairs at or above the affinity floor are taken in
// order of affinity, then detection confidence, then lowest track id.
// Detections without a candidate always start a new track.
class TrackAssociator {
public:
    explicit TrackAssociator(const PipelineConfig& cfg);

    // Associates this frame's detections of one class and ages that class's
    // unmatched tracks. Returns ids of tracks observed at frame_index.
    std::vector<int> update(int64_t frame_index, ObjectClass object_class,
                            const std::vector<Detection>& detections);

    const TrackTable& table() const { return table_; }

    // Drops every track; ids keep increasing.
    void reset();

private:
    int spawn(int64_t frame_index, ObjectClass object_class, const Detection& det);

    TrackTable table_;
    int next_track_id_{1};
    float affinity_floor_;
    int max_missed_frames_;
    int lost_retention_frames_;
};

}  // namespace roadwatch
