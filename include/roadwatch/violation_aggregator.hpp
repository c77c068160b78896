#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include "roadwatch/types.hpp"

namespace roadwatch {

// (track id, kind) pairs already reported in this stream.
class DeduplicationLedger {
public:
    bool contains(int track_id, ViolationKind kind) const;
    // Returns false when the pair was already recorded.
    bool record(int track_id, ViolationKind kind);
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    std::set<std::pair<int, ViolationKind>> entries_;
};

using ViolationSink = std::function<void(const ViolationEvent&)>;

// Single gate for violation events. Keeps the stream's ordered log and
// forwards each new event to the sink as soon as it is accepted.
class ViolationAggregator {
public:
    explicit ViolationAggregator(ViolationSink sink = {});

    // False for duplicates and for events older than the last accepted frame.
    bool submit(const ViolationEvent& event);

    bool already_emitted(int track_id, ViolationKind kind) const { return ledger_.contains(track_id, kind); }
    const std::vector<ViolationEvent>& log() const { return log_; }
    std::map<ViolationKind, int> summary() const;

    void reset();

private:
    ViolationSink sink_;
    DeduplicationLedger ledger_;
    std::vector<ViolationEvent> log_;
    int64_t last_frame_{INT64_MIN};
};

}  // namespace roadwatch
