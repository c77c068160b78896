#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "roadwatch/config.hpp"
#include "roadwatch/detection_intake.hpp"
#include "roadwatch/helmet_rule.hpp"
#include "roadwatch/plate_resolver.hpp"
#include "roadwatch/red_light_rule.hpp"
#include "roadwatch/speed_estimator.hpp"
#include "roadwatch/track_association.hpp"
#include "roadwatch/types.hpp"
#include "roadwatch/violation_aggregator.hpp"
#include "roadwatch/violation_line.hpp"

namespace roadwatch {

// One stream's violation pipeline. Not thread-safe: every stream gets its own
// instance and feeds it from a single thread, frames in increasing index.
class ViolationPipeline {
public:
    // `ocr` is not owned and may be null. Throws std::invalid_argument for an
    // unusable configuration.
    ViolationPipeline(const PipelineConfig& cfg, OcrEngine* ocr = nullptr, ViolationSink sink = {});

    // Runs intake, association, the line engine and every rule for one frame.
    // Returns the events accepted for this frame, ordered by track id and kind.
    std::vector<ViolationEvent> process(const Frame& frame);

    // Ends the stream: all tracks, rule state and the ledger are discarded.
    void stop();
    bool stopped() const { return stopped_; }

    const TrackTable& tracks() const { return associator_.table(); }
    const ViolationLineEngine& line_engine() const { return line_engine_; }
    const ViolationAggregator& aggregator() const { return aggregator_; }
    int64_t frames_processed() const { return frames_processed_; }

private:
    using Rule = std::variant<PlateResolver, HelmetRule, RedLightRule, SpeedRule>;

    PipelineConfig cfg_;
    DetectionIntake intake_;
    TrackAssociator associator_;
    ViolationLineEngine line_engine_;
    std::vector<Rule> rules_;
    ViolationAggregator aggregator_;

    std::optional<int64_t> last_frame_;
    int64_t frames_processed_{0};
    bool stopped_{false};
};

}  // namespace roadwatch
