#include <exception>
#include <iostream>
#include <stdexcept>

#include "roadwatch/config.hpp"
#include "roadwatch/detection_source.hpp"
#include "roadwatch/detection_streamer.hpp"
#include "roadwatch/event_publisher.hpp"
#include "roadwatch/ordered_frame_queue.hpp"
#include "roadwatch/pipeline.hpp"

int main(int argc, char** argv) {
    try {
        roadwatch::AppConfig cfg = roadwatch::parse_args(argc, argv);
        roadwatch::validate(cfg.pipeline);

        std::cout << "[INFO] Starting roadwatch pipeline\n";
        std::cout << "       detections: " << cfg.detections_path << "\n";
        std::cout << "       events    : " << cfg.events_path << "\n";
        std::cout << "       fps       : " << cfg.pipeline.fps << "\n";
        std::cout << "       line      : "
                  << (cfg.pipeline.has_configured_line ? "configured" : "derived after warm-up") << "\n";

        roadwatch::DetectionSource source(cfg.detections_path);
        roadwatch::OrderedFrameQueue<roadwatch::FrameBundle> queue(static_cast<size_t>(cfg.queue_size));
        roadwatch::DetectionStreamer streamer(source, queue, cfg.pipeline.fps, cfg.decode_workers);

        roadwatch::EventPublisher publisher(cfg.events_path);
        roadwatch::RecordedOcr ocr;
        roadwatch::ViolationPipeline pipeline(cfg.pipeline, &ocr,
                                              [&](const roadwatch::ViolationEvent& ev) { publisher.publish(ev); });

        streamer.start();
        roadwatch::FrameBundle bundle;
        while (queue.pop(bundle)) {
            ocr.set_frame(bundle.frame.index, std::move(bundle.plates));
            try {
                pipeline.process(bundle.frame);
            } catch (const std::invalid_argument& e) {
                std::cerr << "[WARN] Dropping frame " << bundle.frame.index << ": " << e.what() << std::endl;
            }
        }
        streamer.stop();

        std::cout << "[INFO] Processed " << pipeline.frames_processed() << " frames ("
                  << streamer.rejected() << " records rejected)\n";
        for (const auto& entry : pipeline.aggregator().summary()) {
            std::cout << "       " << roadwatch::violation_kind_to_string(entry.first) << ": " << entry.second
                      << "\n";
        }
        std::cout << "[INFO] Wrote " << publisher.published() << " violations to " << cfg.events_path << "\n";
        pipeline.stop();
        std::cout << "[INFO] Stopped roadwatch pipeline\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
