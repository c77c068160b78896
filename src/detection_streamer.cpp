#include "roadwatch/detection_streamer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace roadwatch {

DetectionStreamer::DetectionStreamer(DetectionSource& source, OrderedFrameQueue<FrameBundle>& queue,
                                     double fps, int workers)
    : source_(source), queue_(queue), fps_(fps), worker_count_(std::max(1, workers)) {}

DetectionStreamer::~DetectionStreamer() {
    stop();
}

void DetectionStreamer::start() {
    if (running_) return;
    running_ = true;
    for (int i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&DetectionStreamer::run, this);
    }
    // Ends the queue once every worker has drained the source
    closer_ = std::thread([this] {
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        queue_.stop();
    });
}

void DetectionStreamer::stop() {
    if (!running_) return;
    running_ = false;
    queue_.stop();
    if (closer_.joinable()) closer_.join();
}

void DetectionStreamer::run() {
    int64_t sequence = 0;
    std::string line;
    while (running_ && source_.next_line(sequence, line)) {
        try {
            FrameBundle bundle = parse_frame_record(line, fps_);
            if (!queue_.push(sequence, std::move(bundle))) break;
            decoded_++;
        } catch (const std::runtime_error& e) {
            std::cerr << "[WARN] Skipping record " << sequence << " of " << source_.path() << ": " << e.what()
                      << std::endl;
            rejected_++;
            queue_.skip(sequence);
        }
    }
}

}  // namespace roadwatch
