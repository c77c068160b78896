#pragma once

#include <atomic>
#include <thread>
#include <vector>

#include "roadwatch/detection_source.hpp"
#include "roadwatch/ordered_frame_queue.hpp"

namespace roadwatch {

// Worker threads decode detector records and hand them to the ordered queue.
// Decoding may finish out of order; the queue restores the sequence.
class DetectionStreamer {
public:
    DetectionStreamer(DetectionSource& source, OrderedFrameQueue<FrameBundle>& queue, double fps, int workers);
    ~DetectionStreamer();

    void start();
    void stop();

    int decoded() const { return decoded_; }
    int rejected() const { return rejected_; }

private:
    void run();

    DetectionSource& source_;
    OrderedFrameQueue<FrameBundle>& queue_;
    double fps_;
    int worker_count_;
    std::vector<std::thread> workers_;
    std::thread closer_;
    std::atomic<bool> running_{false};
    std::atomic<int> decoded_{0};
    std::atomic<int> rejected_{0};
};

}  // namespace roadwatch
