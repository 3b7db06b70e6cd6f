#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "swg/types.hpp"
#include "swg/features.hpp"

namespace swg {

struct DetectorConfig {
    int history_n = 1000;       //ring capacity, ~5 s at 200 Hz
    int window_n = 50;          //# of newest samples examined each call
    int capture_n = 100;        //samples handed to analytics per swing

    float peak_floor_g = 8.0f;  //peak |a| must exceed this
    int peak_lo_idx = 10;       //peak index must be strictly inside (lo, hi) of the window
    int peak_hi_idx = 40;
    float decel_floor_g = 5.0f; //drop after the peak must exceed this
};

// raw sample set of one detected swing, oldest first
struct SwingCapture {
    std::vector<Vec3> acc;          //filtered accel
    std::vector<Vec3> rot;
    std::vector<uint64_t> t_us;
    uint64_t detected_us = 0;
    float peak_g = 0.0f;
    float drop_g = 0.0f;
};

// peak-then-deceleration swing detector over a sliding window of filtered samples
class SwingDetector {
public:
    explicit SwingDetector(const DetectorConfig& cfg);
    void reset();

    std::optional<SwingCapture> process(const MotionSample& s);    //feed one filtered sample

    //inspectors for logging
    std::size_t buffered() const {return t_.size();}
    float window_peak_g() const {return window_peak_;}
    int window_peak_idx() const {return window_peak_idx_;}
    uint32_t detections() const {return detections_;}

private:
    DetectorConfig cfg_; //copy of config

    //three parallel rings, same length at all times
    Ring<Vec3> acc_;
    Ring<Vec3> rot_;
    Ring<uint64_t> t_;

    std::vector<float> mags_;       //scratch, avoids a realloc per sample
    float window_peak_ = 0.0f;
    int window_peak_idx_ = -1;
    uint32_t detections_ = 0;
};

}   // namespace swg
