#include "swg/detectors.hpp"
#include "swg/log.hpp"
#include <algorithm>
#include <cmath>

namespace swg {

// SwingDetector: keeps the last history_n samples, checks the newest window for a swing on every call

SwingDetector::SwingDetector(const DetectorConfig& cfg)
:   cfg_(cfg),
    acc_(std::max(1, cfg.history_n)),               //presize rings
    rot_(std::max(1, cfg.history_n)),
    t_(std::max(1, cfg.history_n)) {
    cfg_.window_n = std::max(3, std::min(cfg_.window_n, cfg_.history_n));
    cfg_.capture_n = std::max(cfg_.window_n, cfg_.capture_n);
    mags_.reserve(cfg_.window_n);
    reset();                                        // start with a clean state
}

void SwingDetector::reset(){
    acc_.clear();
    rot_.clear();
    t_.clear();
    mags_.clear();
    window_peak_ = 0.0f;
    window_peak_idx_ = -1;
}

std::optional<SwingCapture> SwingDetector::process(const MotionSample& s){
    acc_.push(s.acc);
    rot_.push(s.rot);
    t_.push(s.t_us);

    const std::size_t n = t_.size();
    const std::size_t w = std::size_t(cfg_.window_n);
    if (n < w) return std::nullopt;                 //not enough history yet

    //magnitudes over the newest window
    mags_.clear();
    for (std::size_t i = n - w; i < n; ++i) mags_.push_back(norm(acc_[i]));

    //first maximum is the peak
    auto peak_it = std::max_element(mags_.begin(), mags_.end());
    const int peak_idx = int(peak_it - mags_.begin());
    const float peak = *peak_it;
    window_peak_ = peak;
    window_peak_idx_ = peak_idx;

    //peak must be strong and away from both window edges
    if (!(peak > cfg_.peak_floor_g && peak_idx > cfg_.peak_lo_idx && peak_idx < cfg_.peak_hi_idx))
        return std::nullopt;

    //deceleration after the peak
    if (peak_it + 1 == mags_.end()) return std::nullopt;
    const float min_after = *std::min_element(peak_it + 1, mags_.end());
    const float drop = peak - min_after;
    if (!(drop > cfg_.decel_floor_g)) return std::nullopt;

    //swing detected, copy the wider trailing window for analytics
    SwingCapture cap;
    cap.acc = acc_.tail(cfg_.capture_n);
    cap.rot = rot_.tail(cfg_.capture_n);
    cap.t_us = t_.tail(cfg_.capture_n);
    cap.detected_us = s.t_us;
    cap.peak_g = peak;
    cap.drop_g = drop;

    //evict what we consumed so the same swing never triggers twice
    acc_.drop_newest(cfg_.capture_n);
    rot_.drop_newest(cfg_.capture_n);
    t_.drop_newest(cfg_.capture_n);

    detections_++;
    log_debug("detector: swing peak %.1f G at window idx %d, drop %.1f G", peak, peak_idx, drop);
    return cap;
}

}   // namespace swg
