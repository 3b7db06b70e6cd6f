#pragma once
#include <cstdint>
#include "swg/types.hpp"

namespace swg {

// putts are slow, controlled strokes: moderate G and low rotation
struct PuttConfig {
    float g_min = 0.8f;
    float g_max = 3.0f;
    float rot_min = 1.0f;       //rad/s
    float rot_max = 5.0f;
    float cooldown_s = 2.0f;
    int auto_range_yd = 30;     //putting mode turns on inside this distance to the green
};

class PuttDetector {
public:
    explicit PuttDetector(const PuttConfig& cfg) : cfg_(cfg) {}

    bool update(const MotionSample& raw);   //true when a putt was counted

    // returns true when the mode flipped
    bool set_distance_to_green(int yards);
    void set_enabled(bool on) {enabled_ = on;}
    void toggle() {enabled_ = !enabled_;}
    void reset_count() {count_ = 0; has_last_ = false;}

    bool enabled() const {return enabled_;}
    int count() const {return count_;}

private:
    PuttConfig cfg_;
    bool enabled_ = false;
    int count_ = 0;
    bool has_last_ = false;
    uint64_t last_us_ = 0;
};

}   //namespace swg
