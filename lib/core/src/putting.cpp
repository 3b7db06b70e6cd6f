#include "swg/putting.hpp"
#include "swg/log.hpp"

namespace swg {

bool PuttDetector::set_distance_to_green(int yards){
    const bool want = yards > 0 && yards <= cfg_.auto_range_yd;
    if (want == enabled_) return false;
    enabled_ = want;
    log_info("putting: %s putting mode (%d yd to green)", enabled_ ? "entering" : "leaving", yards);
    return true;
}

bool PuttDetector::update(const MotionSample& raw){
    if (!enabled_) return false;

    const float g = raw.magnitude();
    const float rot = raw.rotation_magnitude();
    const bool putt_motion = g >= cfg_.g_min && g <= cfg_.g_max && rot >= cfg_.rot_min && rot <= cfg_.rot_max;
    if (!putt_motion) return false;

    if (has_last_ && raw.t_us >= last_us_ && us_to_s(raw.t_us - last_us_) < cfg_.cooldown_s) return false;

    has_last_ = true;
    last_us_ = raw.t_us;
    count_++;
    log_info("putting: putt #%d detected", count_);
    return true;
}

}   //namespace swg
