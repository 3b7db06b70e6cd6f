#include "swg/practice.hpp"
#include "swg/log.hpp"

namespace swg {

std::optional<uint64_t> PracticeClassifier::last_time_us() const {
    if (!has_last_) return std::nullopt;
    return last_us_;
}

void PracticeClassifier::reset(){
    has_last_ = false;
    last_us_ = 0;
    last_where_.reset();
    count_ = 0;
}

PracticeVerdict PracticeClassifier::classify(uint64_t t_us, const std::optional<GeoPoint>& where){
    PracticeVerdict v{};

    const bool in_window = has_last_ && t_us >= last_us_ && us_to_s(t_us - last_us_) < cfg_.window_s;

    if (in_window) {
        if (where && last_where_) {
            v.distance_m = distance_m(*last_where_, *where);
            if (v.distance_m < cfg_.radius_m) {
                //same spot within the window
                v.is_practice = true;
                count_++;
                log_info("practice: swing #%d at same spot (%.1f m)", count_, v.distance_m);
            }
            //moved away inside the window: counter left as is
        } else {
            //no location, time only
            v.possible_practice = true;
            count_++;
            log_info("practice: possible practice swing #%d (no location)", count_);
        }
    } else {
        count_ = 1;
    }

    has_last_ = true;
    last_us_ = t_us;
    last_where_ = where;

    v.consecutive_count = count_;
    v.start_confirmation = !v.is_practice || count_ >= 2;
    return v;
}

}   //namespace swg
