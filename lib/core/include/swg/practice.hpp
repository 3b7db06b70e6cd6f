#pragma once
#include <cstdint>
#include <optional>
#include "swg/types.hpp"

namespace swg {

struct PracticeConfig {
    float window_s = 30.0f;     //max gap between swings to count as a repetition
    double radius_m = 5.0;      //"same spot"
};

struct PracticeVerdict {
    bool is_practice = false;           //same spot inside the window
    bool possible_practice = false;     //inside the window but no location to compare
    int consecutive_count = 0;
    double distance_m = -1.0;           //<0 when not computed
    bool start_confirmation = false;    //not clearly practice, or the real swing after warm-ups
};

// practice vs real shot heuristic on the timing/location of consecutive detections
class PracticeClassifier {
public:
    explicit PracticeClassifier(const PracticeConfig& cfg) : cfg_(cfg) {}

    PracticeVerdict classify(uint64_t t_us, const std::optional<GeoPoint>& where);

    void reset();                   //empty context
    bool empty() const {return !has_last_ && !last_where_ && count_ == 0;}
    int consecutive_count() const {return count_;}
    std::optional<uint64_t> last_time_us() const;
    const std::optional<GeoPoint>& last_location() const {return last_where_;}

private:
    PracticeConfig cfg_;
    bool has_last_ = false;
    uint64_t last_us_ = 0;
    std::optional<GeoPoint> last_where_;
    int count_ = 0;
};

}   //namespace swg
