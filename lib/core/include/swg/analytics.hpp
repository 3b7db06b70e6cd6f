#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "swg/types.hpp"
#include "swg/features.hpp"
#include "swg/detectors.hpp"

namespace swg {

enum class SwingPath : uint8_t {InsideOut, Neutral, OverTheTop, Unknown};
enum class SwingType : uint8_t {FullSwing, Iron, ChipOrPitch, Putt, Unknown};
enum class TempoRating : uint8_t {Excellent, Good, NeedsWork, Poor};

const char* path_name(SwingPath p);
const char* swing_type_name(SwingType t);
const char* tempo_rating_name(TempoRating r);

struct AnalyticsConfig {
    float g_to_mph = 2.2f;          //empirical: 1 G at the wrist ~ 2.2 mph hand speed
    float clubhead_mult = 4.0f;     //clubhead ~ 4x hand speed (driver)

    //key point search
    float start_g = 1.5f;           //backswing start = first sample above this
    int min_samples = 50;
    int min_rise_n = 10;            //impact must be this many samples after start
    int top_margin_n = 5;           //top searched in [start+margin, impact-margin)

    //impact
    float impact_g = 8.0f;
    float impact_decel_g = 5.0f;
    int decel_lookahead_n = 10;

    //swing path from mean x rotation over the end of the window
    int path_window_n = 30;
    float path_thresh = 3.0f;       //rad/s
};

// delimiting indices into a capture
struct KeyPoints {
    int start = 0;
    int top = 0;
    int impact = 0;
};

struct Tempo {
    double backswing_s = 0.0;
    double downswing_s = 0.0;
    double ratio() const {return downswing_s > 0.0 ? backswing_s / downswing_s : 0.0;}
};

struct ImpactResult {
    bool detected = false;
    float peak_g = 0.0f;
    float decel_g = 0.0f;
    int index = 0;
    float confidence() const;
};

// produced once per detected swing
struct SwingAnalytics {
    uint64_t t_us = 0;
    double total_s = 0.0;
    double backswing_s = 0.0;
    double downswing_s = 0.0;
    double tempo_ratio = 0.0;       //0 when downswing duration is zero
    float peak_hand_speed_mph = 0.0f;
    float clubhead_speed_mph = 0.0f;
    float peak_g = 0.0f;
    float peak_rotation = 0.0f;
    bool impact_detected = false;
    float impact_decel_g = 0.0f;
    float impact_confidence = 0.0f;
    SwingPath path = SwingPath::Unknown;
    SwingType type = SwingType::Unknown;
    TempoRating tempo_rating = TempoRating::Poor;
    int sample_count = 0;
};

std::vector<float> magnitudes(const std::vector<Vec3>& v);
std::optional<KeyPoints> find_key_points(const std::vector<float>& mags, const AnalyticsConfig& cfg);
Tempo tempo_from(const std::vector<uint64_t>& t_us, const KeyPoints& kp);
ImpactResult analyze_impact(const std::vector<float>& mags, const AnalyticsConfig& cfg);
SwingPath classify_path(const std::vector<Vec3>& rot, const AnalyticsConfig& cfg);
SwingType classify_swing(float peak_g, double tempo_ratio);
TempoRating rate_tempo(double tempo_ratio);

class SwingAnalyzer {
public:
    explicit SwingAnalyzer(const AnalyticsConfig& cfg) : cfg_(cfg) {}
    SwingAnalytics analyze(const SwingCapture& cap) const;

    float hand_speed_mph(float g) const {return g * cfg_.g_to_mph;}

private:
    AnalyticsConfig cfg_;
};

// running tempo/speed consistency over the session
class SessionStats {
public:
    void reset() {total_ = 0; tempo_.reset(); speed_.reset();}
    void add(const SwingAnalytics& a);

    int total_swings() const {return total_;}
    float average_tempo() const {return tempo_.mean();}
    float tempo_sd() const {return tempo_.stddev();}
    float average_hand_speed() const {return speed_.mean();}
    float speed_sd() const {return speed_.stddev();}
    int consistency() const;        //0..100, 0 until 3 swings

private:
    int total_ = 0;
    RunningStats tempo_;
    RunningStats speed_;
};

}   //namespace swg
