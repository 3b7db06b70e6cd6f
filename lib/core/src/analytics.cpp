#include "swg/analytics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace swg {

const char* path_name(SwingPath p){
    switch (p)
    {
    case SwingPath::InsideOut: return "Inside-Out";
    case SwingPath::Neutral: return "Neutral";
    case SwingPath::OverTheTop: return "Over-the-Top";
    default: return "Unknown";
    }
}

const char* swing_type_name(SwingType t){
    switch (t)
    {
    case SwingType::FullSwing: return "Full Swing";
    case SwingType::Iron: return "Iron";
    case SwingType::ChipOrPitch: return "Chip/Pitch";
    case SwingType::Putt: return "Putt";
    default: return "Unknown";
    }
}

const char* tempo_rating_name(TempoRating r){
    switch (r)
    {
    case TempoRating::Excellent: return "Excellent";
    case TempoRating::Good: return "Good";
    case TempoRating::NeedsWork: return "Needs Work";
    default: return "Poor";
    }
}

float ImpactResult::confidence() const {
    const float g_score = std::min(peak_g / 15.0f, 1.0f);
    const float d_score = std::min(decel_g / 8.0f, 1.0f);
    return (g_score + d_score) / 2.0f;
}

std::vector<float> magnitudes(const std::vector<Vec3>& v){
    std::vector<float> out;
    out.reserve(v.size());
    for (const Vec3& a : v) out.push_back(norm(a));
    return out;
}

std::optional<KeyPoints> find_key_points(const std::vector<float>& mags, const AnalyticsConfig& cfg){
    const int n = int(mags.size());
    if (n < cfg.min_samples) return std::nullopt;

    // 1) backswing start: first significant acceleration
    int start = -1;
    for (int i=0; i<n; ++i) {
        if (mags[i] > cfg.start_g) {start = i; break;}
    }
    if (start < 0) return std::nullopt;

    // 2) impact: peak from start on
    int impact = start;
    float max_g = 0.0f;
    for (int i=start; i<n; ++i) {
        if (mags[i] > max_g) {max_g = mags[i]; impact = i;}
    }
    if (impact <= start + cfg.min_rise_n) return std::nullopt;

    // 3) top of swing: local minimum between start and impact
    int top = -1;
    float min_g = std::numeric_limits<float>::max();
    for (int i = start + cfg.top_margin_n; i < impact - cfg.top_margin_n; ++i) {
        if (mags[i] < min_g) {min_g = mags[i]; top = i;}
    }
    if (top < 0) return std::nullopt;

    return KeyPoints{start, top, impact};
}

Tempo tempo_from(const std::vector<uint64_t>& t_us, const KeyPoints& kp){
    Tempo out{};
    const int n = int(t_us.size());
    if (kp.start < 0 || kp.top < kp.start || kp.impact < kp.top || kp.impact >= n) return out;

    out.backswing_s = us_to_s(t_us[kp.top] - t_us[kp.start]);
    out.downswing_s = us_to_s(t_us[kp.impact] - t_us[kp.top]);
    return out;
}

ImpactResult analyze_impact(const std::vector<float>& mags, const AnalyticsConfig& cfg){
    ImpactResult out{};
    if (mags.empty()) return out;

    const int n = int(mags.size());
    const int peak = int(std::max_element(mags.begin(), mags.end()) - mags.begin());
    out.peak_g = mags[peak];
    out.index = peak;

    //biggest drop shortly after the peak, needs a few samples of tail
    float max_decel = 0.0f;
    if (peak < n - 5) {
        const int end = std::min(peak + cfg.decel_lookahead_n, n);
        for (int i = peak + 1; i < end; ++i) max_decel = std::max(max_decel, out.peak_g - mags[i]);
    }
    out.decel_g = max_decel;
    out.detected = out.peak_g > cfg.impact_g && max_decel > cfg.impact_decel_g;
    return out;
}

SwingPath classify_path(const std::vector<Vec3>& rot, const AnalyticsConfig& cfg){
    const int w = std::max(1, cfg.path_window_n);
    if (int(rot.size()) < w) return SwingPath::Unknown;

    //x rotation (around the forearm) over the end of the downswing
    double sum = 0.0;
    for (std::size_t i = rot.size() - w; i < rot.size(); ++i) sum += rot[i].x;
    const double avg = sum / double(w);

    if (avg > cfg.path_thresh) return SwingPath::InsideOut;
    if (avg < -cfg.path_thresh) return SwingPath::OverTheTop;
    return SwingPath::Neutral;
}

SwingType classify_swing(float peak_g, double tempo_ratio){
    if (peak_g > 10.0f && tempo_ratio > 2.0) return SwingType::FullSwing;
    if (peak_g > 6.0f && tempo_ratio > 2.0) return SwingType::Iron;
    if (peak_g > 3.0f && peak_g <= 6.0f) return SwingType::ChipOrPitch;
    if (peak_g <= 3.0f) return SwingType::Putt;
    return SwingType::Unknown;
}

TempoRating rate_tempo(double r){
    if (r >= 2.5 && r < 3.5) return TempoRating::Excellent;
    if ((r >= 2.0 && r < 2.5) || (r >= 3.5 && r < 4.0)) return TempoRating::Good;
    if ((r >= 1.5 && r < 2.0) || (r >= 4.0 && r < 4.5)) return TempoRating::NeedsWork;
    return TempoRating::Poor;
}

SwingAnalytics SwingAnalyzer::analyze(const SwingCapture& cap) const {
    SwingAnalytics out{};
    out.t_us = cap.detected_us;
    out.sample_count = int(cap.acc.size());

    const std::vector<float> mags = magnitudes(cap.acc);
    if (mags.empty()) return out;

    //tempo, zero when the key points cannot be found
    std::optional<KeyPoints> kp = find_key_points(mags, cfg_);
    if (kp && cap.t_us.size() == mags.size()) {
        const Tempo tempo = tempo_from(cap.t_us, *kp);
        out.backswing_s = tempo.backswing_s;
        out.downswing_s = tempo.downswing_s;
        out.tempo_ratio = tempo.ratio();
    }
    out.total_s = out.backswing_s + out.downswing_s;

    //speed
    out.peak_g = *std::max_element(mags.begin(), mags.end());
    for (const Vec3& r : cap.rot) out.peak_rotation = std::max(out.peak_rotation, norm(r));
    out.peak_hand_speed_mph = hand_speed_mph(out.peak_g);
    out.clubhead_speed_mph = out.peak_hand_speed_mph * cfg_.clubhead_mult;

    //impact
    const ImpactResult impact = analyze_impact(mags, cfg_);
    out.impact_detected = impact.detected;
    out.impact_decel_g = impact.decel_g;
    out.impact_confidence = impact.confidence();

    out.path = classify_path(cap.rot, cfg_);
    out.type = classify_swing(out.peak_g, out.tempo_ratio);
    out.tempo_rating = rate_tempo(out.tempo_ratio);
    return out;
}

void SessionStats::add(const SwingAnalytics& a){
    total_++;
    if (a.tempo_ratio > 0.0) tempo_.push(float(a.tempo_ratio));
    if (a.peak_hand_speed_mph > 0.0f) speed_.push(a.peak_hand_speed_mph);
}

int SessionStats::consistency() const {
    if (total_ < 3) return 0;
    const float tempo_score = std::max(0.0f, 100.0f - tempo_sd() * 50.0f);
    const float speed_score = std::max(0.0f, 100.0f - speed_sd() * 5.0f);
    return int((tempo_score + speed_score) / 2.0f);
}

}   //namespace swg
