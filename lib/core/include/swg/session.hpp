#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include "swg/types.hpp"
#include "swg/events.hpp"
#include "swg/timer.hpp"
#include "swg/kalman.hpp"
#include "swg/sampler.hpp"
#include "swg/power.hpp"
#include "swg/detectors.hpp"
#include "swg/phase.hpp"
#include "swg/analytics.hpp"
#include "swg/practice.hpp"
#include "swg/confirm.hpp"
#include "swg/putting.hpp"

namespace swg{

struct SwingPreferences {
    float sensitivity = 1.0f;       //multiplier on phase G thresholds, clamped to [0.5, 1.5]
    float target_tempo = 3.0f;
    bool auto_putting = true;       //follow distance to green
};

struct SessionConfig {
    SamplerConfig sampler{};
    FilterConfig filter{};
    PowerConfig power{};
    DetectorConfig det{};
    PhaseConfig phase{};
    AnalyticsConfig analytics{};
    PracticeConfig practice{};
    ConfirmConfig confirm{};
    PuttConfig putt{};
    SwingPreferences prefs{};

    float swing_cooldown_s = 3.0f;  //detections closer than this to the previous one are dropped
};

// what the UI reads
struct StatusSnapshot {
    uint64_t t_us = 0;
    bool detecting = false;
    PowerMode mode = PowerMode::Idle;
    SwingPhase phase = SwingPhase::Idle;
    std::optional<SwingAnalytics> last_swing;
    ConfirmationState confirmation{};
    SensorNotice notice{};
    bool putting_mode = false;
    int putt_count = 0;
    int shot_count = 0;
    int swing_count = 0;
    float current_g = 0.0f;
    float peak_g = 0.0f;
    float peak_rotation = 0.0f;
};

// single writer (sampling context), any number of readers
class StatusBoard {
public:
    StatusSnapshot read() const {
        std::lock_guard<std::mutex> lock(mu_);
        return snap_;
    }

    template <typename F>
    void write(F&& f) {
        std::lock_guard<std::mutex> lock(mu_);
        f(snap_);
    }

private:
    mutable std::mutex mu_;
    StatusSnapshot snap_{};
};

struct DetectionEvent {
    uint64_t t_us = 0;
    float peak_g = 0.0f;
    PracticeVerdict verdict{};
};

// one collection session: sampler -> filter -> detector -> classifier -> confirmation
// every method except status() and the channel subscriptions runs in the sampling context
// the TimerQueue and MotionSource must outlive the session
class Session {
public:
    Session(const SessionConfig& cfg, MotionSource& src, TimerQueue& timers);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Status start();
    void stop();                    //drops timers and in-flight detections silently
    Status pause();
    Status resume();
    Status force_high_frequency(float duration_s = -1.0f);

    void tick(uint64_t now_us);     //host clock for stretches with no samples

    // external inputs
    void set_location(const std::optional<GeoPoint>& where) {location_ = where;}
    void set_distance_to_green(int yards);
    void set_putting_mode(bool on);
    void set_preferences(const SwingPreferences& prefs);

    // player responses
    Status confirm_shot();
    Status dismiss_shot();
    void dismiss_notice() {sampler_.dismiss_notice();}

    void reset_peaks();
    void reset_putt_count();
    void reset_session_stats() {stats_.reset();}

    //inspectors
    bool detecting() const {return detecting_;}
    PowerMode mode() const {return power_.mode();}
    SwingPhase phase() const {return phase_.phase();}
    PowerStats power_stats() const {return power_.stats();}
    const SessionStats& session_stats() const {return stats_;}
    const SwingPreferences& preferences() const {return cfg_.prefs;}
    StatusSnapshot status() const {return board_.read();}

    const AccelKalman& filter() const {return filter_;}
    const SwingDetector& detector() const {return detector_;}
    const PhaseTracker& tracker() const {return phase_;}
    const PracticeClassifier& practice() const {return practice_;}
    const ShotConfirmation& confirmation() const {return confirm_;}
    const MotionSampler& sampler() const {return sampler_;}

    //event streams
    EventChannel<ModeChange>& mode_changes() {return power_.changes();}
    EventChannel<PhaseChange>& phase_changes() {return phase_.changes();}
    EventChannel<SwingAnalytics>& swings() {return swings_;}
    EventChannel<DetectionEvent>& detections() {return detections_;}
    EventChannel<ConfirmationEvent>& confirmations() {return confirm_.events();}
    EventChannel<SensorNotice>& notices() {return sampler_.notices();}
    EventChannel<int>& putts() {return putts_;}

private:
    SessionConfig cfg_;
    TimerQueue& timers_;

    MotionSampler sampler_;
    PowerController power_;
    AccelKalman filter_;
    SwingDetector detector_;
    PhaseTracker phase_;
    SwingAnalyzer analyzer_;
    SessionStats stats_;
    PracticeClassifier practice_;
    ShotConfirmation confirm_;
    PuttDetector putt_;

    EventChannel<SwingAnalytics> swings_;
    EventChannel<DetectionEvent> detections_;
    EventChannel<int> putts_;
    StatusBoard board_;

    bool detecting_ = false;
    std::optional<GeoPoint> location_;
    std::optional<SwingCapture> in_flight_;     //captured, analytics not out yet
    TimerHandle analysis_timer_;
    bool has_last_detection_ = false;
    uint64_t last_detection_us_ = 0;
    int shot_count_ = 0;
    float peak_g_ = 0.0f;
    float peak_rot_ = 0.0f;

    void on_sample_(const MotionSample& raw);
    void on_detection_(SwingCapture cap);
    void finalize_swing_();
    void on_confirmation_(const ConfirmationEvent& ev);
    void on_mode_change_(const ModeChange& ev);
    void reset_pipeline_();
    void publish_status_();
};

}   //namespace swg
