#include "swg/session.hpp"
#include "swg/log.hpp"
#include <algorithm>
#include <utility>

namespace swg {

static float clamp_sensitivity(float s){
    return std::min(1.5f, std::max(0.5f, s));
}

Session::Session(const SessionConfig& cfg, MotionSource& src, TimerQueue& timers)
:   cfg_(cfg),
    timers_(timers),
    sampler_(cfg.sampler, src, timers),
    power_(cfg.power, sampler_, timers),
    filter_(cfg.filter),
    detector_(cfg.det),
    phase_(cfg.phase, clamp_sensitivity(cfg.prefs.sensitivity)),
    analyzer_(cfg.analytics),
    stats_(),
    practice_(cfg.practice),
    confirm_(cfg.confirm, timers),
    putt_(cfg.putt) {
    cfg_.prefs.sensitivity = clamp_sensitivity(cfg_.prefs.sensitivity);
    sampler_.set_sink([this](const MotionSample& s){ on_sample_(s); });
    confirm_.events().subscribe([this](const ConfirmationEvent& ev){ on_confirmation_(ev); });
    power_.changes().subscribe([this](const ModeChange& ev){ on_mode_change_(ev); });
}

Session::~Session(){
    if (detecting_) stop();
}

Status Session::start(){
    if (detecting_) return Status::InvalidState;

    reset_pipeline_();                          //every session starts from rest
    const Status st = power_.start();
    if (st != Status::Ok) {
        log_error("session: cannot start detection (%s)", status_name(st));
        publish_status_();
        return st;
    }
    detecting_ = true;
    log_info("session: swing detection started");
    publish_status_();
    return Status::Ok;
}

void Session::stop(){
    detecting_ = false;
    analysis_timer_.cancel();                   //in-flight swing is discarded
    in_flight_.reset();
    confirm_.abort();
    power_.stop();
    reset_pipeline_();
    log_info("session: swing detection stopped");
    publish_status_();
}

Status Session::pause(){
    if (!detecting_) return Status::InvalidState;
    return power_.pause();
}

Status Session::resume(){
    if (!detecting_) return Status::InvalidState;
    return power_.resume();
}

Status Session::force_high_frequency(float duration_s){
    if (!detecting_) return Status::InvalidState;
    return power_.force_high_frequency(duration_s);
}

void Session::tick(uint64_t now_us){
    timers_.advance_to(now_us);
    publish_status_();
}

void Session::set_distance_to_green(int yards){
    if (!cfg_.prefs.auto_putting) return;
    if (putt_.set_distance_to_green(yards)) publish_status_();
}

void Session::set_putting_mode(bool on){
    putt_.set_enabled(on);
    log_info("session: putting mode manually %s", on ? "enabled" : "disabled");
    publish_status_();
}

void Session::set_preferences(const SwingPreferences& prefs){
    cfg_.prefs = prefs;
    cfg_.prefs.sensitivity = clamp_sensitivity(prefs.sensitivity);
    phase_.set_sensitivity(cfg_.prefs.sensitivity);
}

Status Session::confirm_shot(){
    return confirm_.confirm();      //bookkeeping happens in on_confirmation_
}

Status Session::dismiss_shot(){
    return confirm_.dismiss();
}

void Session::reset_peaks(){
    peak_g_ = 0.0f;
    peak_rot_ = 0.0f;
    publish_status_();
}

void Session::reset_putt_count(){
    putt_.reset_count();
    publish_status_();
}

void Session::on_sample_(const MotionSample& raw){
    timers_.advance_to(raw.t_us);               //due timers fire before this sample is looked at
    if (!detecting_) return;

    // 1) power mode runs on raw energy
    power_.observe(raw);
    if (!detecting_) return;                    //a failed restart can take the sensor with it

    const float g = raw.magnitude();
    const float rot = raw.rotation_magnitude();
    peak_g_ = std::max(peak_g_, g);
    peak_rot_ = std::max(peak_rot_, rot);

    // 2) smooth, then live phase tracking
    MotionSample filtered = raw;
    filtered.acc = filter_.update(raw.acc);
    phase_.update(filtered);

    // 3) putting replaces full swing detection near the green
    if (putt_.enabled()) {
        if (putt_.update(raw)) putts_.publish(putt_.count());
        publish_status_();
        return;
    }

    // 4) swing detection, held off while a prompt is up or a swing is still being finalized
    if (!confirm_.suppresses_detection() && !in_flight_) {
        std::optional<SwingCapture> cap = detector_.process(filtered);
        if (cap) on_detection_(std::move(*cap));
    }

    board_.write([&](StatusSnapshot& s){ s.current_g = g; });
    publish_status_();
}

void Session::on_detection_(SwingCapture cap){
    const uint64_t t = cap.detected_us;

    if (has_last_detection_ && t >= last_detection_us_ && us_to_s(t - last_detection_us_) < cfg_.swing_cooldown_s) {
        log_debug("session: detection inside cooldown ignored");
        return;
    }
    has_last_detection_ = true;
    last_detection_us_ = t;

    //classify with the location known right now
    const PracticeVerdict v = practice_.classify(t, location_);
    if (v.is_practice) confirm_.cancel_grace();         //wait for the real swing
    if (v.start_confirmation) confirm_.begin(location_);

    DetectionEvent ev;
    ev.t_us = t;
    ev.peak_g = cap.peak_g;
    ev.verdict = v;
    log_info("session: swing detected, peak %.1f G, practice=%d count=%d",
             cap.peak_g, int(v.is_practice), v.consecutive_count);
    detections_.publish(ev);
    if (!detecting_) return;                    //a subscriber stopped the session

    //analytics go out on the next turn of the clock, not inside the sample callback
    in_flight_ = std::move(cap);
    analysis_timer_ = timers_.schedule_after(0, [this]{ finalize_swing_(); });
}

void Session::finalize_swing_(){
    if (!in_flight_) return;

    const SwingAnalytics a = analyzer_.analyze(*in_flight_);
    in_flight_.reset();
    stats_.add(a);

    log_info("session: swing analyzed, tempo %.1f:1, speed %.0f mph, impact %s, path %s",
             a.tempo_ratio, a.peak_hand_speed_mph, a.impact_detected ? "yes" : "no", path_name(a.path));
    board_.write([&](StatusSnapshot& s){
        s.last_swing = a;
        s.swing_count = stats_.total_swings();
    });
    swings_.publish(a);
}

void Session::on_mode_change_(const ModeChange& ev){
    if (!detecting_ || ev.to != PowerMode::Idle) return;

    //only stop() asks for Idle, anything else is the sensor going away under us
    log_error("session: sensor stream lost, swing detection halted");
    detecting_ = false;
    analysis_timer_.cancel();
    in_flight_.reset();
    confirm_.abort();
    publish_status_();
}

void Session::on_confirmation_(const ConfirmationEvent& ev){
    switch (ev.kind)
    {
    case ConfirmationEvent::Kind::Confirmed:
        shot_count_++;
        practice_.reset();
        detector_.reset();          //detection resumes from fresh history
        break;

    case ConfirmationEvent::Kind::Dismissed:
        if (!ev.auto_dismissed) practice_.reset();
        detector_.reset();
        break;

    default:
        break;
    }
    publish_status_();
}

void Session::reset_pipeline_(){
    filter_.reset();
    detector_.reset();
    phase_.reset();
    practice_.reset();
    has_last_detection_ = false;
    last_detection_us_ = 0;
}

void Session::publish_status_(){
    const ConfirmationState cs = confirm_.state();
    board_.write([&](StatusSnapshot& s){
        s.t_us = timers_.now_us();
        s.detecting = detecting_;
        s.mode = power_.mode();
        s.phase = phase_.phase();
        s.confirmation = cs;
        s.notice = sampler_.notice();
        s.putting_mode = putt_.enabled();
        s.putt_count = putt_.count();
        s.shot_count = shot_count_;
        s.peak_g = peak_g_;
        s.peak_rotation = peak_rot_;
    });
}

}   //namespace swg
