#include "swg/power.hpp"
#include "swg/log.hpp"
#include <algorithm>

namespace swg {

const char* mode_name(PowerMode m){
    switch (m)
    {
    case PowerMode::Idle: return "Idle";
    case PowerMode::Listening: return "Listening";
    case PowerMode::Active: return "Active";
    case PowerMode::HighFrequency: return "High";
    case PowerMode::Paused: return "Paused";
    default: return "?";
    }
}

float mode_rate_hz(PowerMode m){
    switch (m)
    {
    case PowerMode::Active: return 100.0f;
    case PowerMode::HighFrequency: return 200.0f;
    default: return 10.0f;
    }
}

uint64_t mode_interval_us(PowerMode m){
    return s_to_us(1.0 / double(mode_rate_hz(m)));
}

float mode_power_draw(PowerMode m){
    switch (m)
    {
    case PowerMode::Listening: return 0.2f;
    case PowerMode::Active: return 0.6f;
    case PowerMode::HighFrequency: return 1.0f;
    default: return 0.1f;
    }
}

// stats

double PowerStats::total_s() const {
    double t = 0.0;
    for (double s : seconds) t += s;
    return t;
}

double PowerStats::efficiency() const {
    const double total = total_s();
    if (total <= 0.0) return 1.0;
    const double low = seconds_in(PowerMode::Idle) + seconds_in(PowerMode::Listening) + seconds_in(PowerMode::Paused);
    return low / total;
}

double PowerStats::average_draw() const {
    const double total = total_s();
    if (total <= 0.0) return 0.0;
    double w = 0.0;
    for (int i=0; i<kPowerModeCount; ++i) w += seconds[i] * mode_power_draw(static_cast<PowerMode>(i));
    return w / total;
}

double PowerStats::estimated_remaining_s(float battery_level, const PowerConfig& cfg) const {
    if (total_s() <= cfg.min_estimate_s) return 0.0;    //need some history first
    const double draw = average_draw();
    if (draw <= 0.0) return 0.0;
    const double level = std::min(1.0, std::max(0.0, double(battery_level)));
    return (double(cfg.full_power_hours) * 3600.0 / draw) * level;
}

// controller

PowerController::PowerController(const PowerConfig& cfg, MotionSampler& sampler, TimerQueue& timers)
:   cfg_(cfg), sampler_(sampler), timers_(timers) {
    mode_start_us_ = timers_.now_us();
}

Status PowerController::start(){
    if (mode_ != PowerMode::Idle) return Status::InvalidState;
    return transition_(PowerMode::Listening);
}

void PowerController::stop(){
    mode_timer_.cancel();
    override_ = false;
    transition_(PowerMode::Idle);
    last_motion_us_ = 0;
}

Status PowerController::pause(){
    if (mode_ == PowerMode::Paused) return Status::InvalidState;
    return transition_(PowerMode::Paused);
}

Status PowerController::resume(){
    if (mode_ != PowerMode::Paused) return Status::InvalidState;
    return transition_(PowerMode::Listening);
}

Status PowerController::force_high_frequency(float duration_s){
    if (!mode_samples(mode_)) return Status::InvalidState;
    if (duration_s < 0.0f) duration_s = cfg_.override_s;

    Status st = transition_(PowerMode::HighFrequency);
    if (st != Status::Ok) return st;

    //override replaces the normal timeout, expiry drops back to Active
    override_ = true;
    mode_timer_ = timers_.schedule_after(s_to_us(duration_s), [this]{
        override_ = false;
        if (mode_ == PowerMode::HighFrequency) transition_(PowerMode::Active);
    });
    log_info("power: high frequency forced for %.1f s", duration_s);
    return Status::Ok;
}

void PowerController::observe(const MotionSample& raw){
    const float energy = raw.magnitude();
    const uint64_t now = timers_.now_us();

    if (energy > cfg_.wake_g) last_motion_us_ = now;

    switch (mode_)
    {
    case PowerMode::Listening:
        if (energy > cfg_.wake_g) transition_(PowerMode::Active);
        break;

    case PowerMode::Active:
        if (energy > cfg_.high_freq_g) transition_(PowerMode::HighFrequency);
        break;

    case PowerMode::HighFrequency:
        if (energy > cfg_.high_freq_g) {
            //extend, never shorten a forced window
            const uint64_t deadline = now + s_to_us(cfg_.high_freq_timeout_s);
            if (!override_ || deadline > mode_timer_.deadline_us()) {
                override_ = false;
                arm_mode_timer_();
            }
        }
        break;

    default:
        break;
    }
}

PowerStats PowerController::stats() const {
    PowerStats out = acc_;
    const uint64_t now = timers_.now_us();
    if (now > mode_start_us_) out.seconds[static_cast<int>(mode_)] += us_to_s(now - mode_start_us_);
    return out;
}

Status PowerController::transition_(PowerMode to){
    if (to == mode_) {
        arm_mode_timer_();
        return Status::Ok;
    }

    //start the sensor first so a refused start leaves us where we were
    if (mode_samples(to)) {
        Status st = sampler_.start(mode_rate_hz(to));
        if (st != Status::Ok) {
            log_error("power: cannot enter %s (%s)", mode_name(to), status_name(st));
            if (mode_samples(mode_) && !sampler_.running()) {
                //the old stream could not be restored either, nothing samples any more
                log_error("power: sensor lost in %s, dropping to %s", mode_name(mode_), mode_name(PowerMode::Idle));
                sampler_.stop();
                commit_(PowerMode::Idle);
            } else {
                arm_mode_timer_();      //still on the old stream, try again when its timeout comes round
            }
            return st;
        }
    } else {
        sampler_.stop();
    }

    commit_(to);
    return Status::Ok;
}

void PowerController::commit_(PowerMode to){
    const uint64_t now = timers_.now_us();
    if (now > mode_start_us_) acc_.seconds[static_cast<int>(mode_)] += us_to_s(now - mode_start_us_);

    const PowerMode from = mode_;
    mode_ = to;
    mode_start_us_ = now;
    override_ = false;
    if (to == PowerMode::Active && from == PowerMode::Listening) last_motion_us_ = now;

    arm_mode_timer_();

    ModeChange ev;
    ev.from = from;
    ev.to = to;
    ev.rate_hz = sampler_.effective_rate_hz();
    ev.t_us = now;
    log_info("power: %s -> %s (%.0f Hz)", mode_name(from), mode_name(to), ev.rate_hz);
    changes_.publish(ev);
}

void PowerController::arm_mode_timer_(){
    switch (mode_)
    {
    case PowerMode::Active:
        arm_active_check_(s_to_us(cfg_.active_timeout_s));
        break;

    case PowerMode::HighFrequency:
        mode_timer_ = timers_.schedule_after(s_to_us(cfg_.high_freq_timeout_s), [this]{
            if (mode_ == PowerMode::HighFrequency) transition_(PowerMode::Active);
        });
        break;

    default:
        mode_timer_.cancel();
        break;
    }
}

void PowerController::arm_active_check_(uint64_t delay_us){
    mode_timer_ = timers_.schedule_after(delay_us, [this]{ on_active_timeout_(); });
}

void PowerController::on_active_timeout_(){
    if (mode_ != PowerMode::Active) return;

    const uint64_t now = timers_.now_us();
    const uint64_t timeout = s_to_us(cfg_.active_timeout_s);
    const uint64_t quiet = (now > last_motion_us_) ? now - last_motion_us_ : 0;

    if (quiet >= timeout) transition_(PowerMode::Listening);
    else arm_active_check_(timeout - quiet);    //motion seen meanwhile, check again when it would expire
}

}   //namespace swg
