#pragma once
#include <array>
#include <cstdint>
#include "swg/types.hpp"
#include "swg/events.hpp"
#include "swg/timer.hpp"
#include "swg/sampler.hpp"

namespace swg {

// ======= Power modes =======
enum class PowerMode : uint8_t {
    Idle = 0,           // nothing sampled
    Listening = 1,      // 10 Hz, watching for motion
    Active = 2,         // 100 Hz, tracking motion
    HighFrequency = 3,  // 200 Hz, precise swing/impact capture
    Paused = 4          // explicit pause, nothing sampled
};

constexpr int kPowerModeCount = 5;

const char* mode_name(PowerMode m);
float mode_rate_hz(PowerMode m);        //requested sensor rate
uint64_t mode_interval_us(PowerMode m);
float mode_power_draw(PowerMode m);     //relative draw, reporting only
inline bool mode_samples(PowerMode m) {return m != PowerMode::Idle && m != PowerMode::Paused;}

struct PowerConfig {
    float wake_g = 1.5f;                // Listening -> Active
    float high_freq_g = 4.0f;           // Active -> HighFrequency
    float active_timeout_s = 5.0f;      // quiet time before Active -> Listening
    float high_freq_timeout_s = 2.0f;   // quiet time before HighFrequency -> Active
    float override_s = 3.0f;            // forced HighFrequency duration
    float full_power_hours = 8.0f;      // battery life at draw 1.0
    float min_estimate_s = 60.0f;       // accounting needed before estimating
};

struct ModeChange {
    PowerMode from = PowerMode::Idle;
    PowerMode to = PowerMode::Idle;
    float rate_hz = 0.0f;               //effective rate after the change
    uint64_t t_us = 0;
};

// time spent per mode, side computation only
struct PowerStats {
    std::array<double, kPowerModeCount> seconds{};

    double total_s() const;
    double seconds_in(PowerMode m) const {return seconds[static_cast<int>(m)];}
    double efficiency() const;          //share of time in the low power band
    double average_draw() const;
    double estimated_remaining_s(float battery_level, const PowerConfig& cfg) const;
};

class PowerController {
public:
    PowerController(const PowerConfig& cfg, MotionSampler& sampler, TimerQueue& timers);

    PowerController(const PowerController&) = delete;
    PowerController& operator=(const PowerController&) = delete;

    Status start();         // Idle -> Listening
    void stop();            // any -> Idle, all timers dropped
    Status pause();
    Status resume();        // Paused -> Listening
    Status force_high_frequency(float duration_s = -1.0f);     //<0 uses cfg override_s

    // raw (unfiltered) sample energy drives escalation
    void observe(const MotionSample& raw);

    PowerMode mode() const {return mode_;}
    bool override_active() const {return override_;}
    uint64_t timeout_deadline_us() const {return mode_timer_.deadline_us();}
    PowerStats stats() const;
    const PowerConfig& config() const {return cfg_;}

    EventChannel<ModeChange>& changes() {return changes_;}

private:
    PowerConfig cfg_;
    MotionSampler& sampler_;
    TimerQueue& timers_;
    EventChannel<ModeChange> changes_;

    PowerMode mode_ = PowerMode::Idle;
    bool override_ = false;
    TimerHandle mode_timer_;

    uint64_t mode_start_us_ = 0;
    uint64_t last_motion_us_ = 0;
    PowerStats acc_{};

    Status transition_(PowerMode to);
    void commit_(PowerMode to);     //bookkeeping + event, sensor already switched
    void arm_mode_timer_();
    void arm_active_check_(uint64_t delay_us);
    void on_active_timeout_();
};

}   //namespace swg
