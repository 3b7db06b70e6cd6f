#pragma once
#include <cstdint>
#include "swg/types.hpp"
#include "swg/events.hpp"

namespace swg{

// strict successor chain, Finished is terminal for one attempt
enum class SwingPhase : uint8_t {
    Idle = 0,
    Address = 1,
    Backswing = 2,
    TopOfSwing = 3,
    Transition = 4,
    Downswing = 5,
    Impact = 6,
    FollowThrough = 7,
    Finished = 8
};

const char* phase_name(SwingPhase p);
SwingPhase next_phase(SwingPhase p);            //Finished maps to itself
bool is_legal(SwingPhase from, SwingPhase to);  //successor, or back to Idle

struct PhaseConfig {
    //G thresholds, all scaled by user sensitivity
    float wake_g = 1.5f;            //Idle -> Address -> Backswing
    float top_g = 0.8f;             //backswing slows below this near the top
    float transition_rise_g = 0.2f; //rise above the top minimum that starts the transition
    float downswing_g = 4.0f;
    float impact_g = 8.0f;
    float impact_decel_g = 6.0f;
    float settle_g = 1.5f;          //follow through ends below this

    //timing constraints (s)
    float min_backswing_s = 0.3f;
    float max_backswing_s = 2.5f;
    float max_transition_s = 1.0f;
    float min_downswing_s = 0.1f;
    float max_downswing_s = 0.8f;
    float max_follow_s = 1.0f;
};

struct PhaseChange {
    SwingPhase from = SwingPhase::Idle;
    SwingPhase to = SwingPhase::Idle;
    uint64_t t_us = 0;
};

// timing of the last attempt that reached Finished
struct PhaseTiming {
    uint64_t start_us = 0;
    uint64_t top_us = 0;
    uint64_t impact_us = 0;
    uint64_t end_us = 0;
    float peak_g = 0.0f;
    bool impact = false;
    float impact_decel_g = 0.0f;
};

// real time phase tracker for live feedback, one attempt in flight at a time
class PhaseTracker {
public:
    explicit PhaseTracker(const PhaseConfig& cfg, float sensitivity = 1.0f);

    void reset();                           //back to Idle without an event
    void set_sensitivity(float s) {sens_ = s;}

    SwingPhase update(const MotionSample& s);   //feed one filtered sample

    SwingPhase phase() const {return phase_;}
    const PhaseTiming& last_timing() const {return last_;}
    uint32_t completed() const {return completed_;}
    uint32_t abandoned() const {return abandoned_;}

    EventChannel<PhaseChange>& changes() {return changes_;}

private:
    PhaseConfig cfg_;
    float sens_ = 1.0f;
    EventChannel<PhaseChange> changes_;

    SwingPhase phase_ = SwingPhase::Idle;
    PhaseTiming cur_{};
    PhaseTiming last_{};
    float top_min_g_ = 0.0f;
    uint64_t down_start_us_ = 0;
    uint32_t completed_ = 0;
    uint32_t abandoned_ = 0;

    float g_(float base) const {return base * sens_;}
    void advance_(SwingPhase to, uint64_t t_us);
    void abandon_(const char* why, uint64_t t_us);
    void finish_(uint64_t t_us);
};

}   //namespace swg
