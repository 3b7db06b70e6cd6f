#include "swg/phase.hpp"
#include "swg/log.hpp"

//phase chain: LEGAL transitions are the successor or a reset to Idle
//then the per phase detection rules

namespace swg{

const char* phase_name(SwingPhase p){
    switch (p)
    {
    case SwingPhase::Idle: return "Idle";
    case SwingPhase::Address: return "Address";
    case SwingPhase::Backswing: return "Backswing";
    case SwingPhase::TopOfSwing: return "Top";
    case SwingPhase::Transition: return "Transition";
    case SwingPhase::Downswing: return "Downswing";
    case SwingPhase::Impact: return "Impact";
    case SwingPhase::FollowThrough: return "Follow Through";
    case SwingPhase::Finished: return "Finished";
    default: return "?";
    }
}

SwingPhase next_phase(SwingPhase p){
    switch (p)
    {
    case SwingPhase::Idle: return SwingPhase::Address;
    case SwingPhase::Address: return SwingPhase::Backswing;
    case SwingPhase::Backswing: return SwingPhase::TopOfSwing;
    case SwingPhase::TopOfSwing: return SwingPhase::Transition;
    case SwingPhase::Transition: return SwingPhase::Downswing;
    case SwingPhase::Downswing: return SwingPhase::Impact;
    case SwingPhase::Impact: return SwingPhase::FollowThrough;
    case SwingPhase::FollowThrough: return SwingPhase::Finished;
    default: return SwingPhase::Finished;
    }
}

bool is_legal(SwingPhase from, SwingPhase to){
    if (to == SwingPhase::Idle) return from != SwingPhase::Idle;   //abandon or reset after Finished
    if (from == SwingPhase::Finished) return false;                 //terminal
    return next_phase(from) == to;
}

PhaseTracker::PhaseTracker(const PhaseConfig& cfg, float sensitivity)
:   cfg_(cfg), sens_(sensitivity) {
    reset();
}

void PhaseTracker::reset(){
    phase_ = SwingPhase::Idle;
    cur_ = PhaseTiming{};
    top_min_g_ = 0.0f;
    down_start_us_ = 0;
}

SwingPhase PhaseTracker::update(const MotionSample& s){
    const float g = s.magnitude();
    const uint64_t t = s.t_us;

    switch (phase_)
    {
    case SwingPhase::Idle:
        if (g > g_(cfg_.wake_g)) {
            cur_ = PhaseTiming{};
            cur_.start_us = t;
            advance_(SwingPhase::Address, t);
            advance_(SwingPhase::Backswing, t);
        }
        break;

    case SwingPhase::Address:           //only passed through inside Idle, kept for completeness
        advance_(SwingPhase::Backswing, t);
        break;

    case SwingPhase::Backswing: {
        const double back_s = us_to_s(t - cur_.start_us);
        if (back_s > cfg_.max_backswing_s) {
            abandon_("backswing too long", t);
        } else if (back_s >= cfg_.min_backswing_s && g < g_(cfg_.top_g)) {
            cur_.top_us = t;
            top_min_g_ = g;
            advance_(SwingPhase::TopOfSwing, t);
        }
        break;
    }

    case SwingPhase::TopOfSwing:
        if (us_to_s(t - cur_.top_us) > cfg_.max_transition_s) {
            abandon_("transition too slow", t);
        } else if (g <= top_min_g_) {
            top_min_g_ = g;             //still slowing, the top is the local minimum
            cur_.top_us = t;
        } else if (g > top_min_g_ + g_(cfg_.transition_rise_g)) {
            advance_(SwingPhase::Transition, t);
            if (g > g_(cfg_.downswing_g)) {
                down_start_us_ = t;
                cur_.peak_g = g;
                cur_.impact_us = t;
                advance_(SwingPhase::Downswing, t);
            }
        }
        break;

    case SwingPhase::Transition:
        if (us_to_s(t - cur_.top_us) > cfg_.max_transition_s) {
            abandon_("transition too slow", t);
        } else if (g > g_(cfg_.downswing_g)) {
            down_start_us_ = t;
            cur_.peak_g = g;
            cur_.impact_us = t;
            advance_(SwingPhase::Downswing, t);
        }
        break;

    case SwingPhase::Downswing: {
        if (g > cur_.peak_g) {          //global peak marks impact
            cur_.peak_g = g;
            cur_.impact_us = t;
        }
        const double down_s = us_to_s(t - down_start_us_);
        const float decel = cur_.peak_g - g;
        if (down_s >= cfg_.min_downswing_s && cur_.peak_g > g_(cfg_.impact_g) && decel > g_(cfg_.impact_decel_g)) {
            cur_.impact = true;
            cur_.impact_decel_g = decel;
            advance_(SwingPhase::Impact, t);
        } else if (down_s > cfg_.max_downswing_s) {
            advance_(SwingPhase::Impact, t);    //impact missed, the swing still completes
        }
        break;
    }

    case SwingPhase::Impact:
        advance_(SwingPhase::FollowThrough, t);
        break;

    case SwingPhase::FollowThrough:
        if (g < g_(cfg_.settle_g) || us_to_s(t - cur_.impact_us) > cfg_.max_follow_s) finish_(t);
        break;

    case SwingPhase::Finished:          //finish_ resets straight away, never held across samples
        advance_(SwingPhase::Idle, t);
        reset();
        break;
    }

    return phase_;
}

void PhaseTracker::advance_(SwingPhase to, uint64_t t_us){
    if (!is_legal(phase_, to)) {
        log_warn("phase: illegal %s -> %s ignored", phase_name(phase_), phase_name(to));
        return;
    }
    PhaseChange ev{phase_, to, t_us};
    phase_ = to;
    log_debug("phase: %s -> %s", phase_name(ev.from), phase_name(ev.to));
    changes_.publish(ev);
}

void PhaseTracker::abandon_(const char* why, uint64_t t_us){
    log_debug("phase: swing abandoned (%s)", why);
    abandoned_++;
    advance_(SwingPhase::Idle, t_us);
    reset();
}

void PhaseTracker::finish_(uint64_t t_us){
    if (phase_ == SwingPhase::FollowThrough) advance_(SwingPhase::Finished, t_us);
    cur_.end_us = t_us;
    last_ = cur_;
    completed_++;
    advance_(SwingPhase::Idle, t_us);
    reset();
}

}   //namespace swg
