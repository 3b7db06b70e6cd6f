#include "swg/confirm.hpp"
#include "swg/log.hpp"

namespace swg {

ConfirmationState ShotConfirmation::state() const {
    ConfirmationState st{};
    st.pending = (phase_ == ConfirmPhase::Pending);
    st.candidate = candidate_;
    st.deadline_us = timer_.deadline_us();
    return st;
}

void ShotConfirmation::begin(const std::optional<GeoPoint>& candidate){
    if (phase_ == ConfirmPhase::Pending) {
        log_warn("confirm: prompt already showing, new candidate ignored");
        return;
    }
    candidate_ = candidate;
    phase_ = ConfirmPhase::Grace;
    timer_ = timers_.schedule_after(s_to_us(cfg_.grace_s), [this]{ surface_(); });
    log_debug("confirm: candidate held for %.1f s", cfg_.grace_s);
}

bool ShotConfirmation::cancel_grace(){
    if (phase_ != ConfirmPhase::Grace) return false;
    timer_.cancel();
    phase_ = ConfirmPhase::Idle;
    candidate_.reset();
    log_debug("confirm: candidate dropped during grace");
    return true;
}

Status ShotConfirmation::confirm(){
    if (phase_ != ConfirmPhase::Pending) return Status::InvalidState;
    finish_(ConfirmationEvent::Kind::Confirmed, false);
    return Status::Ok;
}

Status ShotConfirmation::dismiss(){
    if (phase_ != ConfirmPhase::Pending) return Status::InvalidState;
    finish_(ConfirmationEvent::Kind::Dismissed, false);
    return Status::Ok;
}

void ShotConfirmation::abort(){
    timer_.cancel();
    phase_ = ConfirmPhase::Idle;
    candidate_.reset();
}

void ShotConfirmation::surface_(){
    if (phase_ != ConfirmPhase::Grace) return;
    phase_ = ConfirmPhase::Pending;
    timer_ = timers_.schedule_after(s_to_us(cfg_.auto_dismiss_s), [this]{
        if (phase_ == ConfirmPhase::Pending) finish_(ConfirmationEvent::Kind::Dismissed, true);
    });

    ConfirmationEvent ev;
    ev.kind = ConfirmationEvent::Kind::Pending;
    ev.location = candidate_;
    ev.t_us = timers_.now_us();
    log_info("confirm: shot pending, waiting for the player");
    events_.publish(ev);
}

void ShotConfirmation::finish_(ConfirmationEvent::Kind kind, bool automatic){
    timer_.cancel();

    ConfirmationEvent ev;
    ev.kind = kind;
    ev.location = candidate_;
    ev.auto_dismissed = automatic;
    ev.t_us = timers_.now_us();

    phase_ = ConfirmPhase::Idle;
    candidate_.reset();

    if (kind == ConfirmationEvent::Kind::Confirmed) {
        if (ev.location) log_info("confirm: shot confirmed at (%.6f, %.6f)", ev.location->lat, ev.location->lon);
        else             log_info("confirm: shot confirmed, no location");
    } else {
        log_info("confirm: shot dismissed%s", automatic ? " (timeout)" : "");
    }
    events_.publish(ev);
}

}   //namespace swg
