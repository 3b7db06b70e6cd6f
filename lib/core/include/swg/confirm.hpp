#pragma once
#include <cstdint>
#include <optional>
#include "swg/types.hpp"
#include "swg/events.hpp"
#include "swg/timer.hpp"

namespace swg {

struct ConfirmConfig {
    float grace_s = 8.0f;           //delay before the prompt is shown
    float auto_dismiss_s = 30.0f;   //unanswered prompt goes away after this
};

enum class ConfirmPhase : uint8_t {
    Idle = 0,
    Grace = 1,      //candidate held, prompt not shown yet
    Pending = 2     //prompt shown, waiting for accept/dismiss
};

struct ConfirmationState {
    bool pending = false;
    std::optional<GeoPoint> candidate;
    uint64_t deadline_us = 0;       //end of grace, or auto dismiss time when pending
};

struct ConfirmationEvent {
    enum class Kind : uint8_t {Pending, Confirmed, Dismissed} kind = Kind::Pending;
    std::optional<GeoPoint> location;
    bool auto_dismissed = false;
    uint64_t t_us = 0;
};

// one candidate shot at a time: grace -> pending -> confirmed/dismissed
class ShotConfirmation {
public:
    ShotConfirmation(const ConfirmConfig& cfg, TimerQueue& timers) : cfg_(cfg), timers_(timers) {}

    ShotConfirmation(const ShotConfirmation&) = delete;
    ShotConfirmation& operator=(const ShotConfirmation&) = delete;

    void begin(const std::optional<GeoPoint>& candidate);  //replaces a candidate still in grace
    bool cancel_grace();                                    //silent, only before the prompt shows
    Status confirm();
    Status dismiss();
    void abort();                                           //silent clear, used on stop

    bool suppresses_detection() const {return phase_ == ConfirmPhase::Pending;}
    ConfirmPhase phase() const {return phase_;}
    ConfirmationState state() const;

    EventChannel<ConfirmationEvent>& events() {return events_;}

private:
    ConfirmConfig cfg_;
    TimerQueue& timers_;
    EventChannel<ConfirmationEvent> events_;

    ConfirmPhase phase_ = ConfirmPhase::Idle;
    std::optional<GeoPoint> candidate_;
    TimerHandle timer_;     //grace or auto dismiss, never both

    void surface_();
    void finish_(ConfirmationEvent::Kind kind, bool automatic);
};

}   //namespace swg
