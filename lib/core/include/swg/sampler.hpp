#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>
#include "swg/types.hpp"
#include "swg/events.hpp"
#include "swg/timer.hpp"

namespace swg {

// callbacks a source pushes into, from its interrupt/driver context
struct SourceCallbacks {
    std::function<void(const MotionSample&)> on_sample;
    std::function<void(const std::vector<MotionSample>&)> on_batch;
    std::function<void(const SensorError&)> on_error;
};

// hardware seam: per-sample IMU stream and an optional batched high rate stream
// a callback may call stop() and start_*() again before it returns (mode changes restart the
// stream from inside the sample sink): invoke from a copy of the callbacks, or keep the running
// ones alive until they return, never destroy them mid call
class MotionSource {
public:
    virtual ~MotionSource() = default;

    virtual bool motion_available() const = 0;
    virtual bool batched_available() const = 0;

    virtual bool start_stream(uint64_t interval_us, const SourceCallbacks& cb) = 0;
    virtual bool start_batched(const SourceCallbacks& cb) = 0;
    virtual uint32_t batched_rate_hz() const = 0;   //hardware reported, 0 if unknown

    virtual void stop() = 0;
};

struct SamplerConfig {
    bool prefer_batched = true;
    float batch_min_hz = 100.0f;        //requests below this stay on the per-sample stream
    uint32_t batched_rate_hz = 200;     //assumed when the source does not report one
    int repeat_error_count = 3;         //same fault this many times in a row -> notice
    float notice_expiry_s = 5.0f;
};

// dismissible, auto expiring notice for a persistent sensor fault
struct SensorNotice {
    bool active = false;
    int code = 0;
    uint64_t expires_us = 0;
};

class MotionSampler {
public:
    MotionSampler(const SamplerConfig& cfg, MotionSource& src, TimerQueue& timers);
    ~MotionSampler();

    MotionSampler(const MotionSampler&) = delete;
    MotionSampler& operator=(const MotionSampler&) = delete;

    Status start(float requested_hz);   //restarts delivery if already running
    void stop();

    void set_sink(std::function<void(const MotionSample&)> sink) {sink_ = std::move(sink);}
    void dismiss_notice();

    bool running() const {return running_;}
    bool batched() const {return batched_;}
    float requested_rate_hz() const {return requested_hz_;}
    float effective_rate_hz() const {return effective_hz_;}
    uint64_t samples_delivered() const {return delivered_;}
    const SensorNotice& notice() const {return notice_;}

    EventChannel<SensorNotice>& notices() {return notices_;}

private:
    SamplerConfig cfg_;
    MotionSource& src_;
    TimerQueue& timers_;

    std::function<void(const MotionSample&)> sink_;
    EventChannel<SensorNotice> notices_;

    bool running_ = false;
    bool batched_ = false;
    float requested_hz_ = 0.0f;
    float effective_hz_ = 0.0f;
    uint64_t delivered_ = 0;
    uint32_t session_ = 0;      //bumps on every start/stop so late callbacks from an old stream are dropped

    //fault tracking
    int last_fault_code_ = 0;
    int fault_streak_ = 0;
    SensorNotice notice_{};
    TimerHandle notice_timer_;

    bool open_(float hz);               //batched if wanted and possible, else per-sample
    SourceCallbacks make_callbacks_();
    void deliver_(const MotionSample& s);
    void on_error_(const SensorError& e);
    void clear_notice_(bool publish);
};

}   //namespace swg
