#include "swg/sampler.hpp"
#include "swg/log.hpp"
#include <algorithm>

namespace swg {

MotionSampler::MotionSampler(const SamplerConfig& cfg, MotionSource& src, TimerQueue& timers)
:   cfg_(cfg), src_(src), timers_(timers) {
    cfg_.repeat_error_count = std::max(1, cfg_.repeat_error_count);
}

MotionSampler::~MotionSampler(){
    stop();
}

Status MotionSampler::start(float requested_hz){
    if (!src_.motion_available()) {
        log_error("sampler: no motion source available");
        return Status::SensorUnavailable;
    }
    requested_hz = std::max(requested_hz, 0.1f);

    const bool was_running = running_;
    const float prev_hz = requested_hz_;

    if (running_) src_.stop();          //rate change means a fresh stream
    running_ = false;
    session_++;

    if (!open_(requested_hz)) {
        log_error("sampler: source refused to start at %.0f Hz", requested_hz);

        //fall back to the stream we had, the caller keeps its current rate
        if (was_running && open_(prev_hz)) {
            running_ = true;
            log_warn("sampler: kept the previous %.0f Hz stream", prev_hz);
        } else {
            batched_ = false;
            effective_hz_ = 0.0f;
        }
        return Status::SensorUnavailable;
    }

    requested_hz_ = requested_hz;
    running_ = true;
    log_debug("sampler: %s stream, requested %.0f Hz, effective %.0f Hz",
              batched_ ? "batched" : "standard", requested_hz_, effective_hz_);
    return Status::Ok;
}

bool MotionSampler::open_(float hz){
    const bool want_batched = cfg_.prefer_batched && hz >= cfg_.batch_min_hz;
    if (want_batched && src_.batched_available() && src_.start_batched(make_callbacks_())) {
        const uint32_t hw = src_.batched_rate_hz();
        batched_ = true;
        effective_hz_ = float(hw ? hw : cfg_.batched_rate_hz);  //can be above the request
        return true;
    }

    const uint64_t interval_us = std::max<uint64_t>(1, s_to_us(1.0 / double(hz)));
    if (!src_.start_stream(interval_us, make_callbacks_())) return false;
    batched_ = false;
    effective_hz_ = hz;
    return true;
}

void MotionSampler::stop(){
    if (running_) src_.stop();
    running_ = false;
    batched_ = false;
    effective_hz_ = 0.0f;
    session_++;
    fault_streak_ = 0;
    last_fault_code_ = 0;
    clear_notice_(false);
}

void MotionSampler::dismiss_notice(){
    if (notice_.active) clear_notice_(true);
}

SourceCallbacks MotionSampler::make_callbacks_(){
    const uint32_t sess = session_;
    SourceCallbacks cb;
    cb.on_sample = [this, sess](const MotionSample& s){
        if (sess == session_) deliver_(s);
    };
    cb.on_batch = [this, sess](const std::vector<MotionSample>& batch){
        //a restart from inside the sink may replace this closure in the source,
        //so nothing captured is read once delivery starts
        MotionSampler* self = this;
        if (sess != self->session_) return;
        //unpack one at a time, hardware per-sample timestamps kept
        for (const MotionSample& s : batch) {
            if (!self->running_) return;    //a sink may stop us mid batch, a rate change may not
            self->deliver_(s);
        }
    };
    cb.on_error = [this, sess](const SensorError& e){
        if (sess == session_) on_error_(e);
    };
    return cb;
}

void MotionSampler::deliver_(const MotionSample& s){
    if (!running_) return;
    delivered_++;
    fault_streak_ = 0;                  //only back to back faults count as repeated
    if (sink_) sink_(s);
}

void MotionSampler::on_error_(const SensorError& e){
    if (e.kind == SensorError::Kind::Transient) {
        log_debug("sampler: transient sensor condition %d ignored", e.code);
        return;
    }

    if (e.code == last_fault_code_) fault_streak_++;
    else {
        last_fault_code_ = e.code;
        fault_streak_ = 1;
    }
    log_warn("sampler: sensor fault %d (x%d)", e.code, fault_streak_);

    if (fault_streak_ < cfg_.repeat_error_count || notice_.active) return;

    fault_streak_ = 0;                  //a dismissed notice needs a fresh streak
    notice_.active = true;
    notice_.code = e.code;
    notice_.expires_us = timers_.now_us() + s_to_us(cfg_.notice_expiry_s);
    notice_timer_ = timers_.schedule_at(notice_.expires_us, [this]{ clear_notice_(true); });
    notices_.publish(notice_);
}

void MotionSampler::clear_notice_(bool publish){
    notice_timer_.cancel();
    if (!notice_.active) return;
    notice_ = SensorNotice{};
    if (publish) notices_.publish(notice_);
}

}   //namespace swg
