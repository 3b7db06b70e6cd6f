#include "swg/timer.hpp"
#include <algorithm>
#include <utility>

namespace swg {

TimerHandle& TimerHandle::operator=(TimerHandle&& o) noexcept {
    if (this != &o) {
        cancel();                   //old timer never survives a re-arm
        q_ = o.q_;
        id_ = o.id_;
        o.q_ = nullptr;
        o.id_ = 0;
    }
    return *this;
}

void TimerHandle::cancel(){
    if (q_) q_->cancel_(id_);
    q_ = nullptr;
    id_ = 0;
}

bool TimerHandle::armed() const {
    return q_ && q_->armed_(id_);
}

uint64_t TimerHandle::deadline_us() const {
    return q_ ? q_->deadline_(id_) : 0;
}

uint64_t TimerQueue::deadline_(uint64_t id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? 0 : it->second.deadline_us;
}

TimerHandle TimerQueue::schedule_after(uint64_t delay_us, std::function<void()> cb){
    return schedule_at(now_us_ + delay_us, std::move(cb));
}

TimerHandle TimerQueue::schedule_at(uint64_t t_us, std::function<void()> cb){
    const uint64_t id = ++next_id_;
    entries_[id] = Entry{std::max(t_us, now_us_), std::move(cb)};
    return TimerHandle(this, id);
}

void TimerQueue::advance_to(uint64_t t_us){
    for (;;) {
        //earliest due entry, lowest id wins a tie
        auto due = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.deadline_us > t_us) continue;
            if (due == entries_.end() || it->second.deadline_us < due->second.deadline_us) due = it;
        }
        if (due == entries_.end()) break;

        now_us_ = std::max(now_us_, due->second.deadline_us);   //callbacks see their own deadline as now
        std::function<void()> cb = std::move(due->second.cb);
        entries_.erase(due);                                    //erase first, the callback may re-arm
        if (cb) cb();
    }
    now_us_ = std::max(now_us_, t_us);
}

}   //namespace swg
