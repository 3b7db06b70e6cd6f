#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <map>

namespace swg {

class TimerQueue;

// move-only token for one scheduled callback
// destroying or overwriting a handle cancels its timer, so re-arming always drops the stale one
class TimerHandle {
public:
    TimerHandle() = default;
    ~TimerHandle() {cancel();}

    TimerHandle(const TimerHandle&) = delete;
    TimerHandle& operator=(const TimerHandle&) = delete;

    TimerHandle(TimerHandle&& o) noexcept : q_(o.q_), id_(o.id_) {o.q_ = nullptr; o.id_ = 0;}
    TimerHandle& operator=(TimerHandle&& o) noexcept;

    void cancel();
    bool armed() const;
    uint64_t deadline_us() const;   //0 when not armed

private:
    friend class TimerQueue;
    TimerHandle(TimerQueue* q, uint64_t id) : q_(q), id_(id) {}

    TimerQueue* q_ = nullptr;
    uint64_t id_ = 0;
};

// deterministic one-shot timer queue, time is pushed in by the sample stream or a host tick
// not thread safe: owned by the sampling context (handles must not outlive the queue)
class TimerQueue {
public:
    explicit TimerQueue(uint64_t start_us = 0) : now_us_(start_us) {}

    TimerHandle schedule_after(uint64_t delay_us, std::function<void()> cb);
    TimerHandle schedule_at(uint64_t t_us, std::function<void()> cb);

    // fires everything due at or before t_us in deadline order, time never goes backwards
    void advance_to(uint64_t t_us);

    uint64_t now_us() const {return now_us_;}
    std::size_t pending() const {return entries_.size();}

private:
    friend class TimerHandle;
    struct Entry {uint64_t deadline_us; std::function<void()> cb;};

    void cancel_(uint64_t id) {entries_.erase(id);}
    bool armed_(uint64_t id) const {return entries_.count(id) != 0;}
    uint64_t deadline_(uint64_t id) const;

    uint64_t now_us_ = 0;
    uint64_t next_id_ = 0;
    std::map<uint64_t, Entry> entries_;     //id -> entry, ids grow so ties fire in schedule order
};

}   //namespace swg
