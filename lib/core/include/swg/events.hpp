#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace swg {

// typed event stream, subscribers run in the publisher's context
// list is guarded so UI code can subscribe/unsubscribe from another thread
template <typename T>
class EventChannel {
public:
    using Callback = std::function<void(const T&)>;
    using Id = std::size_t;

    Id subscribe(Callback cb) {
        std::lock_guard<std::mutex> lock(mu_);
        const Id id = ++next_id_;
        subs_.push_back({id, std::move(cb)});
        return id;
    }

    void unsubscribe(Id id) {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = subs_.begin(); it != subs_.end(); ++it) {
            if (it->id == id) {subs_.erase(it); return;}
        }
    }

    void publish(const T& ev) const {
        std::vector<Sub> snapshot;
        {
            std::lock_guard<std::mutex> lock(mu_);
            snapshot = subs_;                   //callbacks run unlocked so they may unsubscribe
        }
        for (const Sub& s : snapshot) s.cb(ev);
    }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return subs_.size();
    }

private:
    struct Sub {Id id; Callback cb;};

    mutable std::mutex mu_;
    std::vector<Sub> subs_;
    Id next_id_ = 0;
};

}   //namespace swg
