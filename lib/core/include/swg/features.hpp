#pragma once
#include <cstddef>      //defines common c++ types
#include <cstdint>
#include <vector>

// we will use structs to contain related data
// we will use classes to help with abstraction, not just data

namespace swg{

// running mean and sample variance over everything pushed since the last reset
// welford update, so long sessions do not lose precision to a big sum of squares
class RunningStats {
public:
    void reset() {n_ = 0; mean_ = 0.0; m2_ = 0.0;}
    void push(float x);
    long count()        const {return n_;}
    float mean()        const {return float(mean_);}     //0 when empty
    float var_sample()  const;                          //0 if n<2
    float stddev()      const;

private:
    long n_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

// fixed capacity ring, oldest entries are evicted first
template <typename T>
class Ring {
public:
    explicit Ring(std::size_t cap) : buf_(cap ? cap : 1) {}

    void clear() {head_ = 0; n_ = 0;}

    void push(const T& v) {
        buf_[(head_ + n_) % buf_.size()] = v;
        if (n_ < buf_.size()) n_++;
        else head_ = (head_ + 1) % buf_.size();     //full, overwrite oldest
    }

    // i = 0 is the oldest entry still held
    const T& operator[](std::size_t i) const {return buf_[(head_ + i) % buf_.size()];}

    // drops the newest n entries
    void drop_newest(std::size_t n) {n_ = (n >= n_) ? 0 : n_ - n;}

    std::size_t size() const {return n_;}
    std::size_t capacity() const {return buf_.size();}
    bool empty() const {return n_ == 0;}

    // copies the newest n entries (fewer if not held) oldest first
    std::vector<T> tail(std::size_t n) const {
        const std::size_t k = (n < n_) ? n : n_;
        std::vector<T> out;
        out.reserve(k);
        for (std::size_t i = n_ - k; i < n_; ++i) out.push_back((*this)[i]);
        return out;
    }

private:
    std::vector<T> buf_;
    std::size_t head_ = 0;
    std::size_t n_ = 0;
};

}   // namespace swg
