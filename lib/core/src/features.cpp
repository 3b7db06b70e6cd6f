#include "swg/features.hpp"
#include <cmath>
#include <algorithm>

namespace swg{

void RunningStats::push(float x){
    n_++;
    const double d = double(x) - mean_;
    mean_ += d / double(n_);
    m2_ += d * (double(x) - mean_);
}

float RunningStats::var_sample() const {
    if (n_ < 2) return 0.0f;
    return float(std::max(0.0, m2_ / double(n_ - 1)));
}

float RunningStats::stddev() const {
    return std::sqrt(var_sample());
}

}   // namespace swg
