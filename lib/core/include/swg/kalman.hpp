#pragma once            // includes this header only once per compilation (prevents redef)
#include <cstdint>
#include "swg/types.hpp"

namespace swg {

struct FilterConfig {

    //Q = process noise, how much we allow the accel to wander sample to sample
    float q = 0.1f;

    //R = measurement noise, model of how noisy the accelerometer is
    float r = 0.5f;

    //P initial covariance
    float p0 = 1.0f;
};

// scalar gain kalman for the 3 accel axes: one shared covariance and gain for x/y/z
// swing thresholds downstream were tuned against exactly this smoothing
class AccelKalman {
public:
    AccelKalman() {reset();}
    explicit AccelKalman(const FilterConfig& cfg) : cfg_(cfg) {reset();}

    void reset();                       //estimate back to zero, covariance back to p0
    Vec3 update(const Vec3& z);         //predict + correct, returns the new estimate

    Vec3 estimate() const {return x_;}
    float covariance() const {return P_;}
    float last_gain() const {return K_;}

private:
    FilterConfig cfg_{};

    Vec3 x_{};      //state
    float P_ = 1.0f;  //covariance
    float K_ = 0.0f;  //gain from the last update
};

}   //namespace swg
