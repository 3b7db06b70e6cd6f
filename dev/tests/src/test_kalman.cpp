#include "swg/kalman.hpp"
#include <cstdio>
#include <cmath>

using namespace swg;

//purpose of this test is to smoke test kalman.cpp: gain, convergence, no overshoot on a step, reset
//g++ -std=c++17 -I lib/core/include \
  dev/tests/src/test_kalman.cpp \
  lib/core/src/kalman.cpp \
  -o /tmp/test_kalman && /tmp/test_kalman

static int fails = 0;

static void test_near(const char* name, float got, float want, float eps=1e-2f){
    float err = std::fabs(got-want);
    if (err > eps) {std::printf("[FAIL] %s: got=%.6f want=%.6f (|err|=%.6f)\n", name, got, want, err); fails++;}
    else           std::printf("[PASS] %s: got=%.6f want=%.6f\n", name, got, want);
}

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

int main() {

    FilterConfig cfg{};     //q=0.1 r=0.5 p0=1
    AccelKalman kf(cfg);

    // first step: P_pred = 1.1, K = 1.1/1.6
    Vec3 e = kf.update(Vec3{2.0f, 0.0f, 0.0f});
    test_near("first gain", kf.last_gain(), 0.6875f, 1e-5f);
    test_near("first estimate x", e.x, 1.375f, 1e-5f);

    // one shared gain on all axes
    kf.reset();
    e = kf.update(Vec3{1.0f, 2.0f, 3.0f});
    test_near("same gain y/x", e.y, 2.0f * e.x, 1e-5f);
    test_near("same gain z/x", e.z, 3.0f * e.x, 1e-5f);

    // step input: rises monotonically, never overshoots, settles on the input
    kf.reset();
    bool monotonic = true;
    bool overshoot = false;
    float prev = 0.0f;
    for (int i=0; i<200; ++i){
        e = kf.update(Vec3{0.0f, 0.0f, 1.0f});
        if (e.z < prev) monotonic = false;
        if (e.z > 1.0f + 1e-6f) overshoot = true;
        prev = e.z;
    }
    test_bool("step monotonic", monotonic, true);
    test_bool("step overshoot", overshoot, false);
    test_near("step settles", e.z, 1.0f, 1e-4f);

    // steady state: P^2 + qP - qr = 0
    const float p_ss = (-cfg.q + std::sqrt(cfg.q*cfg.q + 4.0f*cfg.q*cfg.r)) / 2.0f;
    test_near("steady covariance", kf.covariance(), p_ss, 1e-4f);

    // reset
    kf.reset();
    test_near("reset estimate", norm(kf.estimate()), 0.0f, 1e-9f);
    test_near("reset covariance", kf.covariance(), cfg.p0, 1e-9f);

    return fails ? 1 : 0;
}
