#include "swg/putting.hpp"
#include "swg/log.hpp"
#include <cstdio>

using namespace swg;

//putt detector: auto mode from distance to green, putt signature, cooldown

static int fails = 0;

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

static MotionSample stroke(double t_s, float g, float rot){
    MotionSample s{};
    s.t_us = s_to_us(t_s);
    s.acc = {0, 0, g};
    s.rot = {rot, 0, 0};
    return s;
}

int main(){
    set_log_level(LogLevel::Warn);

    PuttDetector pd(PuttConfig{});

    test_bool("off by default", pd.enabled(), false);
    test_bool("ignored when off", pd.update(stroke(1.0, 1.5f, 2.0f)), false);

    // distance to green drives the mode
    test_bool("far stays off", pd.set_distance_to_green(150), false);
    test_bool("20 yd flips on", pd.set_distance_to_green(20), true);
    test_bool("on", pd.enabled(), true);
    test_bool("25 yd no flip", pd.set_distance_to_green(25), false);
    test_bool("100 yd flips off", pd.set_distance_to_green(100), true);
    test_bool("unknown distance stays off", pd.set_distance_to_green(0), false);
    test_bool("30 yd inclusive", pd.set_distance_to_green(30), true);

    // signature
    test_bool("putt", pd.update(stroke(10.0, 1.5f, 2.0f)), true);
    test_bool("inside cooldown", pd.update(stroke(11.0, 1.5f, 2.0f)), false);
    test_bool("after cooldown", pd.update(stroke(12.5, 1.5f, 2.0f)), true);
    test_bool("count", pd.count() == 2, true);

    test_bool("too hard", pd.update(stroke(20.0, 5.0f, 2.0f)), false);
    test_bool("too soft", pd.update(stroke(30.0, 0.5f, 2.0f)), false);
    test_bool("too much rotation", pd.update(stroke(40.0, 1.5f, 8.0f)), false);
    test_bool("no rotation", pd.update(stroke(50.0, 1.5f, 0.5f)), false);

    pd.reset_count();
    test_bool("reset count", pd.count() == 0, true);
    test_bool("reset clears cooldown", pd.update(stroke(50.5, 1.5f, 2.0f)), true);

    pd.toggle();
    test_bool("toggle off", pd.enabled(), false);
    pd.set_enabled(true);
    test_bool("manual on", pd.enabled(), true);

    return fails ? 1 : 0;
}
