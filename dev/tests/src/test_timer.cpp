#include "swg/timer.hpp"
#include <cstdio>
#include <vector>

using namespace swg;

//timer queue: deadline order, cancel on handle drop/re-arm, callbacks see their own deadline as now
//g++ -std=c++17 -I lib/core/include dev/tests/src/test_timer.cpp lib/core/src/timer.cpp -o /tmp/test_timer && /tmp/test_timer

static int fails = 0;

static void test_int(const char* name, long long got, long long want){
    if (got != want) {std::printf("[FAIL] %s: got=%lld want=%lld\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%lld want=%lld\n", name, got, want);
}

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

int main(){

    // 1) deadline order, partial advance
    {
        TimerQueue q(0);
        std::vector<int> fired;
        TimerHandle a = q.schedule_at(100, [&]{ fired.push_back(1); });
        TimerHandle b = q.schedule_at(50, [&]{ fired.push_back(2); });

        q.advance_to(75);
        test_int("partial advance fired", (long long)fired.size(), 1);
        test_int("earliest first", fired[0], 2);
        test_int("now after advance", (long long)q.now_us(), 75);
        test_bool("late timer still armed", a.armed(), true);
        test_bool("fired timer disarmed", b.armed(), false);
        test_int("deadline", (long long)a.deadline_us(), 100);

        q.advance_to(200);
        test_int("all fired", (long long)fired.size(), 2);
        test_int("queue empty", (long long)q.pending(), 0);
    }

    // 2) ties fire in schedule order
    {
        TimerQueue q(0);
        std::vector<int> fired;
        TimerHandle a = q.schedule_at(10, [&]{ fired.push_back(1); });
        TimerHandle b = q.schedule_at(10, [&]{ fired.push_back(2); });
        q.advance_to(10);
        test_bool("tie order", fired.size() == 2 && fired[0] == 1 && fired[1] == 2, true);
    }

    // 3) cancel, destroy and re-arm all drop the old timer
    {
        TimerQueue q(0);
        int hits = 0;
        TimerHandle a = q.schedule_after(10, [&]{ hits++; });
        a.cancel();
        {
            TimerHandle tmp = q.schedule_after(10, [&]{ hits++; });
        }
        TimerHandle c = q.schedule_after(10, [&]{ hits += 100; });
        c = q.schedule_after(20, [&]{ hits++; });       //re-arm replaces
        q.advance_to(1000);
        test_int("only the re-armed timer fired", hits, 1);
    }

    // 4) callback sees its deadline as now and may re-arm
    {
        TimerQueue q(0);
        std::vector<long long> seen;
        TimerHandle h;
        std::function<void()> tick = [&]{
            seen.push_back((long long)q.now_us());
            if (seen.size() < 3) h = q.schedule_after(100, tick);
        };
        h = q.schedule_after(100, tick);
        q.advance_to(1000);
        test_int("periodic fired", (long long)seen.size(), 3);
        test_bool("deadlines as now", seen.size() == 3 && seen[0] == 100 && seen[1] == 200 && seen[2] == 300, true);
        test_int("now at target", (long long)q.now_us(), 1000);
    }

    // 5) time never goes backwards, past deadlines fire on next advance
    {
        TimerQueue q(500);
        int hits = 0;
        q.advance_to(100);
        test_int("no rewind", (long long)q.now_us(), 500);
        TimerHandle h = q.schedule_at(10, [&]{ hits++; });
        test_int("past deadline clamped", (long long)h.deadline_us(), 500);
        q.advance_to(500);
        test_int("past deadline fired", hits, 1);
    }

    return fails ? 1 : 0;
}
