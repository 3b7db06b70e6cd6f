#include "swg/sampler.hpp"
#include "swg/log.hpp"
#include "fake_source.hpp"
#include <cstdio>
#include <vector>

using namespace swg;

//sampler: stream selection, batch unpacking, stale callbacks, repeated fault notices

static int fails = 0;

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

static void test_int(const char* name, long long got, long long want){
    if (got != want) {std::printf("[FAIL] %s: got=%lld want=%lld\n", name, got, want); fails++;}
    else             std::printf("[PASS] %s: got=%lld want=%lld\n", name, got, want);
}

int main(){
    set_log_level(LogLevel::Warn);

    // 1) no sensor
    {
        FakeSource src;
        src.motion = false;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);
        test_bool("unavailable status", s.start(100.0f) == Status::SensorUnavailable, true);
        test_bool("unavailable not running", s.running(), false);
    }

    // 2) source refuses
    {
        FakeSource src;
        src.refuse = true;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);
        test_bool("refused status", s.start(10.0f) == Status::SensorUnavailable, true);
    }

    // 3) stream selection
    {
        FakeSource src;
        src.batched = true;
        src.hw_rate_hz = 400;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);

        test_bool("200 Hz ok", s.start(200.0f) == Status::Ok, true);
        test_bool("200 Hz batched", s.batched(), true);
        test_int("effective is hardware rate", (long long)s.effective_rate_hz(), 400);
        test_int("requested kept", (long long)s.requested_rate_hz(), 200);

        test_bool("10 Hz ok", s.start(10.0f) == Status::Ok, true);
        test_bool("10 Hz standard", s.batched(), false);
        test_int("10 Hz interval", (long long)src.interval_us, 100000);
        test_int("10 Hz effective", (long long)s.effective_rate_hz(), 10);
        test_int("restart stopped old stream", src.stops, 1);

        s.stop();
        test_bool("stopped", s.running(), false);
        test_int("stopped effective", (long long)s.effective_rate_hz(), 0);
    }

    // 4) batched not preferred, hardware rate unknown
    {
        FakeSource src;
        src.batched = true;
        src.hw_rate_hz = 0;
        TimerQueue q;
        SamplerConfig cfg{};
        cfg.prefer_batched = false;
        MotionSampler s(cfg, src, q);
        s.start(200.0f);
        test_bool("not preferred -> standard", s.batched(), false);
        test_int("standard interval", (long long)src.interval_us, 5000);

        MotionSampler s2(SamplerConfig{}, src, q);
        s2.start(200.0f);
        test_int("unknown hw rate assumed", (long long)s2.effective_rate_hz(), 200);
    }

    // 5) batch unpacked in order with hardware timestamps, stale callbacks dropped
    {
        FakeSource src;
        src.batched = true;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);
        std::vector<uint64_t> got;
        s.set_sink([&](const MotionSample& m){ got.push_back(m.t_us); });
        s.start(200.0f);

        src.emit_batch({make_sample(1000, 1.0f), make_sample(6000, 1.0f), make_sample(11000, 1.0f)});
        test_int("batch unpacked", (long long)got.size(), 3);
        test_bool("timestamps kept", got.size() == 3 && got[0] == 1000 && got[1] == 6000 && got[2] == 11000, true);

        SourceCallbacks old = src.cb;
        s.start(10.0f);
        old.on_sample(make_sample(20000, 1.0f));
        test_int("stale callback dropped", (long long)got.size(), 3);
        src.emit(make_sample(21000, 1.0f));
        test_int("fresh callback delivered", (long long)got.size(), 4);
        test_int("delivered counter", (long long)s.samples_delivered(), 4);
    }

    // 6) a sink restarting the stream mid batch keeps the rest of the batch
    {
        FakeSource src;
        src.batched = true;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);
        int got = 0;
        s.set_sink([&](const MotionSample&){
            got++;
            if (got == 1) s.start(100.0f);
        });
        s.start(200.0f);
        src.emit_batch({make_sample(1, 1.0f), make_sample(2, 1.0f), make_sample(3, 1.0f)});
        test_int("rate change mid batch", got, 3);
    }

    // 7) a refused rate change keeps the old stream running
    {
        FakeSource src;
        TimerQueue q;
        MotionSampler s(SamplerConfig{}, src, q);
        int got = 0;
        s.set_sink([&](const MotionSample&){ got++; });
        test_bool("start 10", s.start(10.0f) == Status::Ok, true);

        src.refuse_next = 1;
        test_bool("refused 100", s.start(100.0f) == Status::SensorUnavailable, true);
        test_bool("still running", s.running(), true);
        test_bool("source streaming", src.streaming, true);
        test_int("old interval restored", (long long)src.interval_us, 100000);
        test_int("requested rate kept", (long long)s.requested_rate_hz(), 10);
        test_int("effective rate kept", (long long)s.effective_rate_hz(), 10);
        src.emit(make_sample(1000, 1.0f));
        test_int("delivered after refusal", got, 1);

        src.refuse_next = 2;
        test_bool("refused twice", s.start(100.0f) == Status::SensorUnavailable, true);
        test_bool("no stream left", s.running(), false);
        test_int("effective rate cleared", (long long)s.effective_rate_hz(), 0);
    }

    // 8) fault notices
    {
        FakeSource src;
        TimerQueue q(0);
        MotionSampler s(SamplerConfig{}, src, q);
        std::vector<SensorNotice> seen;
        s.notices().subscribe([&](const SensorNotice& n){ seen.push_back(n); });
        s.start(10.0f);

        for (int i=0; i<5; ++i) src.emit_error(SensorError::Kind::Transient, 1);
        test_int("transient ignored", (long long)seen.size(), 0);

        src.emit_error(SensorError::Kind::Fault, 7);
        src.emit_error(SensorError::Kind::Fault, 8);
        src.emit_error(SensorError::Kind::Fault, 7);
        src.emit_error(SensorError::Kind::Fault, 7);
        test_int("interleaved codes no notice", (long long)seen.size(), 0);

        src.emit_error(SensorError::Kind::Fault, 7);
        test_int("third repeat raises", (long long)seen.size(), 1);
        test_bool("notice active", s.notice().active, true);
        test_int("notice code", s.notice().code, 7);
        test_int("notice expiry", (long long)s.notice().expires_us, 5000000);

        src.emit_error(SensorError::Kind::Fault, 7);
        test_int("no duplicate while active", (long long)seen.size(), 1);

        q.advance_to(4999999);
        test_bool("still active before expiry", s.notice().active, true);
        q.advance_to(5000000);
        test_bool("expired", s.notice().active, false);
        test_int("expiry published", (long long)seen.size(), 2);

        for (int i=0; i<3; ++i) src.emit_error(SensorError::Kind::Fault, 9);
        test_bool("raised again", s.notice().active, true);
        s.dismiss_notice();
        test_bool("dismissed", s.notice().active, false);
        test_int("dismiss published", (long long)seen.size(), 4);
        q.advance_to(20000000);
        test_int("dismissed notice has no timer", (long long)seen.size(), 4);

        for (int i=0; i<3; ++i) src.emit_error(SensorError::Kind::Fault, 9);
        s.stop();
        test_bool("stop clears silently", s.notice().active, false);
        test_int("stop publishes nothing", (long long)seen.size(), 5);
    }

    // 9) clean data between faults breaks the streak
    {
        FakeSource src;
        TimerQueue q(0);
        MotionSampler s(SamplerConfig{}, src, q);
        s.set_sink([](const MotionSample&){});
        int seen = 0;
        s.notices().subscribe([&](const SensorNotice&){ seen++; });
        s.start(10.0f);

        src.emit_error(SensorError::Kind::Fault, 7);
        src.emit_error(SensorError::Kind::Fault, 7);
        src.emit(make_sample(1000, 1.0f));
        src.emit_error(SensorError::Kind::Fault, 7);
        test_int("streak reset by a good sample", seen, 0);

        src.emit_error(SensorError::Kind::Fault, 7);
        src.emit_error(SensorError::Kind::Fault, 7);
        test_int("back to back faults raise", seen, 1);
    }

    return fails ? 1 : 0;
}
