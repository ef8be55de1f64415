#include "gpc/config.hpp"
#include "gpc/sample_gate.hpp"
#include "gpc/types.hpp"
#include <cstdio>
#include <limits>

using namespace gpc;

//boundary rejects and counters

static int g_fail = 0;

static void test_int(const char* name, int got, int want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

static SensorSample make(uint64_t t, float gx, int32_t ay = 0){
    SensorSample s{};
    s.gyro = {gx, 0, 0};
    s.accel_y = ay;
    s.t_us = t;
    return s;
}

int main(){
    GateConfig cfg{};
    cfg.max_gyro_abs = 500.0f;
    cfg.accel_y_min = -20000;
    cfg.accel_y_max = 20000;
    SampleGate gate(cfg);

    test_int("ok", int(gate.check(make(100, 1.0f))), int(SampleError::None));
    test_int("nan", int(gate.check(make(200, std::numeric_limits<float>::quiet_NaN()))), int(SampleError::NonFinite));
    test_int("inf", int(gate.check(make(200, std::numeric_limits<float>::infinity()))), int(SampleError::NonFinite));
    test_int("gyro range", int(gate.check(make(200, 600.0f))), int(SampleError::GyroOutOfRange));
    test_int("accel range", int(gate.check(make(200, 0.0f, 25000))), int(SampleError::AccelOutOfRange));
    test_int("same timestamp", int(gate.check(make(100, 0.0f))), int(SampleError::NonMonotonic));
    test_int("older timestamp", int(gate.check(make(50, 0.0f))), int(SampleError::NonMonotonic));
    //a rejected sample does not move the time reference
    test_int("ok after rejects", int(gate.check(make(101, 0.0f))), int(SampleError::None));
    gate.report_malformed();

    const GateStats& st = gate.stats();
    test_int("accepted", int(st.accepted), 2);
    test_int("rejected", int(st.rejected), 7);
    test_int("nonfinite count", int(st.count(SampleError::NonFinite)), 2);
    test_int("nonmonotonic count", int(st.count(SampleError::NonMonotonic)), 2);
    test_int("malformed count", int(st.count(SampleError::Malformed)), 1);
    test_int("last t", int(gate.last_t_us()), 101);

    gate.reset();
    test_int("reset counters", int(gate.stats().rejected), 0);
    test_int("reset time reference", int(gate.check(make(1, 0.0f))), int(SampleError::None));

    return g_fail ? 1 : 0;
}
