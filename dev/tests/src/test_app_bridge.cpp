#include <gpc_app_bridge.h>
#include <cstdio>
#include <vector>

//C entry points: create/destroy, stepping, callback with user context, reset, recalibrate

static int g_fail = 0;

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}
static void test_int(const char* name, int got, int want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}

struct Collected {
    std::vector<GpcEvent> events;
};

static void on_event(const GpcEvent* ev, void* ctx){
    static_cast<Collected*>(ctx)->events.push_back(*ev);
}

static int count(const Collected& c, int type){
    int n = 0;
    for (const GpcEvent& e : c.events) if (e.type == type) n++;
    return n;
}

int main(){
    //invalid configuration -> no handle
    GpcConfig bad;
    gpc_config_defaults(&bad);
    bad.smoothing_factor = 0.0f;
    test_bool("invalid config rejected", gpc_app_create(&bad, on_event, nullptr) == nullptr, true);

    Collected got;
    GpcApp* app = gpc_app_create(nullptr, on_event, &got);
    test_bool("created with defaults", app != nullptr, true);
    if (!app) return 1;

    GpcRawSample s{};
    uint64_t t = 0;
    for (int i = 0; i < 100; ++i) {
        t += 10000;
        s.gx = (i % 2) ? 0.5f : -0.5f; s.gy = 0; s.gz = 0; s.accel_y = 0; s.t_us = t;
        gpc_app_step(app, &s);
    }
    test_int("calibrated", gpc_app_calibration_status(app), GPC_CAL_CALIBRATED);

    for (int i = 0; i < 250; ++i) {
        t += 10000;
        s.gx = 20.0f; s.t_us = t;
        gpc_app_step(app, &s);
    }
    test_int("paddle right via callback", count(got, GPC_EVT_PADDLE_RIGHT), 1);
    test_int("turn right via callback", count(got, GPC_EVT_TURN_RIGHT), 1);

    //same timestamp again is dropped
    test_int("duplicate not accepted", gpc_app_step(app, &s), 0);
    test_int("null sample not accepted", gpc_app_step(app, nullptr), 0);
    gpc_app_report_malformed(app);

    //reset is applied on the next step
    gpc_app_reset(app);
    t += 10000; s.t_us = t;
    test_int("step after reset", gpc_app_step(app, &s), 1);
    test_int("idle after reset", got.events.back().type, GPC_EVT_IDLE);
    test_int("calibrating after reset", gpc_app_calibration_status(app), GPC_CAL_CALIBRATING);

    gpc_app_recalibrate(app, 1);
    t += 10000; s.t_us = t;
    gpc_app_step(app, &s);
    test_int("recalibrating", gpc_app_calibration_status(app), GPC_CAL_CALIBRATING);

    bool increasing = true;
    for (size_t i = 1; i < got.events.size(); ++i)
        if (got.events[i].seq <= got.events[i-1].seq) increasing = false;
    test_bool("seq increasing", increasing, true);

    gpc_app_destroy(app);
    gpc_app_destroy(nullptr);
    test_int("null handle status", gpc_app_calibration_status(nullptr), GPC_CAL_UNCALIBRATED);

    return g_fail ? 1 : 0;
}
