// Core/Src/gpc_app_bridge.cpp
#include <gpc_app_bridge.h>
#include <cstdint>
#include <new>
#include "gpc/config.hpp"
#include "gpc/logger.hpp"
#include "gpc/pipeline.hpp"

namespace {

// forwards emitted events to the C callback
class CallbackSink : public gpc::EventSink {
public:
    CallbackSink(GpcEventFn fn, void* ctx) : fn_(fn), ctx_(ctx) {}
    void on_event(const gpc::ControlEvent& e) override {
        if (!fn_) return;
        GpcEvent ev{};
        ev.type       = static_cast<uint8_t>(e.type);
        ev.intensity  = e.intensity;
        ev.confidence = e.confidence;
        ev.t_us       = e.t_us;
        ev.seq        = e.seq;
        fn_(&ev, ctx_);
    }

private:
    GpcEventFn fn_;
    void* ctx_;
};

gpc::PipelineConfig to_pipeline_config(const GpcConfig& c){
    gpc::PipelineConfig cfg{};
    cfg.calib.mode = c.three_point ? gpc::CalibrationMode::ThreePoint : gpc::CalibrationMode::ZeroPoint;
    cfg.calib.required_samples    = c.required_samples;
    cfg.calib.stability_threshold = c.stability_threshold;
    cfg.calib.min_samples         = c.min_samples;

    cfg.cond.dead_zone        = c.dead_zone;
    cfg.cond.smoothing_factor = c.smoothing_factor;

    cfg.cls.idle_threshold          = c.idle_threshold;
    cfg.cls.idle_timeout_s          = c.idle_timeout_s;
    cfg.cond.idle_timeout_s         = c.idle_timeout_s;
    cfg.cls.turn_threshold          = c.turn_threshold;
    cfg.cls.turn_stability_s        = c.turn_stability_s;
    cfg.cls.stroke_threshold        = c.stroke_threshold;
    cfg.cls.stroke_cooldown_s       = c.stroke_cooldown_s;
    cfg.cls.alternating_window_s    = c.alternating_window_s;
    cfg.cls.min_alternating_strokes = c.min_alternating_strokes;

    cfg.gesture.start_threshold   = c.start_threshold;
    cfg.gesture.restart_threshold = c.restart_threshold;
    cfg.gesture.cooldown_s        = c.gesture_cooldown_s;
    return cfg;
}

}   // namespace

struct GpcApp {
    CallbackSink sink;
    gpc::Pipeline pipeline;
    GpcApp(GpcEventFn fn, void* ctx) : sink(fn, ctx), pipeline(&sink) {}
};

extern "C" {

void gpc_config_defaults(GpcConfig* c) {
    if (!c) return;
    const gpc::PipelineConfig d{};
    c->three_point             = d.calib.mode == gpc::CalibrationMode::ThreePoint ? 1 : 0;
    c->required_samples        = d.calib.required_samples;
    c->min_samples             = d.calib.min_samples;
    c->stability_threshold     = d.calib.stability_threshold;
    c->dead_zone               = d.cond.dead_zone;
    c->smoothing_factor        = d.cond.smoothing_factor;
    c->idle_threshold          = d.cls.idle_threshold;
    c->idle_timeout_s          = d.cls.idle_timeout_s;
    c->turn_threshold          = d.cls.turn_threshold;
    c->turn_stability_s        = d.cls.turn_stability_s;
    c->stroke_threshold        = d.cls.stroke_threshold;
    c->stroke_cooldown_s       = d.cls.stroke_cooldown_s;
    c->alternating_window_s    = d.cls.alternating_window_s;
    c->min_alternating_strokes = d.cls.min_alternating_strokes;
    c->start_threshold         = d.gesture.start_threshold;
    c->restart_threshold       = d.gesture.restart_threshold;
    c->gesture_cooldown_s      = d.gesture.cooldown_s;
}

GpcApp* gpc_app_create(const GpcConfig* cfg, GpcEventFn fn, void* ctx) {
    GpcConfig c{};
    gpc_config_defaults(&c);
    if (cfg) c = *cfg;

    GpcApp* app = new (std::nothrow) GpcApp(fn, ctx);
    if (!app) return nullptr;
    if (!app->pipeline.init(to_pipeline_config(c))) {
        GPC_LOG_WARN("bridge", "gpc_app_create: configuration rejected");
        delete app;
        return nullptr;
    }
    return app;
}

void gpc_app_destroy(GpcApp* app) {
    delete app;
}

int gpc_app_step(GpcApp* app, const GpcRawSample* s) {
    if (!app) return 0;
    if (!s) {
        app->pipeline.report_malformed();
        return 0;
    }
    gpc::SensorSample ss{};
    ss.gyro    = { s->gx, s->gy, s->gz };
    ss.accel_y = s->accel_y;
    ss.t_us    = s->t_us;
    return app->pipeline.update(ss).accepted ? 1 : 0;
}

void gpc_app_report_malformed(GpcApp* app) {
    if (app) app->pipeline.report_malformed();
}

void gpc_app_reset(GpcApp* app) {
    if (app) app->pipeline.request_reset();
}

void gpc_app_recalibrate(GpcApp* app, int three_point) {
    if (!app) return;
    app->pipeline.request_recalibration(three_point ? gpc::CalibrationMode::ThreePoint
                                                    : gpc::CalibrationMode::ZeroPoint);
}

int gpc_app_calibration_status(const GpcApp* app) {
    if (!app) return GPC_CAL_UNCALIBRATED;
    return static_cast<int>(app->pipeline.calibrator().status());
}

} // extern "C"
