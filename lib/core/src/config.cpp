#include "gpc/config.hpp"
#include <cmath>

namespace gpc {

namespace {

ConfigCheck fail(const char* field, const char* reason){
    ConfigCheck c;
    c.ok = false;
    c.field = field;
    c.reason = reason;
    return c;
}

bool positive(float v){ return std::isfinite(v) && v > 0.0f; }
bool non_negative(float v){ return std::isfinite(v) && v >= 0.0f; }
bool valid_axis(int a){ return a >= 0 && a <= 2; }

ConfigCheck check_calib(const CalibConfig& c){
    if (!positive(c.stability_threshold)) return fail("calibration.stability_threshold", "must be > 0");
    if (c.required_samples < 1)           return fail("calibration.required_samples", "must be >= 1");
    if (c.min_samples < 1)                return fail("calibration.min_samples", "must be >= 1");
    if (c.min_samples > c.required_samples)
        return fail("calibration.min_samples", "must not exceed required_samples");
    if (!positive(c.session_timeout_s))   return fail("calibration.session_timeout_s", "must be > 0");
    if (!non_negative(c.retry_delay_s))   return fail("calibration.retry_delay_s", "must be >= 0");
    if (c.max_retries < 0)                return fail("calibration.max_retries", "must be >= 0");
    if (c.point_samples < 2)              return fail("calibration.point_samples", "must be >= 2");
    if (!non_negative(c.settle_s))        return fail("calibration.settle_s", "must be >= 0");
    if (!positive(c.point_timeout_s))     return fail("calibration.point_timeout_s", "must be > 0");
    return ConfigCheck{};
}

ConfigCheck check_cond(const ConditionerConfig& c){
    if (!non_negative(c.dead_zone))       return fail("conditioner.dead_zone", "must be >= 0");
    if (!std::isfinite(c.smoothing_factor) || c.smoothing_factor <= 0.0f || c.smoothing_factor > 1.0f)
        return fail("conditioner.smoothing_factor", "must be in (0,1]");
    if (!positive(c.reference_rate_hz))   return fail("conditioner.reference_rate_hz", "must be > 0");
    if (!non_negative(c.weights.x) || !non_negative(c.weights.y) || !non_negative(c.weights.z))
        return fail("conditioner.weights", "must be >= 0");
    if (c.weights.x + c.weights.y + c.weights.z <= 0.0f)
        return fail("conditioner.weights", "sum must be > 0");
    if (!positive(c.idle_timeout_s))      return fail("conditioner.idle_timeout_s", "must be > 0");
    if (!non_negative(c.idle_follow_smoothing))
        return fail("conditioner.idle_follow_smoothing", "must be >= 0");
    if (!valid_axis(c.tilt_axis))         return fail("conditioner.tilt_axis", "must be 0, 1 or 2");
    if (!positive(c.accel_counts_per_g))  return fail("conditioner.accel_counts_per_g", "must be > 0");
    if (!positive(c.still_tilt_rate))     return fail("conditioner.still_tilt_rate", "must be > 0");
    return ConfigCheck{};
}

ConfigCheck check_cls(const ClassifierConfig& c){
    if (!valid_axis(c.turn_axis))         return fail("classifier.turn_axis", "must be 0, 1 or 2");
    if (!positive(c.idle_threshold))      return fail("classifier.idle_threshold", "must be > 0");
    if (!positive(c.idle_timeout_s))      return fail("classifier.idle_timeout_s", "must be > 0");
    if (!positive(c.turn_threshold))      return fail("classifier.turn_threshold", "must be > 0");
    if (!positive(c.turn_stability_s))    return fail("classifier.turn_stability_s", "must be > 0");
    if (!positive(c.stroke_threshold))    return fail("classifier.stroke_threshold", "must be > 0");
    if (!non_negative(c.stroke_cooldown_s)) return fail("classifier.stroke_cooldown_s", "must be >= 0");
    if (!positive(c.consecutive_window_s)) return fail("classifier.consecutive_window_s", "must be > 0");
    if (c.consecutive_strokes_for_turn < 2)
        return fail("classifier.consecutive_strokes_for_turn", "must be >= 2");
    if (!positive(c.alternating_window_s)) return fail("classifier.alternating_window_s", "must be > 0");
    if (c.min_alternating_strokes < 2)
        return fail("classifier.min_alternating_strokes", "must be >= 2");
    return ConfigCheck{};
}

ConfigCheck check_gesture(const GestureConfig& c){
    if (c.start_threshold <= 0)           return fail("gesture.start_threshold", "must be > 0");
    if (c.restart_threshold >= 0)         return fail("gesture.restart_threshold", "must be < 0");
    if (!non_negative(c.cooldown_s))      return fail("gesture.cooldown_s", "must be >= 0");
    return ConfigCheck{};
}

ConfigCheck check_gate(const GateConfig& c){
    if (!positive(c.max_gyro_abs))        return fail("gate.max_gyro_abs", "must be > 0");
    if (c.accel_y_min >= c.accel_y_max)   return fail("gate.accel_y_min", "must be < accel_y_max");
    return ConfigCheck{};
}

}   // namespace

ConfigCheck validate_config(const PipelineConfig& cfg){
    ConfigCheck c = check_calib(cfg.calib);
    if (!c.ok) return c;
    c = check_cond(cfg.cond);
    if (!c.ok) return c;
    c = check_cls(cfg.cls);
    if (!c.ok) return c;
    c = check_gesture(cfg.gesture);
    if (!c.ok) return c;
    return check_gate(cfg.gate);
}

}   // namespace gpc
