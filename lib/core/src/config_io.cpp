#include "gpc/config_io.hpp"
#include "gpc/logger.hpp"

#include <yaml-cpp/yaml.h>

namespace gpc {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& value){
    const YAML::Node child = node[key];
    if (child) value = child.as<T>();
}

void read_mode(const YAML::Node& node, CalibrationMode& mode){
    const YAML::Node child = node["mode"];
    if (!child) return;
    const std::string s = child.as<std::string>();
    if (s == "zero_point") mode = CalibrationMode::ZeroPoint;
    else if (s == "three_point") mode = CalibrationMode::ThreePoint;
    else throw YAML::ParserException(child.Mark(), "calibration.mode must be zero_point or three_point");
}

void read_vec3(const YAML::Node& node, const char* key, Vec3& v){
    const YAML::Node child = node[key];
    if (!child) return;
    if (!child.IsSequence() || child.size() != 3)
        throw YAML::ParserException(child.Mark(), std::string(key) + " must be a list of 3 numbers");
    v = {child[0].as<float>(), child[1].as<float>(), child[2].as<float>()};
}

void parse(const YAML::Node& root, PipelineConfig& cfg){
    read(root, "auto_calibrate", cfg.auto_calibrate);

    if (const YAML::Node c = root["calibration"]) {
        read_mode(c, cfg.calib.mode);
        read(c, "stability_threshold", cfg.calib.stability_threshold);
        read(c, "required_samples", cfg.calib.required_samples);
        read(c, "min_samples", cfg.calib.min_samples);
        read(c, "session_timeout_s", cfg.calib.session_timeout_s);
        read(c, "retry_delay_s", cfg.calib.retry_delay_s);
        read(c, "max_retries", cfg.calib.max_retries);
        read(c, "point_samples", cfg.calib.point_samples);
        read(c, "settle_s", cfg.calib.settle_s);
        read(c, "point_timeout_s", cfg.calib.point_timeout_s);
    }
    if (const YAML::Node c = root["conditioner"]) {
        read(c, "dead_zone", cfg.cond.dead_zone);
        read(c, "smoothing_factor", cfg.cond.smoothing_factor);
        read(c, "time_scaled_smoothing", cfg.cond.time_scaled_smoothing);
        read(c, "reference_rate_hz", cfg.cond.reference_rate_hz);
        read_vec3(c, "weights", cfg.cond.weights);
        read(c, "drift_correction", cfg.cond.drift_correction);
        read(c, "idle_timeout_s", cfg.cond.idle_timeout_s);
        read(c, "idle_follow_smoothing", cfg.cond.idle_follow_smoothing);
        read(c, "tilt_axis", cfg.cond.tilt_axis);
        read(c, "accel_counts_per_g", cfg.cond.accel_counts_per_g);
        read(c, "still_tilt_rate", cfg.cond.still_tilt_rate);
    }
    if (const YAML::Node c = root["classifier"]) {
        read(c, "turn_axis", cfg.cls.turn_axis);
        read(c, "invert_direction", cfg.cls.invert_direction);
        read(c, "idle_threshold", cfg.cls.idle_threshold);
        read(c, "idle_timeout_s", cfg.cls.idle_timeout_s);
        read(c, "sustained_idle", cfg.cls.sustained_idle);
        read(c, "turn_threshold", cfg.cls.turn_threshold);
        read(c, "turn_stability_s", cfg.cls.turn_stability_s);
        read(c, "stroke_threshold", cfg.cls.stroke_threshold);
        read(c, "stroke_cooldown_s", cfg.cls.stroke_cooldown_s);
        read(c, "consecutive_window_s", cfg.cls.consecutive_window_s);
        read(c, "consecutive_strokes_for_turn", cfg.cls.consecutive_strokes_for_turn);
        read(c, "alternating_window_s", cfg.cls.alternating_window_s);
        read(c, "min_alternating_strokes", cfg.cls.min_alternating_strokes);
    }
    if (const YAML::Node c = root["gesture"]) {
        read(c, "start_threshold", cfg.gesture.start_threshold);
        read(c, "restart_threshold", cfg.gesture.restart_threshold);
        read(c, "cooldown_s", cfg.gesture.cooldown_s);
    }
    if (const YAML::Node c = root["gate"]) {
        read(c, "max_gyro_abs", cfg.gate.max_gyro_abs);
        read(c, "accel_y_min", cfg.gate.accel_y_min);
        read(c, "accel_y_max", cfg.gate.accel_y_max);
    }
}

bool finish(const PipelineConfig& parsed, PipelineConfig& out, std::string* err){
    const ConfigCheck check = validate_config(parsed);
    if (!check.ok) {
        if (err) *err = check.field + ": " + check.reason;
        return false;
    }
    out = parsed;
    return true;
}

}   // namespace

bool load_config_file(const std::string& path, PipelineConfig& out, std::string* err){
    PipelineConfig cfg = out;
    try {
        const YAML::Node root = YAML::LoadFile(path);
        if (!root.IsNull()) parse(root, cfg);
    } catch (const YAML::Exception& e) {
        if (err) *err = path + ": " + e.what();
        GPC_LOG_WARN("config", "cannot load " << path << ": " << e.what());
        return false;
    }
    return finish(cfg, out, err);
}

bool load_config_string(const std::string& yaml, PipelineConfig& out, std::string* err){
    PipelineConfig cfg = out;
    try {
        const YAML::Node root = YAML::Load(yaml);
        if (!root.IsNull()) parse(root, cfg);
    } catch (const YAML::Exception& e) {
        if (err) *err = e.what();
        return false;
    }
    return finish(cfg, out, err);
}

}   // namespace gpc
