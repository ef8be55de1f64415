#pragma once
#include <cstdint>
#include <string>
#include "gpc/types.hpp"

namespace gpc {

struct CalibConfig {
    CalibrationMode mode = CalibrationMode::ZeroPoint;
    float stability_threshold = 3.0f;   // |gyro| must stay below this to be buffered
    int required_samples = 50;          // zero point: done once this many stable samples are in
    int min_samples = 15;               // zero point: minimum accepted at timeout
    float session_timeout_s = 3.0f;

    float retry_delay_s = 1.0f;         // Failed -> new session after this delay
    int max_retries = 3;

    //three point
    int point_samples = 30;             // per sub session, half of it is the minimum
    float settle_s = 2.0f;              // ignore samples after each instruction
    float point_timeout_s = 4.0f;
};

struct ConditionerConfig {
    float dead_zone = 0.5f;
    float smoothing_factor = 0.3f;          // (0,1]
    bool time_scaled_smoothing = false;
    float reference_rate_hz = 60.0f;        // rate the smoothing factor was tuned at
    Vec3 weights {1.0f, 1.0f, 1.0f};        // combined = sum w_i*|s_i|

    //idle drift correction from the accel axis
    bool drift_correction = true;
    float idle_timeout_s = 2.0f;
    float idle_follow_smoothing = 5.0f;     // per second
    int tilt_axis = 0;
    float accel_counts_per_g = 16384.0f;
    float still_tilt_rate = 5.0f;           // deg/s, faster accel tilt restarts the idle timer
};

struct ClassifierConfig {
    int turn_axis = 0;                  // axis used for turns and strokes
    bool invert_direction = false;      // false: positive axis value = Right

    float idle_threshold = 5.0f;        // combined movement below this is the dead zone
    float idle_timeout_s = 2.0f;
    bool sustained_idle = true;         // require idle_timeout_s of quiet before forcing Idle

    float turn_threshold = 15.0f;
    float turn_stability_s = 2.0f;

    float stroke_threshold = 15.0f;
    float stroke_cooldown_s = 0.5f;
    float consecutive_window_s = 1.5f;
    int consecutive_strokes_for_turn = 2;

    float alternating_window_s = 1.5f;
    int min_alternating_strokes = 3;
};

struct GestureConfig {
    int32_t start_threshold = 8000;     // accel_y above -> StartGame
    int32_t restart_threshold = -8000;  // accel_y below -> RestartGame
    float cooldown_s = 2.0f;
};

struct GateConfig {
    float max_gyro_abs = 2000.0f;
    int32_t accel_y_min = -32768;
    int32_t accel_y_max = 32767;
};

struct PipelineConfig {
    CalibConfig calib{};
    ConditionerConfig cond{};
    ClassifierConfig cls{};
    GestureConfig gesture{};
    GateConfig gate{};
    bool auto_calibrate = true;         // start a session on the first sample when uncalibrated
};

// result of validate_config, field names match the yaml keys
struct ConfigCheck {
    bool ok = true;
    std::string field;
    std::string reason;
};

ConfigCheck validate_config(const PipelineConfig& cfg);

}   // namespace gpc
