#pragma once
#include <string>
#include "gpc/config.hpp"

namespace gpc {

// yaml layout (all keys optional, defaults come from PipelineConfig):
//   auto_calibrate: true
//   calibration: { mode: zero_point|three_point, stability_threshold, required_samples, ... }
//   conditioner: { dead_zone, smoothing_factor, weights: [1,1,1], ... }
//   classifier:  { turn_threshold, turn_stability_s, ... }
//   gesture:     { start_threshold, restart_threshold, cooldown_s }
//   gate:        { max_gyro_abs, accel_y_min, accel_y_max }
// both loaders validate the result, err gets "field: reason" on failure
bool load_config_file(const std::string& path, PipelineConfig& out, std::string* err);
bool load_config_string(const std::string& yaml, PipelineConfig& out, std::string* err);

}   // namespace gpc
