#include "gpc/conditioner.hpp"
#include "gpc/logger.hpp"
#include <algorithm>
#include <cmath>

namespace gpc {

namespace {

inline float lerp(float a, float b, float t) {return a + (b - a) * t;}

inline float dead(float v, float dz) {return (std::fabs(v) < dz) ? 0.0f : v;}

constexpr float kRadToDeg = 57.29577951308232f;

}   // namespace

void SignalConditioner::reset(){
    out_ = ConditionedSignal{};
    drift_ = {0,0,0};
    idle_s_ = 0.0f;
    have_tilt_ = false;
    prev_tilt_ = 0.0f;
    tilt_rate_ = 0.0f;
}

float SignalConditioner::tilt_deg(int32_t accel_y, float counts_per_g){
    const float r = std::max(-1.0f, std::min(1.0f, float(accel_y) / counts_per_g));
    return std::asin(r) * kRadToDeg;
}

// fixed mode returns the factor as is, time scaled mode gives the same settling time at any rate
float SignalConditioner::alpha(float dt_s) const {
    const float a = cfg_.smoothing_factor;
    if (!cfg_.time_scaled_smoothing || dt_s <= 0.0f) return a;
    return 1.0f - std::pow(1.0f - a, dt_s * cfg_.reference_rate_hz);
}

ConditionedSignal SignalConditioner::condition(const Vec3& calibrated, bool idle, float dt_s, int32_t accel_y){
    out_.raw = calibrated;

    const Vec3 in = calibrated - drift_;
    const float a = alpha(dt_s);
    for (int i = 0; i < 3; ++i) {
        const float x = dead(in.axis(i), cfg_.dead_zone);
        out_.smoothed.set_axis(i, lerp(out_.smoothed.axis(i), x, a));
    }

    //accel tilt rate (deg/s) is the reference for the gyro axis, 0 for a still sensor at any tilt
    const float tilt = tilt_deg(accel_y, cfg_.accel_counts_per_g);
    const float rate = (have_tilt_ && dt_s > 0.0f) ? (tilt - prev_tilt_) / dt_s : 0.0f;
    prev_tilt_ = tilt;
    have_tilt_ = true;
    tilt_rate_ = lerp(tilt_rate_, rate, a);

    //idle hold timer, grows while the classifier is quiet and the accel axis is steady
    const bool steady = std::fabs(tilt_rate_) < cfg_.still_tilt_rate;
    if (idle && steady) idle_s_ += std::max(0.0f, dt_s);
    else idle_s_ = 0.0f;

    if (cfg_.drift_correction && idle_s_ > cfg_.idle_timeout_s) {
        const int ax = cfg_.tilt_axis;
        const float err = out_.smoothed.axis(ax) - tilt_rate_;
        const float k = std::min(1.0f, cfg_.idle_follow_smoothing * std::max(0.0f, dt_s));
        drift_.set_axis(ax, drift_.axis(ax) + err * k);
        out_.smoothed.set_axis(ax, out_.smoothed.axis(ax) - err * k);
        GPC_LOG_DBG("cond", "drift axis " << ax << " -> " << drift_.axis(ax));
    }

    out_.combined = cfg_.weights.x * std::fabs(out_.smoothed.x)
                  + cfg_.weights.y * std::fabs(out_.smoothed.y)
                  + cfg_.weights.z * std::fabs(out_.smoothed.z);
    return out_;
}

}   // namespace gpc
