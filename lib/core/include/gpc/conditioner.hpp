#pragma once
#include <cstdint>
#include "gpc/config.hpp"
#include "gpc/types.hpp"

namespace gpc {

struct ConditionedSignal {
    Vec3 smoothed {0,0,0};
    Vec3 raw {0,0,0};           //calibrated input as received
    float combined = 0.0f;      //sum w_i*|smoothed_i|
};

// deadzone -> smoothing -> idle drift correction, one call per tick
class SignalConditioner {
public:
    explicit SignalConditioner(const ConditionerConfig& cfg = ConditionerConfig{}) : cfg_(cfg) {}
    void init(const ConditionerConfig& cfg) { cfg_ = cfg; reset(); }
    void reset();

    ConditionedSignal condition(const Vec3& calibrated, bool idle, float dt_s, int32_t accel_y);

    const ConditionedSignal& last() const {return out_;}
    const Vec3& drift() const {return drift_;}
    float idle_time_s() const {return idle_s_;}
    float tilt_rate() const {return tilt_rate_;}
    float alpha(float dt_s) const;

    // tilt angle (deg) the accel axis reports, its smoothed rate is the idle reference
    static float tilt_deg(int32_t accel_y, float counts_per_g);

private:
    ConditionerConfig cfg_;
    ConditionedSignal out_{};
    Vec3 drift_ {0,0,0};
    float idle_s_ = 0.0f;
    bool have_tilt_ = false;
    float prev_tilt_ = 0.0f;
    float tilt_rate_ = 0.0f;
};

}   // namespace gpc
