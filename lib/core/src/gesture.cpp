#include "gpc/gesture.hpp"
#include "gpc/logger.hpp"

namespace gpc {

GestureKind GestureDetector::update(int32_t accel_y, float dt_s){
    const uint64_t dt_us = dt_s > 0.0f ? uint64_t(double(dt_s) * 1e6 + 0.5) : 0;
    cooldown_us_ = (cooldown_us_ > dt_us) ? cooldown_us_ - dt_us : 0;
    if (cooldown_us_ > 0) return GestureKind::None;

    GestureKind g = GestureKind::None;
    if (accel_y > cfg_.start_threshold) g = GestureKind::StartGame;
    else if (accel_y < cfg_.restart_threshold) g = GestureKind::RestartGame;
    else return g;

    cooldown_us_ = cfg_.cooldown_s > 0.0f ? uint64_t(double(cfg_.cooldown_s) * 1e6 + 0.5) : 0;
    GPC_LOG_INFO("gesture", to_string(g) << " (accel_y=" << accel_y << ")");
    return g;
}

}   // namespace gpc
