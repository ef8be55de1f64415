#pragma once
#include <cstdint>
#include "gpc/config.hpp"
#include "gpc/types.hpp"

namespace gpc {

// accel spike -> StartGame / RestartGame, both share one cooldown
class GestureDetector {
public:
    explicit GestureDetector(const GestureConfig& cfg = GestureConfig{}) : cfg_(cfg) {}
    void init(const GestureConfig& cfg) { cfg_ = cfg; reset(); }
    void reset() { cooldown_us_ = 0; }

    GestureKind update(int32_t accel_y, float dt_s);

    float cooldown_s() const {return float(double(cooldown_us_) * 1e-6);}

private:
    GestureConfig cfg_;
    uint64_t cooldown_us_ = 0;
};

}   // namespace gpc
