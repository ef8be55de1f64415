#include "gpc/sample_gate.hpp"
#include "gpc/logger.hpp"
#include <cmath>
#include <string>

namespace gpc {

const char* to_string(SampleError e){
    switch (e) {
        case SampleError::None:            return "None";
        case SampleError::NonFinite:       return "NonFinite";
        case SampleError::GyroOutOfRange:  return "GyroOutOfRange";
        case SampleError::AccelOutOfRange: return "AccelOutOfRange";
        case SampleError::NonMonotonic:    return "NonMonotonic";
        case SampleError::Malformed:       return "Malformed";
        default:                           return "Unknown";
    }
}

void SampleGate::reset(){
    stats_ = GateStats{};
    have_last_ = false;
    last_t_us_ = 0;
}

SampleError SampleGate::reject_(SampleError e, const SensorSample* s){
    const uint64_t n = ++stats_.by_reason[static_cast<int>(e)];
    stats_.rejected++;
    //first of each kind is a warning, the rest only show up with GPC_VERBOSE
    if (n == 1) {
        GPC_LOG_WARN("gate", "dropped sample (" << to_string(e) << ")"
                     << (s ? " t_us=" : "") << (s ? std::to_string(s->t_us) : std::string()));
    } else {
        GPC_LOG_DBG("gate", "dropped sample (" << to_string(e) << ") total=" << n);
    }
    return e;
}

SampleError SampleGate::check(const SensorSample& s){
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(s.gyro.axis(i))) return reject_(SampleError::NonFinite, &s);
    }
    for (int i = 0; i < 3; ++i) {
        if (std::fabs(s.gyro.axis(i)) > cfg_.max_gyro_abs) return reject_(SampleError::GyroOutOfRange, &s);
    }
    if (s.accel_y < cfg_.accel_y_min || s.accel_y > cfg_.accel_y_max)
        return reject_(SampleError::AccelOutOfRange, &s);
    if (have_last_ && s.t_us <= last_t_us_)
        return reject_(SampleError::NonMonotonic, &s);

    have_last_ = true;
    last_t_us_ = s.t_us;
    stats_.accepted++;
    return SampleError::None;
}

void SampleGate::report_malformed(){
    reject_(SampleError::Malformed, nullptr);
}

}   // namespace gpc
