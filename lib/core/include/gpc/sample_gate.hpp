#pragma once
#include <cstdint>
#include "gpc/config.hpp"
#include "gpc/types.hpp"

namespace gpc {

enum class SampleError : uint8_t {
    None = 0,
    NonFinite,
    GyroOutOfRange,
    AccelOutOfRange,
    NonMonotonic,
    Malformed,          // reported by whoever decodes the raw frame
    Count
};

const char* to_string(SampleError e);

struct GateStats {
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t by_reason[static_cast<int>(SampleError::Count)] = {};

    uint64_t count(SampleError e) const { return by_reason[static_cast<int>(e)]; }
};

// boundary check, anything rejected here never reaches calibrator/classifier state
class SampleGate {
public:
    explicit SampleGate(const GateConfig& cfg = GateConfig{}) : cfg_(cfg) {}
    void init(const GateConfig& cfg) { cfg_ = cfg; reset(); }
    void reset();

    SampleError check(const SensorSample& s);
    void report_malformed();

    const GateStats& stats() const { return stats_; }
    uint64_t last_t_us() const { return last_t_us_; }

private:
    GateConfig cfg_;
    GateStats stats_{};
    bool have_last_ = false;
    uint64_t last_t_us_ = 0;

    SampleError reject_(SampleError e, const SensorSample* s);
};

}   // namespace gpc
