#pragma once
#include <cstdint>
#include "gpc/config.hpp"
#include "gpc/errors.hpp"
#include "gpc/stats.hpp"
#include "gpc/types.hpp"

namespace gpc {

// three point sub sessions, None for zero point
enum class CalibrationPhase : uint8_t {
    None = 0,
    Neutral,
    Left,
    Right
};

const char* to_string(CalibrationPhase p);

struct CalibrationProfile {
    Vec3 offset {0,0,0};        //subtract from raw gyro
    CalibrationMode mode = CalibrationMode::ZeroPoint;

    //three point only
    bool has_points = false;
    Vec3 neutral {0,0,0}, left {0,0,0}, right {0,0,0};
    Vec3 sensitivity {0,0,0};   //(right-left)/2, reported, not applied

    Vec3 noise_var {0,0,0};     //sample variance of the buffered (neutral) samples
    int sample_count = 0;
};

// returned by every feed(), describes the session after the sample
struct CalibrationProgress {
    CalibrationStatus status = CalibrationStatus::Uncalibrated;
    CalibrationPhase phase = CalibrationPhase::None;
    const char* instruction = "";   //operator prompt for the current (sub) session
    bool settling = false;          //sample ignored, operator still moving into position
    bool sample_used = false;       //sample went into the buffer
    int collected = 0;
    int target = 0;
    int retries = 0;

    bool completed = false;         //session finished on this call
    bool failed = false;            //session failed on this call
    bool exhausted = false;         //failed and no retries left
    ErrorCode error = ErrorCode::None;
};

class Calibrator {
public:
    Calibrator();
    void init(const CalibConfig& cfg);

    void start_session(CalibrationMode mode);
    CalibrationProgress feed(const SensorSample& s);
    // ends the current (sub) session with what it has. in three point mode only the
    // running sub session is closed, the next one starts with its instruction
    CalibrationProgress force_finish();
    void reset();   //abandon session / pending retry, keep a finished profile
    void clear();   //reset() and drop the profile

    Vec3 calibrated(const Vec3& gyro) const;

    CalibrationStatus status() const {return status_;}
    bool has_profile() const {return has_profile_;}
    const CalibrationProfile& profile() const {return profile_;}
    bool session_active() const {return active_;}
    bool retry_pending() const {return pending_retry_;}
    int retries() const {return retries_;}
    CalibrationMode mode() const {return mode_;}
    CalibrationPhase phase() const {return phase_;}

private:
    CalibConfig cfg_{};
    CalibrationStatus status_ = CalibrationStatus::Uncalibrated;
    CalibrationProfile profile_{};
    bool has_profile_ = false;

    //session
    CalibrationMode mode_ = CalibrationMode::ZeroPoint;
    CalibrationPhase phase_ = CalibrationPhase::None;
    bool active_ = false;
    bool have_start_ = false;       //start time is taken from the first sample of a (sub) session
    uint64_t start_us_ = 0;
    uint64_t last_t_us_ = 0;
    AxisStats acc_;                 //samples accepted in the current (sub) session
    bool have_prev_ = false;
    Vec3 prev_ {0,0,0};
    Vec3 neutral_ {0,0,0}, left_ {0,0,0}, right_ {0,0,0};
    Vec3 neutral_var_ {0,0,0};
    int total_samples_ = 0;

    //retry
    bool pending_retry_ = false;
    bool exhausted_ = false;
    uint64_t fail_t_us_ = 0;
    int retries_ = 0;

    void begin_session_();
    void begin_phase_(CalibrationPhase p);
    int target_() const;
    bool accept_(const Vec3& g);
    void finish_(CalibrationProgress& p, uint64_t t_us);
    void advance_phase_(CalibrationProgress& p, uint64_t t_us);
    void complete_(CalibrationProgress& p);
    void fail_(CalibrationProgress& p, uint64_t t_us);
    CalibrationProgress progress_() const;
};

}   // namespace gpc
