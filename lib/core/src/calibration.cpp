#include "gpc/calibration.hpp"
#include "gpc/logger.hpp"
#include <algorithm>
#include <cmath>

namespace gpc {

const char* to_string(CalibrationPhase p){
    switch (p) {
        case CalibrationPhase::None:    return "None";
        case CalibrationPhase::Neutral: return "Neutral";
        case CalibrationPhase::Left:    return "Left";
        case CalibrationPhase::Right:   return "Right";
        default:                        return "?";
    }
}

namespace {

const char* instruction_for(CalibrationMode mode, CalibrationPhase p){
    if (mode == CalibrationMode::ZeroPoint) return "hold the paddle still";
    switch (p) {
        case CalibrationPhase::Neutral: return "hold the paddle level and still";
        case CalibrationPhase::Left:    return "tilt the paddle to the left and hold it";
        case CalibrationPhase::Right:   return "tilt the paddle to the right and hold it";
        default:                        return "";
    }
}

}   // namespace

Calibrator::Calibrator() {
    init(CalibConfig{});
}

void Calibrator::init(const CalibConfig& cfg){
    cfg_ = cfg;
    mode_ = cfg_.mode;
    clear();
}

void Calibrator::reset(){
    active_ = false;
    pending_retry_ = false;
    exhausted_ = false;
    retries_ = 0;
    phase_ = CalibrationPhase::None;
    have_start_ = false;
    have_prev_ = false;
    acc_.reset();
    total_samples_ = 0;
    status_ = has_profile_ ? CalibrationStatus::Calibrated : CalibrationStatus::Uncalibrated;
}

void Calibrator::clear(){
    has_profile_ = false;
    profile_ = CalibrationProfile{};
    reset();
}

void Calibrator::start_session(CalibrationMode mode){
    mode_ = mode;
    retries_ = 0;
    exhausted_ = false;
    pending_retry_ = false;
    begin_session_();
    GPC_LOG_INFO("calib", "session started (" << to_string(mode_) << ")");
}

void Calibrator::begin_session_(){
    active_ = true;
    status_ = CalibrationStatus::Calibrating;
    total_samples_ = 0;
    begin_phase_(mode_ == CalibrationMode::ThreePoint ? CalibrationPhase::Neutral : CalibrationPhase::None);
}

void Calibrator::begin_phase_(CalibrationPhase p){
    phase_ = p;
    have_start_ = false;
    have_prev_ = false;
    acc_.reset();
    if (p != CalibrationPhase::None) {
        GPC_LOG_INFO("calib", to_string(p) << ": " << instruction_for(mode_, p));
    }
}

int Calibrator::target_() const {
    return mode_ == CalibrationMode::ThreePoint ? cfg_.point_samples : cfg_.required_samples;
}

Vec3 Calibrator::calibrated(const Vec3& gyro) const {
    return has_profile_ ? gyro - profile_.offset : gyro;
}

CalibrationProgress Calibrator::progress_() const {
    CalibrationProgress p;
    p.status = status_;
    p.phase = phase_;
    p.instruction = active_ ? instruction_for(mode_, phase_) : "";
    p.collected = active_ ? acc_.size() : 0;
    p.target = target_();
    p.retries = retries_;
    p.exhausted = exhausted_;
    if (status_ == CalibrationStatus::Failed) p.error = ErrorCode::CalibrationTimeout;
    return p;
}

// stability: zero point and neutral go by magnitude, the tilted points by sample to sample change
bool Calibrator::accept_(const Vec3& g){
    if (phase_ == CalibrationPhase::Left || phase_ == CalibrationPhase::Right) {
        const bool ok = have_prev_ && (g - prev_).magnitude() < cfg_.stability_threshold;
        prev_ = g;
        have_prev_ = true;
        return ok;
    }
    return g.magnitude() < cfg_.stability_threshold;
}

CalibrationProgress Calibrator::feed(const SensorSample& s){
    last_t_us_ = s.t_us;

    if (!active_) {
        if (pending_retry_ && seconds_between(fail_t_us_, s.t_us) >= cfg_.retry_delay_s) {
            pending_retry_ = false;
            retries_++;
            GPC_LOG_INFO("calib", "retry " << retries_ << "/" << cfg_.max_retries);
            begin_session_();
        } else {
            return progress_();
        }
    }

    if (!have_start_) {
        have_start_ = true;
        start_us_ = s.t_us;
    }
    const float elapsed = seconds_between(start_us_, s.t_us);

    CalibrationProgress p;
    if (mode_ == CalibrationMode::ThreePoint) {
        if (elapsed < cfg_.settle_s) {
            p = progress_();
            p.settling = true;
            return p;
        }
        const bool used = accept_(s.gyro);
        if (used) acc_.push(s.gyro);
        p = progress_();
        p.sample_used = used;
        if (acc_.size() >= cfg_.point_samples || elapsed - cfg_.settle_s >= cfg_.point_timeout_s)
            advance_phase_(p, s.t_us);
        return p;
    }

    const bool used = accept_(s.gyro);
    if (used) {
        acc_.push(s.gyro);
    } else {
        GPC_LOG_DBG("calib", "rejected |g|=" << s.gyro.magnitude());
    }
    p = progress_();
    p.sample_used = used;
    if (acc_.size() >= cfg_.required_samples || elapsed >= cfg_.session_timeout_s)
        finish_(p, s.t_us);
    return p;
}

CalibrationProgress Calibrator::force_finish(){
    CalibrationProgress p = progress_();
    if (active_) finish_(p, last_t_us_);
    return p;
}

void Calibrator::finish_(CalibrationProgress& p, uint64_t t_us){
    if (mode_ == CalibrationMode::ThreePoint) {
        advance_phase_(p, t_us);
        return;
    }
    if (acc_.size() >= cfg_.min_samples) {
        neutral_ = acc_.mean();
        neutral_var_ = acc_.var();
        total_samples_ = acc_.size();
        complete_(p);
    } else {
        fail_(p, t_us);
    }
}

// a sub session with fewer than half its samples fails the whole session
void Calibrator::advance_phase_(CalibrationProgress& p, uint64_t t_us){
    if (acc_.size() < cfg_.point_samples / 2) {
        fail_(p, t_us);
        return;
    }
    total_samples_ += acc_.size();
    switch (phase_) {
        case CalibrationPhase::Neutral:
            neutral_ = acc_.mean();
            neutral_var_ = acc_.var();
            begin_phase_(CalibrationPhase::Left);
            break;
        case CalibrationPhase::Left:
            left_ = acc_.mean();
            begin_phase_(CalibrationPhase::Right);
            break;
        default:
            right_ = acc_.mean();
            complete_(p);
            return;
    }
    p.phase = phase_;
    p.instruction = instruction_for(mode_, phase_);
    p.collected = 0;
}

void Calibrator::complete_(CalibrationProgress& p){
    CalibrationProfile prof;
    prof.mode = mode_;
    prof.offset = neutral_;
    prof.noise_var = neutral_var_;
    prof.sample_count = total_samples_;
    if (mode_ == CalibrationMode::ThreePoint) {
        prof.has_points = true;
        prof.neutral = neutral_;
        prof.left = left_;
        prof.right = right_;
        prof.sensitivity = ((right_ - neutral_) - (left_ - neutral_)) / 2.0f;
    }
    profile_ = prof;
    has_profile_ = true;

    active_ = false;
    phase_ = CalibrationPhase::None;
    status_ = CalibrationStatus::Calibrated;
    acc_.reset();

    GPC_LOG_INFO("calib", "done (" << to_string(mode_) << ", " << prof.sample_count << " samples) offset="
                 << prof.offset.x << "," << prof.offset.y << "," << prof.offset.z);

    p.status = status_;
    p.phase = phase_;
    p.instruction = "";
    p.completed = true;
    p.error = ErrorCode::None;
}

void Calibrator::fail_(CalibrationProgress& p, uint64_t t_us){
    const int got = acc_.size();
    active_ = false;
    status_ = CalibrationStatus::Failed;
    acc_.reset();

    if (retries_ < cfg_.max_retries) {
        pending_retry_ = true;
        fail_t_us_ = t_us;
        GPC_LOG_WARN("calib", "failed in " << to_string(phase_) << " with " << got << " samples, retrying in "
                     << cfg_.retry_delay_s << " s");
    } else {
        exhausted_ = true;
        GPC_LOG_WARN("calib", "failed with " << got << " samples, no retries left");
    }
    phase_ = CalibrationPhase::None;

    p.status = status_;
    p.phase = phase_;
    p.instruction = "";
    p.failed = true;
    p.exhausted = exhausted_;
    p.error = ErrorCode::CalibrationTimeout;
}

}   // namespace gpc
