#include "gpc/pipeline.hpp"
#include "gpc/logger.hpp"

namespace gpc {

bool Pipeline::init(const PipelineConfig& cfg){
    const ConfigCheck check = validate_config(cfg);
    if (!check.ok) {
        GPC_LOG_WARN("pipeline", "invalid config, " << check.field << ": " << check.reason);
        ready_ = false;
        return false;
    }
    cfg_ = cfg;
    gate_.init(cfg_.gate);
    calib_.init(cfg_.calib);
    cond_.init(cfg_.cond);
    cls_.init(cfg_.cls);
    gesture_.init(cfg_.gesture);
    emitter_.reset();
    have_last_ = false;
    last_t_us_ = 0;
    reset_req_.store(false);
    recal_req_.store(false);
    ready_ = true;
    return true;
}

void Pipeline::request_recalibration(CalibrationMode mode){
    recal_mode_.store(static_cast<uint8_t>(mode), std::memory_order_relaxed);
    recal_req_.store(true, std::memory_order_release);
}

// full clear: profile dropped, every stage back to its initial state.
// the controller gets an Idle if it was last told anything else
void Pipeline::reset(){
    calib_.clear();
    cond_.reset();
    cls_.reset();
    gesture_.reset();
    have_last_ = false;
    emitter_.resync_idle(last_t_us_);
}

void Pipeline::report_malformed(){
    gate_.report_malformed();
}

void Pipeline::apply_requests_(){
    if (reset_req_.exchange(false, std::memory_order_acq_rel)) {
        GPC_LOG_INFO("pipeline", "reset requested");
        reset();
    }
    if (recal_req_.exchange(false, std::memory_order_acq_rel)) {
        const CalibrationMode mode = static_cast<CalibrationMode>(recal_mode_.load(std::memory_order_relaxed));
        cond_.reset();
        cls_.reset();
        emitter_.resync_idle(last_t_us_);
        calib_.start_session(mode);
    }
}

PipelineOutputs Pipeline::update(const SensorSample& s){
    PipelineOutputs out{};
    if (!ready_) return out;
    const uint64_t seq_before = emitter_.total();

    //1) pending requests from other threads
    apply_requests_();

    //2) boundary check
    out.reject = gate_.check(s);
    if (out.reject != SampleError::None) {
        out.events_emitted = int(emitter_.total() - seq_before);
        return out;
    }
    out.accepted = true;

    //3) tick duration from sample time
    const float dt_s = have_last_ ? seconds_between(last_t_us_, s.t_us) : 0.0f;
    have_last_ = true;
    last_t_us_ = s.t_us;

    //4) calibration, nothing downstream runs until there is a profile
    if (cfg_.auto_calibrate && calib_.status() == CalibrationStatus::Uncalibrated && !calib_.session_active())
        calib_.start_session(cfg_.calib.mode);
    if (calib_.status() != CalibrationStatus::Calibrated) {
        out.calibrating = true;
        out.calibration = calib_.feed(s);
        out.events_emitted = int(emitter_.total() - seq_before);
        return out;
    }
    out.calibration.status = calib_.status();
    out.calibration.retries = calib_.retries();

    const Vec3 gyro = calib_.calibrated(s.gyro);
    const bool was_quiet = cls_.quiet();

    //5) gestures win the tick, the classifier only ages its timers
    out.gesture = gesture_.update(s.accel_y, dt_s);
    if (out.gesture != GestureKind::None) {
        emitter_.gesture(out.gesture, s.t_us);
        out.signal = cond_.condition(gyro, was_quiet, dt_s, s.accel_y);
        cls_.skip(dt_s);
        out.cls.state = cls_.state();
        out.cls.confidence = cls_.confidence();
        out.events_emitted = int(emitter_.total() - seq_before);
        return out;
    }

    //6) condition + classify, stroke goes out before the state change
    out.signal = cond_.condition(gyro, was_quiet, dt_s, s.accel_y);
    out.cls = cls_.update(out.signal, s.t_us, dt_s);
    if (out.cls.has_stroke) emitter_.stroke(out.cls.stroke);
    emitter_.state(out.cls.state, out.cls.confidence, s.t_us);

    out.events_emitted = int(emitter_.total() - seq_before);
    return out;
}

}   // namespace gpc
