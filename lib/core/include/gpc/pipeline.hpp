#pragma once
#include <atomic>
#include <cstdint>
#include "gpc/calibration.hpp"
#include "gpc/classifier.hpp"
#include "gpc/conditioner.hpp"
#include "gpc/config.hpp"
#include "gpc/emitter.hpp"
#include "gpc/gesture.hpp"
#include "gpc/sample_gate.hpp"
#include "gpc/types.hpp"

namespace gpc {

//returned for every sample handed to update()
struct PipelineOutputs {
    bool accepted = false;
    SampleError reject = SampleError::None;

    bool calibrating = false;           //sample went to the calibrator only
    CalibrationProgress calibration{};

    ConditionedSignal signal{};
    ClassifierOutput cls{};
    GestureKind gesture = GestureKind::None;
    int events_emitted = 0;
};

class Pipeline {
public:
    explicit Pipeline(EventSink* sink = nullptr) : emitter_(sink) {}
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    bool init(const PipelineConfig& cfg);   //false on an invalid config, samples are refused until a valid init
    PipelineOutputs update(const SensorSample& s);
    void report_malformed();                //upstream could not decode a frame
    void reset();

    //safe from another thread, applied at the start of the next update()
    void request_reset() {reset_req_.store(true, std::memory_order_release);}
    void request_recalibration(CalibrationMode mode);

    void set_sink(EventSink* sink) {emitter_.set_sink(sink);}
    bool ready() const {return ready_;}

    const PipelineConfig& config() const {return cfg_;}
    const SampleGate& gate() const {return gate_;}
    const Calibrator& calibrator() const {return calib_;}
    const SignalConditioner& conditioner() const {return cond_;}
    const PatternClassifier& classifier() const {return cls_;}
    const GestureDetector& gesture() const {return gesture_;}
    const EventEmitter& emitter() const {return emitter_;}

private:
    PipelineConfig cfg_{};
    bool ready_ = false;

    SampleGate gate_;
    Calibrator calib_;
    SignalConditioner cond_;
    PatternClassifier cls_;
    GestureDetector gesture_;
    EventEmitter emitter_;

    bool have_last_ = false;
    uint64_t last_t_us_ = 0;

    std::atomic<bool> reset_req_{false};
    std::atomic<bool> recal_req_{false};
    std::atomic<uint8_t> recal_mode_{0};

    void apply_requests_();
};

}   // namespace gpc
