#pragma once
#include <cstdint>
#include "gpc/types.hpp"

namespace gpc {

// downstream controller, injected into the emitter
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const ControlEvent& e) = 0;
};

// turns classifier/gesture output into sequence numbered control events
class EventEmitter {
public:
    explicit EventEmitter(EventSink* sink = nullptr) : sink_(sink) {}
    void set_sink(EventSink* sink) {sink_ = sink;}
    void reset();   //counters and last state, seq keeps counting

    void stroke(const MovementEvent& m);
    void gesture(GestureKind g, uint64_t t_us);
    bool state(MotionState s, float confidence, uint64_t t_us);     //true if emitted
    bool resync_idle(uint64_t t_us);

    MotionState last_state() const {return last_state_;}
    uint64_t count(ControlEventType t) const {return counts_[static_cast<int>(t)];}
    uint64_t total() const {return seq_;}

private:
    EventSink* sink_ = nullptr;
    MotionState last_state_ = MotionState::Idle;
    uint64_t seq_ = 0;
    uint64_t counts_[static_cast<int>(ControlEventType::Count)] = {};

    void emit_(ControlEventType type, float intensity, float confidence, uint64_t t_us);
};

ControlEventType event_for(MotionState s);

}   // namespace gpc
