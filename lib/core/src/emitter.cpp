#include "gpc/emitter.hpp"
#include "gpc/logger.hpp"

namespace gpc {

ControlEventType event_for(MotionState s){
    switch (s) {
        case MotionState::Forward:   return ControlEventType::Forward;
        case MotionState::TurnLeft:  return ControlEventType::TurnLeft;
        case MotionState::TurnRight: return ControlEventType::TurnRight;
        default:                     return ControlEventType::Idle;
    }
}

void EventEmitter::reset(){
    last_state_ = MotionState::Idle;
    for (uint64_t& c : counts_) c = 0;
}

void EventEmitter::emit_(ControlEventType type, float intensity, float confidence, uint64_t t_us){
    ControlEvent e;
    e.type = type;
    e.intensity = intensity;
    e.confidence = confidence;
    e.t_us = t_us;
    e.seq = ++seq_;
    counts_[static_cast<int>(type)]++;
    GPC_LOG_DBG("emit", "#" << e.seq << " " << to_string(type));
    if (sink_) sink_->on_event(e);
}

void EventEmitter::stroke(const MovementEvent& m){
    emit_(m.direction == Direction::Right ? ControlEventType::PaddleRight : ControlEventType::PaddleLeft,
          m.intensity, 1.0f, m.t_us);
}

void EventEmitter::gesture(GestureKind g, uint64_t t_us){
    if (g == GestureKind::StartGame) emit_(ControlEventType::StartGame, 1.0f, 1.0f, t_us);
    else if (g == GestureKind::RestartGame) emit_(ControlEventType::RestartGame, 1.0f, 1.0f, t_us);
}

// only transitions go out, startup Idle is never announced
bool EventEmitter::state(MotionState s, float confidence, uint64_t t_us){
    if (s == last_state_) return false;
    last_state_ = s;
    emit_(event_for(s), 0.0f, confidence, t_us);
    return true;
}

bool EventEmitter::resync_idle(uint64_t t_us){
    return state(MotionState::Idle, 1.0f, t_us);
}

}   // namespace gpc
