#include "gpc/types.hpp"
#include "gpc/errors.hpp"

namespace gpc {

const char* to_string(Direction d){
    return d == Direction::Left ? "Left" : "Right";
}

const char* to_string(MotionState s){
    switch (s) {
        case MotionState::Idle:      return "Idle";
        case MotionState::Forward:   return "Forward";
        case MotionState::TurnLeft:  return "TurnLeft";
        case MotionState::TurnRight: return "TurnRight";
        default:                     return "?";
    }
}

const char* to_string(GestureKind g){
    switch (g) {
        case GestureKind::None:        return "None";
        case GestureKind::StartGame:   return "StartGame";
        case GestureKind::RestartGame: return "RestartGame";
        default:                       return "?";
    }
}

const char* to_string(ControlEventType t){
    switch (t) {
        case ControlEventType::PaddleLeft:  return "PaddleLeft";
        case ControlEventType::PaddleRight: return "PaddleRight";
        case ControlEventType::TurnLeft:    return "TurnLeft";
        case ControlEventType::TurnRight:   return "TurnRight";
        case ControlEventType::Forward:     return "Forward";
        case ControlEventType::Idle:        return "Idle";
        case ControlEventType::StartGame:   return "StartGame";
        case ControlEventType::RestartGame: return "RestartGame";
        default:                            return "?";
    }
}

const char* to_string(CalibrationMode m){
    return m == CalibrationMode::ZeroPoint ? "ZeroPoint" : "ThreePoint";
}

const char* to_string(CalibrationStatus s){
    switch (s) {
        case CalibrationStatus::Uncalibrated: return "Uncalibrated";
        case CalibrationStatus::Calibrating:  return "Calibrating";
        case CalibrationStatus::Calibrated:   return "Calibrated";
        case CalibrationStatus::Failed:       return "Failed";
        default:                              return "?";
    }
}

const char* to_string(ErrorCode e){
    switch (e) {
        case ErrorCode::None:               return "None";
        case ErrorCode::MalformedSample:    return "MalformedSample";
        case ErrorCode::CalibrationTimeout: return "CalibrationTimeout";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        default:                            return "?";
    }
}

}   // namespace gpc
