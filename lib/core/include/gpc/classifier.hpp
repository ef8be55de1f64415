#pragma once
#include <cstdint>
#include <deque>
#include "gpc/conditioner.hpp"
#include "gpc/config.hpp"
#include "gpc/types.hpp"

namespace gpc {

struct ClassifierOutput {
    MotionState state = MotionState::Idle;
    float confidence = 1.0f;
    bool changed = false;           //state differs from the previous tick
    bool has_stroke = false;        //stroke accepted this tick
    MovementEvent stroke{};
    bool forward_detected = false;
};

// Idle / Forward / TurnLeft / TurnRight state machine over the conditioned signal.
// rules, highest first: dead zone, sustained turn, consecutive strokes, alternating strokes
class PatternClassifier {
public:
    explicit PatternClassifier(const ClassifierConfig& cfg = ClassifierConfig{}) : cfg_(cfg) {}
    void init(const ClassifierConfig& cfg) { cfg_ = cfg; reset(); }
    void reset();

    ClassifierOutput update(const ConditionedSignal& sig, uint64_t t_us, float dt_s);
    void skip(float dt_s);      //age cooldowns only (gesture ticks)

    //inspectors
    MotionState state() const {return state_;}
    bool quiet() const {return quiet_;}    //last update was a dead zone tick
    float confidence() const {return confidence_;}
    int forward_triggers() const {return forward_triggers_;}
    const std::deque<MovementEvent>& history() const {return history_;}
    float cooldown_s(Direction d) const;
    int consecutive(Direction d) const {return consecutive_[idx(d)];}
    float quiet_time_s() const {return float(quiet_us_) * 1e-6f;}
    float turn_hold_s() const {return float(turn_hold_us_) * 1e-6f;}

private:
    ClassifierConfig cfg_;
    MotionState state_ = MotionState::Idle;
    float confidence_ = 1.0f;

    //hold timers (us, accumulated from dt while the condition is true)
    bool quiet_ = false;
    uint64_t quiet_us_ = 0;
    uint64_t turn_hold_us_ = 0;
    int turn_sign_ = 0;             //0 = below turn threshold

    //strokes
    uint64_t cooldown_us_[2] = {0, 0};
    int consecutive_[2] = {0, 0};
    bool armed_ = true;             //|v| went below stroke threshold since the last edge
    bool have_edge_ = false;
    Direction edge_dir_ = Direction::Left;
    bool have_stroke_ = false;
    MovementEvent last_stroke_{};
    std::deque<MovementEvent> history_;
    int forward_triggers_ = 0;

    static int idx(Direction d) {return d == Direction::Right ? 1 : 0;}
    static uint64_t to_us(float s) {return s > 0.0f ? uint64_t(double(s) * 1e6 + 0.5) : 0;}

    void age_(uint64_t dt_us);
    void purge_(uint64_t t_us);
    void clear_patterns_();
    bool stroke_(float v, uint64_t t_us, ClassifierOutput& out);
    bool alternating_(uint64_t t_us) const;
    float mean_intensity_() const;
    float confidence_for_(MotionState s, bool pattern, uint64_t t_us, float mean_intensity) const;
    void set_state_(MotionState s, ClassifierOutput& out);
};

}   // namespace gpc
