#include "gpc/classifier.hpp"
#include "gpc/logger.hpp"
#include <algorithm>
#include <cmath>

namespace gpc {

namespace {

inline float clamp01(float x) {return std::max(0.0f, std::min(1.0f, x));}

constexpr uint64_t kRecentStrokeUs = 1000000;   //stroke counts as recent for 1 s

}   // namespace

void PatternClassifier::reset(){
    state_ = MotionState::Idle;
    confidence_ = 1.0f;
    quiet_ = false;
    quiet_us_ = 0;
    turn_hold_us_ = 0;
    turn_sign_ = 0;
    cooldown_us_[0] = cooldown_us_[1] = 0;
    armed_ = true;
    have_edge_ = false;
    forward_triggers_ = 0;
    clear_patterns_();
}

void PatternClassifier::clear_patterns_(){
    history_.clear();
    consecutive_[0] = consecutive_[1] = 0;
    have_stroke_ = false;
    last_stroke_ = MovementEvent{};
}

float PatternClassifier::cooldown_s(Direction d) const {
    return float(double(cooldown_us_[idx(d)]) * 1e-6);
}

void PatternClassifier::age_(uint64_t dt_us){
    for (uint64_t& c : cooldown_us_) c = (c > dt_us) ? c - dt_us : 0;
}

void PatternClassifier::skip(float dt_s){
    age_(to_us(dt_s));
}

// drop strokes older than twice the alternating window
void PatternClassifier::purge_(uint64_t t_us){
    const uint64_t keep_us = 2 * to_us(cfg_.alternating_window_s);
    while (!history_.empty() && t_us > history_.front().t_us && (t_us - history_.front().t_us) > keep_us)
        history_.pop_front();
}

float PatternClassifier::mean_intensity_() const {
    if (history_.empty()) return 0.0f;
    float sum = 0.0f;
    for (const MovementEvent& e : history_) sum += e.intensity;
    return sum / float(history_.size());
}

// edge detection + cooldown, true if a stroke was recorded
bool PatternClassifier::stroke_(float v, uint64_t t_us, ClassifierOutput& out){
    if (std::fabs(v) <= cfg_.stroke_threshold) {
        armed_ = true;
        return false;
    }
    const Direction dir = (v > 0.0f) ? Direction::Right : Direction::Left;
    const bool edge = armed_ || (have_edge_ && dir != edge_dir_);
    if (!edge) return false;

    //the edge is used up even if the cooldown swallows it
    armed_ = false;
    have_edge_ = true;
    edge_dir_ = dir;

    const int d = idx(dir);
    if (cooldown_us_[d] > 0) {
        GPC_LOG_DBG("cls", to_string(dir) << " stroke blocked, cooldown " << cooldown_s(dir) << " s");
        return false;
    }

    MovementEvent e;
    e.direction = dir;
    e.t_us = t_us;
    e.intensity = std::fabs(v) / cfg_.stroke_threshold;

    const bool same_run = have_stroke_ && last_stroke_.direction == dir
                          && (t_us - last_stroke_.t_us) <= to_us(cfg_.consecutive_window_s);
    consecutive_[d] = same_run ? consecutive_[d] + 1 : 1;
    consecutive_[1 - d] = 0;

    cooldown_us_[d] = to_us(cfg_.stroke_cooldown_s);
    history_.push_back(e);
    last_stroke_ = e;
    have_stroke_ = true;

    out.has_stroke = true;
    out.stroke = e;
    GPC_LOG_DBG("cls", "stroke " << to_string(dir) << " x" << consecutive_[d] << " i=" << e.intensity);
    return true;
}

// trailing run of strictly alternating strokes inside the window
bool PatternClassifier::alternating_(uint64_t t_us) const {
    const uint64_t win_us = to_us(cfg_.alternating_window_s);
    int run = 0;
    const MovementEvent* newer = nullptr;
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (t_us > it->t_us && (t_us - it->t_us) > win_us) break;
        if (newer && newer->direction == it->direction) break;
        newer = &*it;
        run++;
    }
    return run >= cfg_.min_alternating_strokes;
}

float PatternClassifier::confidence_for_(MotionState s, bool pattern, uint64_t t_us, float mean_intensity) const {
    if (s == MotionState::Idle) return 1.0f;

    float consistency = 1.0f;
    if (!pattern) {
        const uint64_t need = to_us(cfg_.turn_stability_s);
        consistency = need > 0 ? clamp01(float(double(turn_hold_us_) / double(need))) : 0.0f;
    }
    const float recency = (have_stroke_ && (t_us - last_stroke_.t_us) < kRecentStrokeUs) ? 1.0f : 0.0f;
    return clamp01(0.4f * clamp01(mean_intensity) + 0.4f * consistency + 0.2f * recency);
}

void PatternClassifier::set_state_(MotionState s, ClassifierOutput& out){
    if (s == state_) return;
    GPC_LOG_INFO("cls", to_string(state_) << " -> " << to_string(s));
    state_ = s;
    out.changed = true;
}

ClassifierOutput PatternClassifier::update(const ConditionedSignal& sig, uint64_t t_us, float dt_s){
    ClassifierOutput out;
    const uint64_t dt_us = to_us(dt_s);

    age_(dt_us);
    purge_(t_us);
    if (have_stroke_ && (t_us - last_stroke_.t_us) > to_us(cfg_.consecutive_window_s)) {
        consecutive_[0] = consecutive_[1] = 0;
    }

    float v = sig.smoothed.axis(cfg_.turn_axis);
    if (cfg_.invert_direction) v = -v;

    //1. dead zone, nothing else runs on this tick
    quiet_ = sig.combined < cfg_.idle_threshold;
    if (quiet_) {
        turn_hold_us_ = 0;
        turn_sign_ = 0;
        armed_ = true;
        quiet_us_ += dt_us;

        const uint64_t idle_need = to_us(cfg_.idle_timeout_s);
        if (!cfg_.sustained_idle || quiet_us_ >= idle_need) set_state_(MotionState::Idle, out);
        if (quiet_us_ > idle_need) clear_patterns_();

        confidence_ = confidence_for_(state_, false, t_us, mean_intensity_());
        out.state = state_;
        out.confidence = confidence_;
        return out;
    }
    quiet_us_ = 0;

    //2. sustained turn timer, a sign flip or a drop below threshold restarts it
    if (std::fabs(v) > cfg_.turn_threshold) {
        const int sign = (v > 0.0f) ? 1 : -1;
        if (sign == turn_sign_) {
            turn_hold_us_ += dt_us;
        } else {
            turn_sign_ = sign;
            turn_hold_us_ = 0;
        }
    } else {
        turn_sign_ = 0;
        turn_hold_us_ = 0;
    }
    const bool sustained = turn_sign_ != 0 && turn_hold_us_ >= to_us(cfg_.turn_stability_s);

    //3. strokes run every tick regardless of 2
    const bool stroked = stroke_(v, t_us, out);
    const float mean_int = mean_intensity_();

    if (sustained) {
        set_state_(turn_sign_ > 0 ? MotionState::TurnRight : MotionState::TurnLeft, out);
    } else if (stroked && consecutive_[idx(out.stroke.direction)] >= cfg_.consecutive_strokes_for_turn) {
        set_state_(out.stroke.direction == Direction::Right ? MotionState::TurnRight : MotionState::TurnLeft, out);
    } else if (alternating_(t_us)) {
        //4. forward, history goes so the same strokes can't fire again
        set_state_(MotionState::Forward, out);
        out.forward_detected = true;
        forward_triggers_++;
        history_.clear();
        GPC_LOG_DBG("cls", "alternating run, forward #" << forward_triggers_);
    }

    const bool pattern = sustained || out.forward_detected
                         || consecutive_[0] >= cfg_.consecutive_strokes_for_turn
                         || consecutive_[1] >= cfg_.consecutive_strokes_for_turn;
    confidence_ = confidence_for_(state_, pattern, t_us, mean_int);
    out.state = state_;
    out.confidence = confidence_;
    return out;
}

}   // namespace gpc
