#include "gpc/classifier.hpp"
#include "gpc/conditioner.hpp"
#include "gpc/types.hpp"
#include <cmath>
#include <cstdio>

using namespace gpc;

//state machine rules driven with hand made conditioned signals, 100 Hz ticks on the x axis

static int g_fail = 0;

static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}
static void test_int(const char* name, int got, int want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}
static void test_near(const char* name, float got, float want, float eps=1e-3f){
    float err = std::fabs(got-want);
    if (err > eps) {std::printf("[FAIL] %s: got=%.6f want=%.6f (|err|=%.6f)\n", name, got, want, err); g_fail++;}
    else           std::printf("[PASS] %s: got=%.6f want=%.6f\n", name, got, want);
}

// feeds the classifier and counts what came out
struct Run {
    PatternClassifier& c;
    uint64_t t_us = 0;
    int left = 0, right = 0;
    int changes = 0;
    int forwards = 0;
    uint64_t last_change_us = 0;
    ClassifierOutput last{};

    explicit Run(PatternClassifier& cls) : c(cls) {}

    void tick(float v){
        t_us += 10000;
        ConditionedSignal s{};
        s.smoothed = {v, 0, 0};
        s.combined = std::fabs(v);
        last = c.update(s, t_us, 0.01f);
        if (last.has_stroke) (last.stroke.direction == Direction::Right ? right : left)++;
        if (last.changed) { changes++; last_change_us = t_us; }
        if (last.forward_detected) forwards++;
    }
    void hold(float v, int n){ for (int i = 0; i < n; ++i) tick(v); }
};

// 6 is above the idle threshold and below stroke/turn thresholds, re-arms edges
static const float kRearm = 6.0f;

int main(){
    // 1) gyro.x = +20 for 2.5 s -> one stroke, TurnRight exactly once after ~2 s
    {
        ClassifierConfig cfg{};
        cfg.alternating_window_s = 3.0f;    //keeps the stroke in history through the idle check below
        PatternClassifier cls(cfg);
        Run r(cls);
        int turns = 0;
        for (int i = 0; i < 250; ++i) {
            r.tick(20.0f);
            if (r.last.changed && r.last.state == MotionState::TurnRight) turns++;
        }
        test_int("turn.TurnRight once", turns, 1);
        test_near("turn.after 2 s", float(r.last_change_us) * 1e-6f, 2.01f, 0.011f);
        test_int("turn.one stroke", r.right, 1);
        test_int("turn.state", int(cls.state()), int(MotionState::TurnRight));
        test_near("turn.confidence", cls.confidence(), 0.8f);

        // 2) quiet for idle_timeout -> Idle on the tick that reaches it
        r.hold(0.0f, 199);
        test_int("idle.held before timeout", int(cls.state()), int(MotionState::TurnRight));
        r.tick(0.0f);
        test_int("idle.after timeout", int(cls.state()), int(MotionState::Idle));
        test_near("idle.confidence", cls.confidence(), 1.0f);
        test_int("idle.history kept at timeout", int(cls.history().size()), 1);
        r.tick(0.0f);
        test_int("idle.history cleared past timeout", int(cls.history().size()), 0);
    }

    // 3) immediate idle mode
    {
        ClassifierConfig cfg{};
        cfg.sustained_idle = false;
        PatternClassifier cls(cfg);
        Run r(cls);
        r.hold(20.0f, 220);
        test_int("immediate.turned", int(cls.state()), int(MotionState::TurnRight));
        r.tick(1.0f);
        test_int("immediate.idle after one quiet tick", int(cls.state()), int(MotionState::Idle));
        test_int("immediate.history survives a dip", int(cls.history().size()), 1);
    }

    // 4) cooldown is exact: same direction blocked for 0.49 s, accepted at 0.50 s
    {
        PatternClassifier cls;
        Run r(cls);
        r.tick(20.0f);
        r.hold(kRearm, 48);
        r.tick(20.0f);
        test_int("cooldown.blocked at 0.49 s", r.right, 1);

        PatternClassifier cls2;
        Run r2(cls2);
        r2.tick(20.0f);
        r2.hold(kRearm, 49);
        r2.tick(20.0f);
        test_int("cooldown.accepted at 0.50 s", r2.right, 2);

        //a blocked edge does not come back once the cooldown ends
        PatternClassifier cls3;
        Run r3(cls3);
        r3.tick(20.0f);
        r3.hold(kRearm, 40);
        r3.hold(20.0f, 30);
        test_int("cooldown.no late stroke", r3.right, 1);

        //cooldowns are per direction
        PatternClassifier cls4;
        Run r4(cls4);
        r4.tick(20.0f);
        r4.hold(kRearm, 9);
        r4.tick(-20.0f);
        test_int("cooldown.left not blocked by right", r4.left, 1);
        test_bool("cooldown.right armed", cls4.cooldown_s(Direction::Right) > 0.0f, true);

        cls4.skip(0.5f);
        test_near("skip.ages cooldown", cls4.cooldown_s(Direction::Right), 0.0f, 0.0f);
    }

    // 5) L,R,L within the window -> one Forward, history cleared, a new run retriggers
    {
        PatternClassifier cls;
        Run r(cls);
        r.tick(-20.0f);  r.hold(kRearm, 29);
        r.tick(20.0f);   r.hold(kRearm, 29);
        test_int("fwd.not yet", int(cls.state()), int(MotionState::Idle));
        r.tick(-20.0f);
        test_bool("fwd.detected", r.last.forward_detected, true);
        test_int("fwd.state", int(cls.state()), int(MotionState::Forward));
        test_int("fwd.history cleared", int(cls.history().size()), 0);
        test_int("fwd.triggers", cls.forward_triggers(), 1);

        r.hold(kRearm, 29);
        r.tick(20.0f);
        test_int("fwd.same strokes do not retrigger", cls.forward_triggers(), 1);
        r.hold(kRearm, 29); r.tick(-20.0f);
        r.hold(kRearm, 29); r.tick(20.0f);
        test_int("fwd.new run retriggers", cls.forward_triggers(), 2);
        test_int("fwd.one Forward transition", r.changes, 1);
        test_int("fwd.detected twice", r.forwards, 2);
        test_int("fwd.still Forward", int(cls.state()), int(MotionState::Forward));
    }

    // 6) two same direction strokes within the window -> turn; too far apart -> nothing
    {
        PatternClassifier cls;
        Run r(cls);
        r.tick(20.0f); r.hold(kRearm, 59); r.tick(20.0f);
        test_int("consec.count", cls.consecutive(Direction::Right), 2);
        test_int("consec.TurnRight", int(cls.state()), int(MotionState::TurnRight));

        PatternClassifier cls2;
        Run r2(cls2);
        r2.tick(-20.0f); r2.hold(kRearm, 169); r2.tick(-20.0f);
        test_int("consec.too slow count", cls2.consecutive(Direction::Left), 1);
        test_int("consec.too slow state", int(cls2.state()), int(MotionState::Idle));
    }

    // 7) a sign flip restarts the stability timer
    {
        PatternClassifier cls;
        Run r(cls);
        r.hold(20.0f, 150);
        r.hold(-20.0f, 100);
        test_int("flip.no turn yet", int(cls.state()), int(MotionState::Idle));
        r.hold(-20.0f, 110);
        test_int("flip.TurnLeft", int(cls.state()), int(MotionState::TurnLeft));
    }

    // 8) inverted axis
    {
        ClassifierConfig cfg{};
        cfg.invert_direction = true;
        PatternClassifier cls(cfg);
        Run r(cls);
        r.tick(20.0f);
        test_int("invert.left stroke", r.left, 1);
    }

    // 9) reset twice == reset once
    {
        PatternClassifier cls;
        Run r(cls);
        r.tick(-20.0f);  r.hold(kRearm, 29);
        r.tick(20.0f);   r.hold(kRearm, 29);
        r.tick(-20.0f);
        cls.reset();
        const int s1 = int(cls.state());
        const int h1 = int(cls.history().size());
        const int f1 = cls.forward_triggers();
        cls.reset();
        test_int("reset.state", int(cls.state()), s1);
        test_int("reset.history", int(cls.history().size()), h1);
        test_int("reset.triggers", cls.forward_triggers(), f1);
        test_int("reset.idle", s1, int(MotionState::Idle));
        test_near("reset.cooldown", cls.cooldown_s(Direction::Left), 0.0f, 0.0f);
    }

    return g_fail ? 1 : 0;
}
