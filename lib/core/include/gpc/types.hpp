#pragma once            // includes this header only once per compilation
#include <cstdint>
#include <cmath>

namespace gpc{

//3 axis vector, used for gyro rates and calibration points
struct Vec3 {
    float x=0, y=0, z=0;

    float axis(int i) const { return i == 0 ? x : (i == 1 ? y : z); }
    void set_axis(int i, float v) {
        if (i == 0) x = v;
        else if (i == 1) y = v;
        else z = v;
    }
    float magnitude() const { return std::sqrt(x*x + y*y + z*z); }
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return {a.x+b.x, a.y+b.y, a.z+b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return {a.x-b.x, a.y-b.y, a.z-b.z}; }
inline Vec3 operator*(const Vec3& a, float k) { return {a.x*k, a.y*k, a.z*k}; }
inline Vec3 operator/(const Vec3& a, float k) { return {a.x/k, a.y/k, a.z/k}; }

// one sample handed over by the transport (already framed and decoded)
struct SensorSample {
    Vec3 gyro;              // deg/s-like, three axes
    int32_t accel_y = 0;    // raw accelerometer count
    uint64_t t_us = 0;      // monotonic timestamp (microsecs)
};

enum class Direction : uint8_t {
    Left = 0,
    Right = 1
};

// classifier output states
enum class MotionState : uint8_t {
    Idle = 0,
    Forward = 1,
    TurnLeft = 2,
    TurnRight = 3
};

enum class GestureKind : uint8_t {
    None = 0,
    StartGame = 1,
    RestartGame = 2
};

// a single recorded stroke, only used for pattern inference
struct MovementEvent {
    Direction direction = Direction::Left;
    uint64_t t_us = 0;
    float intensity = 0.0f;     // |axis| / stroke threshold
};

// what the downstream controller receives
enum class ControlEventType : uint8_t {
    PaddleLeft = 0,
    PaddleRight,
    TurnLeft,
    TurnRight,
    Forward,
    Idle,
    StartGame,
    RestartGame,
    Count
};

struct ControlEvent {
    ControlEventType type = ControlEventType::Idle;
    float intensity = 0.0f;
    float confidence = 0.0f;
    uint64_t t_us = 0;
    uint64_t seq = 0;       // strictly increasing per emitter
};

enum class CalibrationMode : uint8_t {
    ZeroPoint = 0,
    ThreePoint = 1
};

enum class CalibrationStatus : uint8_t {
    Uncalibrated = 0,
    Calibrating,
    Calibrated,
    Failed
};

const char* to_string(Direction d);
const char* to_string(MotionState s);
const char* to_string(GestureKind g);
const char* to_string(ControlEventType t);
const char* to_string(CalibrationMode m);
const char* to_string(CalibrationStatus s);

inline float seconds_between(uint64_t from_us, uint64_t to_us) {
    return (to_us > from_us) ? float(double(to_us - from_us) * 1e-6) : 0.0f;
}

} // namespace gpc
