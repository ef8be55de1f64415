#ifndef GPC_APP_BRIDGE_H
#define GPC_APP_BRIDGE_H
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
  float gx, gy, gz;     // gyro, deg/s
  int32_t accel_y;      // raw count
  uint64_t t_us;        // microseconds, strictly increasing
} GpcRawSample;

// values match gpc::ControlEventType
enum {
  GPC_EVT_PADDLE_LEFT = 0,
  GPC_EVT_PADDLE_RIGHT,
  GPC_EVT_TURN_LEFT,
  GPC_EVT_TURN_RIGHT,
  GPC_EVT_FORWARD,
  GPC_EVT_IDLE,
  GPC_EVT_START_GAME,
  GPC_EVT_RESTART_GAME
};

// values match gpc::CalibrationStatus
enum {
  GPC_CAL_UNCALIBRATED = 0,
  GPC_CAL_CALIBRATING,
  GPC_CAL_CALIBRATED,
  GPC_CAL_FAILED
};

typedef struct {
  uint8_t  type;
  float    intensity;
  float    confidence;
  uint64_t t_us;
  uint64_t seq;
} GpcEvent;

typedef void (*GpcEventFn)(const GpcEvent* ev, void* ctx);

// tuning knobs exposed to C, fill with gpc_config_defaults() first
typedef struct {
  uint8_t three_point;          // calibration mode
  int32_t required_samples;
  int32_t min_samples;
  float   stability_threshold;

  float   dead_zone;
  float   smoothing_factor;

  float   idle_threshold;
  float   idle_timeout_s;
  float   turn_threshold;
  float   turn_stability_s;
  float   stroke_threshold;
  float   stroke_cooldown_s;
  float   alternating_window_s;
  int32_t min_alternating_strokes;

  int32_t start_threshold;
  int32_t restart_threshold;
  float   gesture_cooldown_s;
} GpcConfig;

typedef struct GpcApp GpcApp;

void    gpc_config_defaults(GpcConfig* cfg);

GpcApp* gpc_app_create(const GpcConfig* cfg, GpcEventFn fn, void* ctx);   // NULL cfg = defaults, NULL on invalid cfg
void    gpc_app_destroy(GpcApp* app);
int     gpc_app_step(GpcApp* app, const GpcRawSample* s);                  // 1 if the sample was accepted
void    gpc_app_report_malformed(GpcApp* app);
void    gpc_app_reset(GpcApp* app);
void    gpc_app_recalibrate(GpcApp* app, int three_point);
int     gpc_app_calibration_status(const GpcApp* app);

#ifdef __cplusplus
}
#endif
#endif
