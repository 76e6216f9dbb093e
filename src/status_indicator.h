//-----------------------------------------------------------------------------
// File: status_indicator.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef STATUS_INDICATOR_H
#define STATUS_INDICATOR_H
#include <stdint.h>

namespace passthrough {

//-----------------------------------------------------------------------------
enum CONNECTION_STATE_E {
  CONN_DISCONNECTED,
  CONN_CONNECTED,
};

enum ACTIVITY_STATE_E {
  ACTIVITY_IDLE,
  ACTIVITY_HOST,
  ACTIVITY_DEVICE,
};

// What the pixel currently shows
enum APPEARANCE_E {
  APPEARANCE_NONE,
  APPEARANCE_WAITING,
  APPEARANCE_IDLE,
  APPEARANCE_HOST,
  APPEARANCE_DEVICE,
};

struct Rgb {
  uint8_t r;
  uint8_t g;
  uint8_t b;
};

//-----------------------------------------------------------------------------
// Addressable status pixel. show() returns false if the write failed.
class PixelOutput {
public:
  virtual ~PixelOutput() {}
  virtual bool show(uint8_t r, uint8_t g, uint8_t b) = 0;
};

// Plain on/off led
class ActivityLight {
public:
  virtual ~ActivityLight() {}
  virtual void set(bool on) = 0;
};

//-----------------------------------------------------------------------------
// Drives the status pixel and the activity led. Last state written wins.
// Pixel write failures are counted and otherwise ignored, the pixel is
// written again on the next state change.
class StatusIndicator {
public:
  StatusIndicator(PixelOutput &pixel, ActivityLight &light, uint8_t brightness);

  void set_state(CONNECTION_STATE_E state);
  void set_state(ACTIVITY_STATE_E state);

  void activity_on();
  void activity_off();

  APPEARANCE_E appearance() const { return appearance_; }
  uint32_t write_failures() const { return write_failures_; }

  // Unscaled color bound to an appearance
  static Rgb color_of(APPEARANCE_E appearance);

private:
  void show(APPEARANCE_E appearance);

  PixelOutput &pixel_;
  ActivityLight &light_;
  uint8_t brightness_;
  APPEARANCE_E appearance_;
  APPEARANCE_E shown_;
  uint32_t write_failures_;
};

} // namespace passthrough

//-----------------------------------------------------------------------------
#endif
