//-----------------------------------------------------------------------------
// File: status_indicator.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include "status_indicator.h"

namespace passthrough {

//-----------------------------------------------------------------------------
StatusIndicator::StatusIndicator(PixelOutput &pixel, ActivityLight &light, uint8_t brightness)
  : pixel_(pixel),
    light_(light),
    brightness_(brightness),
    appearance_(APPEARANCE_NONE),
    shown_(APPEARANCE_NONE),
    write_failures_(0) {
}
//-----------------------------------------------------------------------------
// white: no USB connected, blue: USB connected and idle
void StatusIndicator::set_state(CONNECTION_STATE_E state){
  show(state == CONN_CONNECTED ? APPEARANCE_IDLE : APPEARANCE_WAITING);
}
//-----------------------------------------------------------------------------
// green: reading from the host, red: reading from the device
void StatusIndicator::set_state(ACTIVITY_STATE_E state){
  switch(state){
    case ACTIVITY_HOST:
      show(APPEARANCE_HOST);
      break;
    case ACTIVITY_DEVICE:
      show(APPEARANCE_DEVICE);
      break;
    default:
      show(APPEARANCE_IDLE);
      break;
  }
}
//-----------------------------------------------------------------------------
void StatusIndicator::activity_on(){
  light_.set(true);
}
//-----------------------------------------------------------------------------
void StatusIndicator::activity_off(){
  light_.set(false);
}
//-----------------------------------------------------------------------------
Rgb StatusIndicator::color_of(APPEARANCE_E appearance){
  Rgb color = {0, 0, 0};
  switch(appearance){
    case APPEARANCE_WAITING: color.r = 255; color.g = 255; color.b = 255; break;
    case APPEARANCE_IDLE:    color.b = 255; break;
    case APPEARANCE_HOST:    color.g = 255; break;
    case APPEARANCE_DEVICE:  color.r = 255; break;
    default: break;
  }
  return(color);
}
//-----------------------------------------------------------------------------
void StatusIndicator::show(APPEARANCE_E appearance){
  appearance_ = appearance;
  // The pixel is slow to write, skip it when nothing changes
  if(appearance == shown_){
    return;
  }
  Rgb color = color_of(appearance);
  uint8_t r = (uint16_t)color.r * brightness_ / 255;
  uint8_t g = (uint16_t)color.g * brightness_ / 255;
  uint8_t b = (uint16_t)color.b * brightness_ / 255;
  // Cosmetic only, a failed write waits for the next state change
  if(!pixel_.show(r, g, b)){
    write_failures_++;
  }
  shown_ = appearance;
}

} // namespace passthrough
