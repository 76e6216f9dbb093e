//------------------------------------------------------------------------------
// File: display_handler.cpp
// Created: 12/3/2025
// Last modified: 19/10/2026
//------------------------------------------------------------------------------

#include "display_handler.h"

//-----------------------------------------------------------------------------
class RgbPixel : public passthrough::PixelOutput {
public:
  explicit RgbPixel(uint8_t pin) : pin_(pin) {}
  // neopixelWrite has no error path, the RMT write either goes out or not
  bool show(uint8_t r, uint8_t g, uint8_t b){
    neopixelWrite(pin_, r, g, b);
    return(true);
  }
private:
  uint8_t pin_;
};

class BuiltinLed : public passthrough::ActivityLight {
public:
  explicit BuiltinLed(uint8_t pin) : pin_(pin) {}
  void set(bool on){
    digitalWrite(pin_, on ? HIGH : LOW);
  }
private:
  uint8_t pin_;
};

static RgbPixel status_pixel(STATUS_PIXEL_PIN);
static BuiltinLed activity_led(ACTIVITY_LED_PIN);

// Initialize the LED pin
void display_init(){
  pinMode(ACTIVITY_LED_PIN, OUTPUT);
  digitalWrite(ACTIVITY_LED_PIN, LOW);
}

passthrough::PixelOutput &display_pixel(){
  return(status_pixel);
}

passthrough::ActivityLight &display_led(){
  return(activity_led);
}
