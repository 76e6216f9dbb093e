//------------------------------------------------------------------------------
// File: display_handler.h
// Created: 12/3/2025
// Last modified: 19/10/2026
//------------------------------------------------------------------------------
#ifndef DISPLAY_HANDLER_H
#define DISPLAY_HANDLER_H
#include <Arduino.h>
#include "status_indicator.h"

// Onboard RGB pixel
#ifndef STATUS_PIXEL_PIN
#define STATUS_PIXEL_PIN RGB_BUILTIN
#endif
// Plain led for activity, not the pixel
#ifndef ACTIVITY_LED_PIN
#define ACTIVITY_LED_PIN 2
#endif

//-----------------------------------------------------------------------------
void display_init();
passthrough::PixelOutput &display_pixel();
passthrough::ActivityLight &display_led();

#endif
