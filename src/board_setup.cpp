//-----------------------------------------------------------------------------
// File: board_setup.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include "board_setup.h"
#include "esp_log.h"

static const char *TAG = "board";

//-----------------------------------------------------------------------------
void board_init(const passthrough::Config &config){
  if(!passthrough::coproc_board_enabled()){
    Serial.println("\nWARNING: co-processor board not configured (COPROC_BOARD). Reset not performed");
    ESP_LOGW(TAG, "no co-processor lines on %s", ARDUINO_BOARD);
    return;
  }
  Serial.printf("\nCo-processor board %s\n", ARDUINO_BOARD);
  Serial.print("Performing co-processor reset...");
  pinMode(COPROC_RESET_PIN, OUTPUT);
  pinMode(COPROC_MODE_PIN, OUTPUT);
  digitalWrite(COPROC_RESET_PIN, LOW);
  // 1 for passthrough, 0 for download mode
  digitalWrite(COPROC_MODE_PIN, config.flash_mode ? LOW : HIGH);
  digitalWrite(COPROC_RESET_PIN, HIGH);
  Serial.println(" reset finished.");
}
//-----------------------------------------------------------------------------
void board_print_banner(const passthrough::Config &config){
  Serial.println("\nThis is the console output, you want to connect to the other port for Passthrough");
  Serial.println("e.g. screen /dev/ttyACM0\n");
  const char *lines[passthrough::CONFIG_SUMMARY_LINES];
  size_t count = passthrough::config_summary(config, lines, passthrough::CONFIG_SUMMARY_LINES);
  for(size_t i = 0; i < count; i++){
    Serial.println(lines[i]);
  }
}
//-----------------------------------------------------------------------------
void board_print_host_unavailable(){
  Serial.println("Can't create the USB CDC device for passthrough");
  Serial.println("Build with USB Mode set to USB-OTG (TinyUSB) and USB CDC On Boot disabled.");
  Serial.println("Push the RESET button after flashing the new build.\n");
}
