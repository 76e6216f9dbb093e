// Creator: Halid Y.
// Github: SMDHuman
// Created: 06/03/2025
// Last modified: 19/10/2026
/* Description: ---------------------------------------------------------------
  * USB Passthrough relays bytes between the USB port of an ESP32-S3 and the
  * UART of an attached co-processor, so AT commands can be typed at it or it
  * can be re-flashed with esptool (FLASH_MODE). "\r" from the terminal is
  * sent as "\r\n" and the RGB pixel shows the link state:
  *   white: no USB, blue: idle, green: host typing, red: device talking
  * -------------------------------------------------------------------------*/

#include <Arduino.h>
#include "esp_log.h"
#include "config.h"
#include "serial_com.h"
#include "display_handler.h"
#include "board_setup.h"
#include "relay_loop.h"

static const char *TAG = "main";

static const passthrough::Config config =
  passthrough::resolve_config(FLASH_MODE, ADD_LF_TO_CR, LOCAL_ECHO);
static passthrough::RelayLoop *relay = NULL;

void setup() {
  Serial.begin(CONSOLE_BAUDRATE);
  display_init();
  static passthrough::StatusIndicator indicator(display_pixel(), display_led(), PIXEL_BRIGHTNESS);
  serial_init();
  board_init(config);
  board_print_banner(config);

  static passthrough::RelayLoop relay_loop(config, serial_open_host(), serial_device(), indicator);
  if(relay_loop.start() != passthrough::RELAY_OK){
    board_print_host_unavailable();
    ESP_LOGE(TAG, "host port unavailable, stopping");
    // Nothing to do without the host port
    vTaskDelete(NULL);
  }
  Serial.println("Connected on passthrough port");
  ESP_LOGI(TAG, "host connected");
  relay = &relay_loop;
}

void loop() {
  relay->poll();
}
