//-----------------------------------------------------------------------------
// File: config.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef CONFIG_H
#define CONFIG_H
#include <stdint.h>
#include <stddef.h>

//-----------------------------------------------------------------------------
// Flash download mode. Set when re-programming the co-processor with
// esptool (use --before no_reset). Forces ADD_LF_TO_CR and LOCAL_ECHO off.
#ifndef FLASH_MODE
#define FLASH_MODE 0
#endif

// Send "\r\n" for every "\r" typed on the host (screen only sends "\r").
#ifndef ADD_LF_TO_CR
#define ADD_LF_TO_CR 1
#endif

// Echo host input back when the device does not echo it itself.
#ifndef LOCAL_ECHO
#define LOCAL_ECHO 0
#endif

//-----------------------------------------------------------------------------
#define DEVICE_BAUDRATE 115200
#define DEVICE_RX_BUFFER 2048
#define DEVICE_TIMEOUT_MS 100

// UART0 default pads on the ESP32-S3, the console lives there
#define CONSOLE_RX_PIN 44
#define CONSOLE_TX_PIN 43

// UART1 defaults of the ESP32-S3 core (RX1 / TX1)
#ifndef DEVICE_RX_PIN
#define DEVICE_RX_PIN 15
#endif
#ifndef DEVICE_TX_PIN
#define DEVICE_TX_PIN 16
#endif

#if DEVICE_RX_PIN == CONSOLE_RX_PIN || DEVICE_RX_PIN == CONSOLE_TX_PIN || \
    DEVICE_TX_PIN == CONSOLE_RX_PIN || DEVICE_TX_PIN == CONSOLE_TX_PIN
#error "device UART pins clash with the console UART0 pins"
#endif

// Set to 1 on boards that have a co-processor wired to the reset and mode
// lines below. Left at 0 the lines are never driven.
#ifndef COPROC_BOARD
#define COPROC_BOARD 0
#endif

// Co-processor control lines, only driven when COPROC_BOARD is set
#ifndef COPROC_RESET_PIN
#define COPROC_RESET_PIN 5
#endif
#ifndef COPROC_MODE_PIN
#define COPROC_MODE_PIN 6
#endif

// 26/255 is about 10%, those pixels are bright
#ifndef PIXEL_BRIGHTNESS
#define PIXEL_BRIGHTNESS 26
#endif

// Largest chunk moved in one read, matches the UART receive buffer
#define RELAY_MAX_CHUNK DEVICE_RX_BUFFER

//-----------------------------------------------------------------------------
namespace passthrough {

struct Config {
  bool translate_cr;
  bool local_echo;
  bool flash_mode;
};

// Flash mode wins over the other two flags.
Config resolve_config(bool flash_mode, bool translate_cr, bool local_echo);

// Number of lines written by config_summary()
const size_t CONFIG_SUMMARY_LINES = 3;

// Human readable mode lines for the console banner. Fills at most
// CONFIG_SUMMARY_LINES entries of lines and returns how many were set.
size_t config_summary(const Config &config, const char **lines, size_t max_lines);

// True when the build says the reset and mode lines reach a co-processor
bool coproc_board_enabled();

} // namespace passthrough

//-----------------------------------------------------------------------------
#endif
