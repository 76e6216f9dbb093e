//-----------------------------------------------------------------------------
// File: board_setup.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef BOARD_SETUP_H
#define BOARD_SETUP_H
#include <Arduino.h>
#include "config.h"

//-----------------------------------------------------------------------------
// Reset the co-processor into passthrough or download mode when COPROC_BOARD is set
void board_init(const passthrough::Config &config);
void board_print_banner(const passthrough::Config &config);
void board_print_host_unavailable();

#endif
