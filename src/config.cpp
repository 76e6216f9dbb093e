//-----------------------------------------------------------------------------
// File: config.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include "config.h"

namespace passthrough {

//-----------------------------------------------------------------------------
Config resolve_config(bool flash_mode, bool translate_cr, bool local_echo){
  Config config;
  config.flash_mode = flash_mode;
  // Don't translate returns or echo when programming
  config.translate_cr = flash_mode ? false : translate_cr;
  config.local_echo = flash_mode ? false : local_echo;
  return(config);
}
//-----------------------------------------------------------------------------
size_t config_summary(const Config &config, const char **lines, size_t max_lines){
  size_t count = 0;
  if(config.flash_mode && count < max_lines){
    lines[count++] = "-> Flash programming mode enabled";
  }
  if(count < max_lines){
    lines[count++] = config.translate_cr
      ? "-> Automatically adding \\n to \\r end of line character"
      : "-> Not changing end-of-line characters";
  }
  if(count < max_lines){
    lines[count++] = config.local_echo
      ? "-> Echoing input locally"
      : "-> Not echoing input locally";
  }
  return(count);
}
//-----------------------------------------------------------------------------
bool coproc_board_enabled(){
  return(COPROC_BOARD != 0);
}

} // namespace passthrough
