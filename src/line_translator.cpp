//-----------------------------------------------------------------------------
// File: line_translator.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include "line_translator.h"

namespace passthrough {

//-----------------------------------------------------------------------------
size_t translate_host_chunk(const Config &config, const uint8_t *in, size_t len,
                            std::vector<uint8_t> &out){
  size_t start = out.size();
  if(!config.translate_cr){
    out.insert(out.end(), in, in + len);
    return(len);
  }
  // AT command sets want "\r\n" but terminals like screen only send "\r"
  for(size_t i = 0; i < len; i++){
    out.push_back(in[i]);
    if(in[i] == CHAR_CR){
      out.push_back(CHAR_LF);
    }
  }
  return(out.size() - start);
}
//-----------------------------------------------------------------------------
bool echo_enabled(const Config &config){
  return(config.local_echo && !config.translate_cr);
}

} // namespace passthrough
