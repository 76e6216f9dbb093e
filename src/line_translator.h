//-----------------------------------------------------------------------------
// File: line_translator.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef LINE_TRANSLATOR_H
#define LINE_TRANSLATOR_H
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "config.h"

#define CHAR_CR 0x0D
#define CHAR_LF 0x0A

namespace passthrough {

//-----------------------------------------------------------------------------
// Append the bytes to forward to the device for one host chunk to out.
// With translate_cr every CR becomes CR LF, otherwise the chunk is copied
// as is. Returns the number of bytes appended.
size_t translate_host_chunk(const Config &config, const uint8_t *in, size_t len,
                            std::vector<uint8_t> &out);

// True when the host chunk must also be written back to the host.
bool echo_enabled(const Config &config);

} // namespace passthrough

//-----------------------------------------------------------------------------
#endif
