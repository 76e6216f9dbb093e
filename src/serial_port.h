//-----------------------------------------------------------------------------
// File: serial_port.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef SERIAL_PORT_H
#define SERIAL_PORT_H
#include <stdint.h>
#include <stddef.h>

namespace passthrough {

//-----------------------------------------------------------------------------
// Full duplex byte stream. read() never blocks longer than the transport
// timeout and may return fewer bytes than available() reported.
class ByteStream {
public:
  virtual ~ByteStream() {}
  virtual int available() = 0;
  virtual size_t read(uint8_t *buf, size_t len) = 0;
  virtual size_t write(const uint8_t *buf, size_t len) = 0;
};

// The user facing side (terminal program on the USB port).
class HostPort : public ByteStream {
public:
  virtual bool connected() = 0;
};

} // namespace passthrough

//-----------------------------------------------------------------------------
#endif
