//-----------------------------------------------------------------------------
// File: relay_loop.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef RELAY_LOOP_H
#define RELAY_LOOP_H
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "config.h"
#include "serial_port.h"
#include "status_indicator.h"

#define RELAY_CONNECTED_NOTICE "Passthrough Connected\r\n"

namespace passthrough {

//-----------------------------------------------------------------------------
enum RELAY_STATUS_E {
  RELAY_OK,
  RELAY_HOST_UNAVAILABLE,
};

//-----------------------------------------------------------------------------
// Moves bytes between the host port and the device port.
//
// start() waits for the host once, then poll() is called forever, one
// iteration per call. The host is serviced before the device in every
// iteration. Device bytes are still forwarded while the host is reported
// disconnected so the device side never backs up; this is deliberate and
// has to change if a disconnected host should also pause the device.
class RelayLoop {
public:
  // host may be NULL when the host port could not be created
  RelayLoop(const Config &config, HostPort *host, ByteStream &device,
            StatusIndicator &indicator);

  // Blocks until the host connects. Returns RELAY_HOST_UNAVAILABLE
  // straight away, without touching anything, when there is no host port.
  RELAY_STATUS_E start();

  // One pass over both ports, only after start() returned RELAY_OK
  void poll();

  const Config &config() const { return config_; }

private:
  void relay_host_to_device();
  void relay_device_to_host();

  const Config config_;
  HostPort *host_;
  ByteStream &device_;
  StatusIndicator &indicator_;

  // Scratch space, contents only live for one iteration
  std::vector<uint8_t> rx_chunk_;
  std::vector<uint8_t> tx_chunk_;
};

} // namespace passthrough

//-----------------------------------------------------------------------------
#endif
