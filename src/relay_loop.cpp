//-----------------------------------------------------------------------------
// File: relay_loop.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include "relay_loop.h"
#include <string.h>
#include "line_translator.h"

namespace passthrough {

//-----------------------------------------------------------------------------
RelayLoop::RelayLoop(const Config &config, HostPort *host, ByteStream &device,
                     StatusIndicator &indicator)
  : config_(config),
    host_(host),
    device_(device),
    indicator_(indicator) {
  rx_chunk_.reserve(RELAY_MAX_CHUNK);
  tx_chunk_.reserve(2 * RELAY_MAX_CHUNK);
}
//-----------------------------------------------------------------------------
RELAY_STATUS_E RelayLoop::start(){
  if(host_ == NULL){
    return(RELAY_HOST_UNAVAILABLE);
  }
  while(!host_->connected()){
    indicator_.set_state(CONN_DISCONNECTED);
  }
  indicator_.set_state(CONN_CONNECTED);
  if(!config_.flash_mode){
    const char *notice = RELAY_CONNECTED_NOTICE;
    host_->write((const uint8_t *)notice, strlen(notice));
  }
  return(RELAY_OK);
}
//-----------------------------------------------------------------------------
void RelayLoop::poll(){
  indicator_.set_state(host_->connected() ? CONN_CONNECTED : CONN_DISCONNECTED);
  if(host_->available() > 0){
    relay_host_to_device();
  }
  if(device_.available() > 0){
    relay_device_to_host();
  }
}
//-----------------------------------------------------------------------------
// Read one chunk from the host, echo it if asked, send it to the device
void RelayLoop::relay_host_to_device(){
  indicator_.set_state(ACTIVITY_HOST);
  indicator_.activity_on();
  size_t want = (size_t)host_->available();
  if(want > RELAY_MAX_CHUNK){
    want = RELAY_MAX_CHUNK;
  }
  rx_chunk_.resize(want);
  size_t got = host_->read(rx_chunk_.data(), want);
  if(got > 0){
    if(echo_enabled(config_)){
      host_->write(rx_chunk_.data(), got);
    }
    tx_chunk_.clear();
    translate_host_chunk(config_, rx_chunk_.data(), got, tx_chunk_);
    device_.write(tx_chunk_.data(), tx_chunk_.size());
  }
  indicator_.activity_off();
}
//-----------------------------------------------------------------------------
// Read one chunk from the device and hand it to the host untouched
void RelayLoop::relay_device_to_host(){
  indicator_.activity_on();
  indicator_.set_state(ACTIVITY_DEVICE);
  size_t want = (size_t)device_.available();
  if(want > RELAY_MAX_CHUNK){
    want = RELAY_MAX_CHUNK;
  }
  rx_chunk_.resize(want);
  size_t got = device_.read(rx_chunk_.data(), want);
  if(got > 0){
    host_->write(rx_chunk_.data(), got);
  }
  indicator_.activity_off();
}

} // namespace passthrough
