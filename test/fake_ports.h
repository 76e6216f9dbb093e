//-----------------------------------------------------------------------------
// File: fake_ports.h
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef FAKE_PORTS_H
#define FAKE_PORTS_H
#include <stdint.h>
#include <string.h>
#include <deque>
#include <string>
#include <vector>
#include "serial_port.h"
#include "status_indicator.h"

//-----------------------------------------------------------------------------
// In memory stream. Bytes queued with feed() come out of read(), every
// write() is kept as its own entry.
class FakeStream : public passthrough::ByteStream {
public:
  FakeStream() : short_reads(0) {}

  void feed(const std::string &bytes){
    rx.insert(rx.end(), bytes.begin(), bytes.end());
  }

  int available(){ return (int)rx.size(); }

  size_t read(uint8_t *buf, size_t len){
    if(short_reads > 0){
      short_reads--;
      return(0);
    }
    size_t n = len < rx.size() ? len : rx.size();
    for(size_t i = 0; i < n; i++){
      buf[i] = rx.front();
      rx.pop_front();
    }
    return(n);
  }

  size_t write(const uint8_t *buf, size_t len){
    writes.push_back(std::string((const char *)buf, len));
    return(len);
  }

  std::string written() const {
    std::string all;
    for(size_t i = 0; i < writes.size(); i++){
      all += writes[i];
    }
    return(all);
  }

  std::deque<uint8_t> rx;
  std::vector<std::string> writes;
  int short_reads;  // reads that return nothing despite available()
};

class FakeHost : public passthrough::HostPort {
public:
  FakeHost() : is_connected(true), connect_after(0), connected_checks(0) {}

  bool connected(){
    connected_checks++;
    if(connect_after > 0){
      connect_after--;
      return(false);
    }
    return(is_connected);
  }
  int available(){ return stream.available(); }
  size_t read(uint8_t *buf, size_t len){ return stream.read(buf, len); }
  size_t write(const uint8_t *buf, size_t len){ return stream.write(buf, len); }

  FakeStream stream;
  bool is_connected;
  int connect_after;  // connected() answers false this many times first
  int connected_checks;
};

//-----------------------------------------------------------------------------
class FakePixel : public passthrough::PixelOutput {
public:
  FakePixel() : fail(false), writes(0) { last.r = last.g = last.b = 0; }

  bool show(uint8_t r, uint8_t g, uint8_t b){
    writes++;
    if(fail){
      return(false);
    }
    last.r = r;
    last.g = g;
    last.b = b;
    return(true);
  }

  bool fail;
  int writes;
  passthrough::Rgb last;
};

class FakeLight : public passthrough::ActivityLight {
public:
  FakeLight() : on(false), toggles(0) {}
  void set(bool value){
    on = value;
    toggles++;
  }
  bool on;
  int toggles;
};

#endif
