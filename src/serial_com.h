//-----------------------------------------------------------------------------
// File: serial_com.h
// Last edit: 19/10/2026
//-----------------------------------------------------------------------------
#ifndef SERIAL_COM_H
#define SERIAL_COM_H
#include <Arduino.h>
#include "config.h"
#include "serial_port.h"

//-----------------------------------------------------------------------------
#define CONSOLE_BAUDRATE 115200

//-----------------------------------------------------------------------------
void serial_init();
passthrough::HostPort *serial_open_host();
passthrough::ByteStream &serial_device();

//-----------------------------------------------------------------------------
#endif
