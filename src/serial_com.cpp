//-----------------------------------------------------------------------------
// File: serial_com.cpp
// Last modified: 19/10/2026
//-----------------------------------------------------------------------------
#include <Arduino.h>
#include "esp_log.h"
#include "serial_com.h"

// The host port is a TinyUSB CDC interface, it needs the USB-OTG mode.
// With the hardware CDC/JTAG mode there is no passthrough port to open.
#if !ARDUINO_USB_MODE && CONFIG_TINYUSB_CDC_ENABLED
#define HOST_USB_AVAILABLE 1
#include "USB.h"
#else
#define HOST_USB_AVAILABLE 0
#endif

static const char *TAG = "serial_com";

//-----------------------------------------------------------------------------
// Device side: the co-processor UART
class UartDevicePort : public passthrough::ByteStream {
public:
  explicit UartDevicePort(HardwareSerial &uart) : uart_(uart) {}
  int available(){ return uart_.available(); }
  size_t read(uint8_t *buf, size_t len){ return uart_.read(buf, len); }
  size_t write(const uint8_t *buf, size_t len){ return uart_.write(buf, len); }
private:
  HardwareSerial &uart_;
};

static UartDevicePort device_port(Serial1);

#if HOST_USB_AVAILABLE
//-----------------------------------------------------------------------------
// Host side: the USB CDC port the terminal program opens
class UsbHostPort : public passthrough::HostPort {
public:
  explicit UsbHostPort(USBCDC &cdc) : cdc_(cdc) {}
  bool connected(){ return (bool)cdc_; }
  int available(){ return cdc_.available(); }
  size_t read(uint8_t *buf, size_t len){ return cdc_.read(buf, len); }
  size_t write(const uint8_t *buf, size_t len){ return cdc_.write(buf, len); }
private:
  USBCDC &cdc_;
};

static USBCDC host_cdc;
static UsbHostPort host_port(host_cdc);
#endif

//-----------------------------------------------------------------------------
// Bring up the device UART, 128 bytes of buffer was not enough at 115200
void serial_init(){
  Serial1.setRxBufferSize(DEVICE_RX_BUFFER);
  Serial1.begin(DEVICE_BAUDRATE, SERIAL_8N1, DEVICE_RX_PIN, DEVICE_TX_PIN);
  Serial1.setTimeout(DEVICE_TIMEOUT_MS);
  ESP_LOGI(TAG, "device uart %d baud, rx %d tx %d", DEVICE_BAUDRATE, DEVICE_RX_PIN, DEVICE_TX_PIN);
}
//-----------------------------------------------------------------------------
// Returns NULL when the USB passthrough port can't be created
passthrough::HostPort *serial_open_host(){
#if HOST_USB_AVAILABLE
  host_cdc.begin();
  if(!USB.begin()){
    ESP_LOGE(TAG, "USB stack failed to start");
    return(NULL);
  }
  return(&host_port);
#else
  ESP_LOGE(TAG, "built without TinyUSB CDC, no host port");
  return(NULL);
#endif
}
//-----------------------------------------------------------------------------
passthrough::ByteStream &serial_device(){
  return(device_port);
}
