#pragma once

#include <stdint.h>

#include <string>

#include "roo_serial_bridge/device/device.h"
#include "roo_serial_bridge/status.h"

namespace roo_serial_bridge {

enum Parity {
  kParityNone,
  kParityEven,
  kParityOdd,
};

enum StopBits {
  kStopBitsOne,
  kStopBitsTwo,
};

// Connection parameters, as supplied by the caller of
// ConnectionManager::createConnection().
//
// Only the baud rate and RTS/CTS flow control are passed on to the device. The
// remaining fields are accepted for compatibility with callers that set them,
// but have no effect.
struct SerialConfig {
  SerialConfig(uint32_t baud_rate = 0) : baud_rate(baud_rate) {}

  // Ignored; connections always use the device designated in the
  // ConnectionManager.
  std::string url;

  uint32_t baud_rate;

  // Ignored.
  Parity parity = kParityNone;

  // Ignored.
  StopBits stop_bits = kStopBitsOne;

  // Enables hardware flow control.
  bool rtscts = false;

  // Ignored.
  bool xonxoff = false;

  // Returns kOk if the configuration can be used to open a device, and
  // kInvalidArgument otherwise.
  Status validate() const;

  SerialOptions toOptions() const;
};

}  // namespace roo_serial_bridge
