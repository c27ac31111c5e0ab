#pragma once

#include "roo_logging.h"

namespace roo_serial_bridge {

enum Status {
  // No error. Reported to Protocol::connectionLost() when the transport has
  // been closed by its owner.
  kOk = 0,

  // The device signaled end-of-stream.
  kPeerClosed,

  // Reading from the device failed.
  kReadError,

  // Writing to the device failed.
  kWriteError,

  // The transport has been destroyed without being closed first.
  kNotClosed,

  // The connection parameters are malformed (e.g. non-positive baud rate).
  kInvalidArgument,

  // No device has been designated for new connections.
  kNoDevice,

  // The device refused to open.
  kOpenError,
};

const char* StatusAsString(Status status);

roo_logging::Stream& operator<<(roo_logging::Stream& s, Status status);

}  // namespace roo_serial_bridge
