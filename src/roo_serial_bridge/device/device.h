#pragma once

#include <stdint.h>

#include <memory>
#include <vector>

#include "roo_backport.h"
#include "roo_backport/byte.h"
#include "roo_io/status.h"

namespace roo_serial_bridge {

// A chunk of bytes, as returned by a single device read.
using Bytes = std::vector<roo::byte>;

enum FlowControl {
  // Device default.
  kFlowControlNone,

  // RTS/CTS.
  kFlowControlHardware,
};

// Parameters passed to Device::open().
struct SerialOptions {
  uint32_t baud_rate;
  FlowControl flow_control;
};

// Exclusive handle to the readable side of a device.
class DeviceReader {
 public:
  virtual ~DeviceReader() = default;

  // Blocks until the device delivers a chunk of data, signals end-of-stream, or
  // the reader gets released. Returns:
  // * kOk, with `data` holding the received chunk,
  // * kEndOfStream, if the device is done and no more data will arrive,
  // * kClosed, if the reader has been released (including while the read was
  //   pending),
  // * another error status, if the read failed.
  virtual roo_io::Status read(Bytes& data) = 0;

  // Releases the lock on the readable side, so that another reader can be
  // acquired. Wakes up a pending read(). Calling it more than once has no
  // effect.
  virtual void release() = 0;
};

// Exclusive handle to the writable side of a device.
class DeviceWriter {
 public:
  virtual ~DeviceWriter() = default;

  // Blocks until the data has been handed over to the device. Returns kOk on
  // success, kClosed if the writer has been released, and another error status
  // if the write failed.
  virtual roo_io::Status write(const roo::byte* data, size_t len) = 0;

  // Releases the lock on the writable side. Calling it more than once has no
  // effect.
  virtual void release() = 0;
};

// Bidirectional, chunked byte-stream device, such as a serial port. Each side
// can be locked by at most one reader (resp. writer) at a time.
class Device {
 public:
  virtual ~Device() = default;

  virtual roo_io::Status open(const SerialOptions& options) = 0;

  // Locks the readable side. Returns nullptr if it is already locked, or if the
  // device is not open.
  virtual std::unique_ptr<DeviceReader> getReader() = 0;

  // Locks the writable side. Returns nullptr if it is already locked, or if the
  // device is not open.
  virtual std::unique_ptr<DeviceWriter> getWriter() = 0;

  // Closes the device, blocking until it has been fully released. The reader
  // and the writer must have been released before.
  virtual void close() = 0;
};

}  // namespace roo_serial_bridge
