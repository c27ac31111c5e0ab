#pragma once

#include <atomic>
#include <memory>

#include "roo_backport.h"
#include "roo_backport/byte.h"
#include "roo_io/status.h"
#include "roo_serial_bridge/device/device.h"
#include "roo_serial_bridge/internal/outbound_queue.h"
#include "roo_serial_bridge/protocol.h"
#include "roo_serial_bridge/status.h"
#include "roo_threads.h"
#include "roo_threads/latch.h"
#include "roo_threads/mutex.h"
#include "roo_threads/thread.h"

#ifndef ROO_SERIAL_BRIDGE_PUMP_STACK_SIZE
#define ROO_SERIAL_BRIDGE_PUMP_STACK_SIZE 4096
#endif

namespace roo_serial_bridge {

class ConnectionManager;

struct TransportOptions {
  const char* reader_thread_name = "serial_rd";
  const char* writer_thread_name = "serial_wr";
  uint16_t pump_stack_size = ROO_SERIAL_BRIDGE_PUMP_STACK_SIZE;
};

// Adapts an open Device to the push-based Protocol contract.
//
// The transport owns the device's reader and writer, and runs two pump
// threads: the inbound pump reads chunks from the device and hands them to the
// protocol's dataReceived(); the outbound pump flushes chunks submitted via
// write() to the device, in order.
//
// The transport shuts down exactly once, on whichever happens first:
// * close() is called (reported as kOk),
// * a device write fails (kWriteError),
// * a device read fails (kReadError),
// * the device signals end-of-stream (kPeerClosed),
// * the transport is destroyed without having been closed (kNotClosed).
//
// Shutdown stops both pumps, releases the reader and the writer, and hands the
// device over to a closing task registered with the ConnectionManager. The
// protocol's connectionLost() is called once the device has been closed.
// Shutdown never blocks on the device close.
class Transport {
 public:
  // Acquires the reader and the writer of the (already open) device, and starts
  // the pumps. The protocol's connectionMade() is called from the inbound pump
  // thread, i.e. after the constructor returns.
  Transport(ConnectionManager& manager, Device& device,
            std::shared_ptr<Protocol> protocol,
            const TransportOptions& options = TransportOptions());

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  // Shuts down the transport, if not already closed, reporting kNotClosed to
  // the protocol. Waits for the pumps to exit. Must not be called from within
  // dataReceived() or connectionMade().
  ~Transport();

  // Enqueues the data to be written to the device, without blocking. Chunks are
  // written in the order of submission. After shutdown, the data is dropped.
  void write(const roo::byte* data, size_t len);

  void write(Bytes data);

  // Replaces the protocol receiving the subsequent callbacks. Ignored once the
  // transport has started shutting down.
  void setConsumer(std::shared_ptr<Protocol> protocol);

  // Returns the current protocol. Must not be called after the transport has
  // started shutting down.
  Protocol& getConsumer() const;

  // Returns true if the shutdown has been initiated. Once true, remains true.
  bool isClosing() const;

  // Initiates a clean shutdown. Calls after the first one, and calls made after
  // the transport has shut down for another reason, have no effect.
  void close();

  // Number of chunks (and bytes) that have been written to the device.
  uint32_t chunks_written() const { return chunks_written_; }
  uint64_t bytes_written() const { return bytes_written_; }

  // Number of chunks (and bytes) delivered to the protocol.
  uint32_t chunks_received() const { return chunks_received_; }
  uint64_t bytes_received() const { return bytes_received_; }

 private:
  void readLoop(std::shared_ptr<Protocol> protocol);
  void writeLoop();

  // Performs the shutdown transition. `device_status` is the device error
  // that caused it, if any, passed on to connectionLost(). Returns false if the
  // transport has already been shutting down, in which case it does nothing.
  bool shutdown(Status status, roo_io::Status device_status);

  // Returns the current protocol, or nullptr if shutting down.
  std::shared_ptr<Protocol> consumer() const;

  ConnectionManager& manager_;

  // Set to nullptr when the device gets handed over to the closing task.
  // GUARDED_BY(mutex_).
  Device* device_;

  // GUARDED_BY(mutex_).
  std::shared_ptr<Protocol> protocol_;

  std::unique_ptr<DeviceReader> reader_;
  std::unique_ptr<DeviceWriter> writer_;

  // GUARDED_BY(mutex_).
  bool reader_released_;

  // GUARDED_BY(mutex_).
  bool writer_released_;

  internal::OutboundQueue write_queue_;

  // Counted down by each pump as it exits.
  std::shared_ptr<roo::latch> pumps_stopped_;

  // GUARDED_BY(mutex_).
  bool closing_;

  std::atomic<uint32_t> chunks_written_;
  std::atomic<uint64_t> bytes_written_;
  std::atomic<uint32_t> chunks_received_;
  std::atomic<uint64_t> bytes_received_;

  mutable roo::mutex mutex_;

  roo::thread reader_thread_;
  roo::thread writer_thread_;
};

}  // namespace roo_serial_bridge
