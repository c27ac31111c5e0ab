#pragma once

#include <deque>

#include "roo_serial_bridge/device/device.h"
#include "roo_threads.h"
#include "roo_threads/condition_variable.h"
#include "roo_threads/mutex.h"

namespace roo_serial_bridge {
namespace internal {

// Unbounded FIFO of chunks waiting to be written to the device. Any number of
// threads may push; a single consumer (the outbound pump) pops.
class OutboundQueue {
 public:
  OutboundQueue() : mutex_(), nonempty_(), chunks_(), closed_(false) {}

  // Appends the chunk at the end of the queue, never blocking. Returns false
  // (and drops the chunk) if the queue has been closed.
  bool push(Bytes chunk);

  // Blocks until a chunk is available, or until the queue gets closed. Returns
  // false if the queue has been closed, in which case `chunk` is left
  // unchanged. Chunks still queued at the time of closing are never returned.
  bool pop(Bytes& chunk);

  // Closes the queue, waking up a pending pop(). Idempotent.
  void close();

  bool closed() const;

  // Number of chunks queued but not yet popped.
  size_t size() const;

 private:
  mutable roo::mutex mutex_;
  roo::condition_variable nonempty_;
  std::deque<Bytes> chunks_;
  bool closed_;
};

}  // namespace internal
}  // namespace roo_serial_bridge
