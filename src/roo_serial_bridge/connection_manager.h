#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "roo_collections.h"
#include "roo_collections/flat_small_hash_map.h"
#include "roo_io/status.h"
#include "roo_serial_bridge/device/device.h"
#include "roo_serial_bridge/protocol.h"
#include "roo_serial_bridge/serial_config.h"
#include "roo_serial_bridge/status.h"
#include "roo_serial_bridge/transport.h"
#include "roo_threads.h"
#include "roo_threads/condition_variable.h"
#include "roo_threads/mutex.h"
#include "roo_threads/thread.h"
#include "roo_time.h"

#ifndef ROO_SERIAL_BRIDGE_CLOSE_STACK_SIZE
#define ROO_SERIAL_BRIDGE_CLOSE_STACK_SIZE 4096
#endif

namespace roo_serial_bridge {

// Hands out connections to a single designated device, making sure that at
// most one connection to it is opening or open at any given time.
//
// Transports that shut down register the closing of their device with the
// manager. A new connection is not opened until all such closes have
// completed.
//
// The manager must outlive all transports created through it. Its destructor
// waits for the outstanding closes to complete.
class ConnectionManager {
 public:
  struct Connection {
    // kOk if the connection has been established. Otherwise, one of
    // kInvalidArgument, kNoDevice, or kOpenError.
    Status status = kOk;

    // The status returned by Device::open(). Not kOk only when status is
    // kOpenError.
    roo_io::Status open_status = roo_io::kOk;

    // Both nullptr unless status is kOk.
    std::unique_ptr<Transport> transport;
    std::shared_ptr<Protocol> protocol;
  };

  ConnectionManager();

  explicit ConnectionManager(Device& device);

  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Designates the device to be used by subsequent connections.
  void setDevice(Device& device);

  // Returns the designated device, or nullptr if none has been set.
  Device* device() const;

  // Waits for outstanding device closes, opens the designated device, creates
  // the protocol using the factory, and wraps both in a new transport. If the
  // device fails to open, no protocol or transport is created.
  //
  // Blocks the caller while a device previously used by a transport is still
  // being closed.
  Connection createConnection(const ProtocolFactory& protocol_factory,
                              const SerialConfig& config,
                              const TransportOptions& options = TransportOptions());

  // Waits for outstanding device closes, and opens the designated device,
  // returning it in `device`. Returns kNoDevice if no device has been
  // designated, and kOpenError if the device failed to open, in which case
  // `open_status` is set to the error returned by the device. On failure,
  // `device` is set to nullptr.
  Status acquire(const SerialOptions& options, Device*& device,
                 roo_io::Status& open_status);

  // Blocks until there are no outstanding device closes.
  void awaitDrain();

  // Registers a device close in progress. `close_fn` is called on a newly
  // created thread; it is expected to block until the device has been closed.
  // When it returns, the close is unregistered, and then `closed_fn` gets
  // called (on the same thread).
  void release(std::function<void()> close_fn,
               std::function<void()> closed_fn);

  // Returns the number of device closes still in progress.
  size_t closing_count() const;

  // Returns the number of closing threads that have not been joined yet.
  size_t thread_count() const;

 private:
  struct ClosingTask {
    uint32_t id;
    roo::thread thread;

    // Set once the task has returned from the user code and destroyed the
    // closures, so that the thread can be joined.
    bool finished;
  };

  // Runs on the closing task's thread. Leaves `close_fn` and `closed_fn`
  // empty.
  void runClose(ClosingTask* task, std::function<void()>& close_fn,
                std::function<void()>& closed_fn);

  // Joins the threads of finished closing tasks. Must hold mutex_.
  void reapFinishedTasks();

  // GUARDED_BY(mutex_).
  Device* device_;

  // True while a device is being opened.
  // GUARDED_BY(mutex_).
  bool opening_;

  // GUARDED_BY(mutex_).
  uint32_t next_close_id_;

  // Closes in progress, by close ID, mapped to the time the close has started.
  // GUARDED_BY(mutex_).
  roo_collections::FlatSmallHashMap<uint32_t, roo_time::Uptime> closing_;

  // GUARDED_BY(mutex_).
  std::vector<std::unique_ptr<ClosingTask>> tasks_;

  mutable roo::mutex mutex_;

  // Notified whenever a close completes, a closing task finishes, or an open
  // attempt completes.
  roo::condition_variable changed_;
};

}  // namespace roo_serial_bridge
