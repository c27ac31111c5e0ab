#include "roo_serial_bridge/connection_manager.h"

#include "roo_logging.h"

#if !defined(MLOG_roo_serial_bridge_device_close)
#define MLOG_roo_serial_bridge_device_close 0
#endif

namespace roo_serial_bridge {

ConnectionManager::ConnectionManager()
    : device_(nullptr), opening_(false), next_close_id_(1) {}

ConnectionManager::ConnectionManager(Device& device) : ConnectionManager() {
  device_ = &device;
}

ConnectionManager::~ConnectionManager() {
  roo::unique_lock<roo::mutex> guard(mutex_);
  while (true) {
    reapFinishedTasks();
    if (tasks_.empty()) break;
    changed_.wait(guard);
  }
}

void ConnectionManager::setDevice(Device& device) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  device_ = &device;
}

Device* ConnectionManager::device() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return device_;
}

size_t ConnectionManager::closing_count() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return closing_.size();
}

size_t ConnectionManager::thread_count() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return tasks_.size();
}

void ConnectionManager::awaitDrain() {
  roo::unique_lock<roo::mutex> guard(mutex_);
  while (closing_.size() > 0) {
    MLOG(roo_serial_bridge_device_close)
        << "Waiting for " << closing_.size() << " serial port(s) to close";
    changed_.wait(guard);
  }
  reapFinishedTasks();
}

Status ConnectionManager::acquire(const SerialOptions& options,
                                  Device*& device,
                                  roo_io::Status& open_status) {
  device = nullptr;
  {
    roo::unique_lock<roo::mutex> guard(mutex_);
    bool warned = false;
    while (opening_ || closing_.size() > 0) {
      if (closing_.size() > 0 && !warned) {
        warned = true;
        LOG(WARNING) << "Serial connection was not closed before a new one was "
                        "opened! Waiting before opening a new one.";
      }
      changed_.wait(guard);
    }
    reapFinishedTasks();
    if (device_ == nullptr) {
      open_status = roo_io::kOk;
      return kNoDevice;
    }
    device = device_;
    opening_ = true;
  }
  open_status = device->open(options);
  {
    roo::lock_guard<roo::mutex> guard(mutex_);
    opening_ = false;
    changed_.notify_all();
  }
  if (open_status != roo_io::kOk) {
    LOG(WARNING) << "Failed to open the serial device: " << open_status;
    device = nullptr;
    return kOpenError;
  }
  return kOk;
}

ConnectionManager::Connection ConnectionManager::createConnection(
    const ProtocolFactory& protocol_factory, const SerialConfig& config,
    const TransportOptions& options) {
  Connection connection;
  connection.status = config.validate();
  if (connection.status != kOk) return connection;
  Device* device;
  connection.status =
      acquire(config.toOptions(), device, connection.open_status);
  if (connection.status != kOk) return connection;
  connection.protocol = protocol_factory();
  connection.transport.reset(
      new Transport(*this, *device, connection.protocol, options));
  return connection;
}

void ConnectionManager::release(std::function<void()> close_fn,
                                std::function<void()> closed_fn) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  reapFinishedTasks();
  std::unique_ptr<ClosingTask> task(new ClosingTask());
  task->id = next_close_id_++;
  task->finished = false;
  ClosingTask* task_ptr = task.get();
  closing_.insert({task->id, roo_time::Uptime::Now()});
  roo::thread::attributes attrs;
  attrs.set_name("serial_close");
  attrs.set_stack_size(ROO_SERIAL_BRIDGE_CLOSE_STACK_SIZE);
  // The thread blocks on mutex_ (held here) before touching its task.
  task->thread = roo::thread(
      attrs, [this, task_ptr, close_fn, closed_fn]() mutable {
        runClose(task_ptr, close_fn, closed_fn);
      });
  tasks_.push_back(std::move(task));
}

void ConnectionManager::runClose(ClosingTask* task,
                                 std::function<void()>& close_fn,
                                 std::function<void()>& closed_fn) {
  // Take over the closures, so that whatever they hold (e.g. the last
  // reference to the protocol) gets destroyed before the task is marked as
  // finished.
  std::function<void()> close;
  std::function<void()> closed;
  close.swap(close_fn);
  closed.swap(closed_fn);
  uint32_t id;
  {
    roo::lock_guard<roo::mutex> guard(mutex_);
    id = task->id;
  }
  MLOG(roo_serial_bridge_device_close) << "Closing serial port";
  close();
  close = nullptr;
  {
    roo::lock_guard<roo::mutex> guard(mutex_);
    auto it = closing_.find(id);
    if (it != closing_.end()) {
      MLOG(roo_serial_bridge_device_close)
          << "Closed serial port in "
          << (roo_time::Uptime::Now() - it->second).inMicros() / 1000 << " ms";
      closing_.erase(it);
    }
    changed_.notify_all();
  }
  closed();
  closed = nullptr;
  {
    roo::lock_guard<roo::mutex> guard(mutex_);
    task->finished = true;
    changed_.notify_all();
  }
}

void ConnectionManager::reapFinishedTasks() {
  auto it = tasks_.begin();
  while (it != tasks_.end()) {
    if ((*it)->finished) {
      if ((*it)->thread.joinable()) {
        (*it)->thread.join();
      }
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace roo_serial_bridge
