#pragma once

#include <functional>
#include <string>
#include <vector>

#include "roo_serial_bridge/protocol.h"
#include "roo_serial_bridge/transport.h"
#include "roo_threads.h"
#include "roo_threads/condition_variable.h"
#include "roo_threads/mutex.h"

namespace roo_serial_bridge {

// Protocol that records all the calls it receives.
class RecordingProtocol : public Protocol {
 public:
  RecordingProtocol() = default;

  void connectionMade(Transport& transport) override {
    std::function<void(Transport&)> on_made;
    {
      roo::lock_guard<roo::mutex> guard(mutex_);
      transport_ = &transport;
      ++made_count_;
      on_made = on_made_;
      changed_.notify_all();
    }
    if (on_made != nullptr) on_made(transport);
  }

  void dataReceived(const roo::byte* data, size_t len) override {
    roo::lock_guard<roo::mutex> guard(mutex_);
    if (!lost_.empty()) ++calls_after_lost_;
    received_.emplace_back((const char*)data, len);
    changed_.notify_all();
  }

  void connectionLost(Status status, roo_io::Status device_status) override {
    std::function<void(Status)> on_lost;
    {
      roo::lock_guard<roo::mutex> guard(mutex_);
      on_lost = on_lost_;
    }
    // Invoked before recording, so that awaitLost() returns after it is done.
    if (on_lost != nullptr) on_lost(status);
    roo::lock_guard<roo::mutex> guard(mutex_);
    lost_.push_back(status);
    device_statuses_.push_back(device_status);
    changed_.notify_all();
  }

  void setOnMade(std::function<void(Transport&)> on_made) {
    roo::lock_guard<roo::mutex> guard(mutex_);
    on_made_ = std::move(on_made);
  }

  void setOnLost(std::function<void(Status)> on_lost) {
    roo::lock_guard<roo::mutex> guard(mutex_);
    on_lost_ = std::move(on_lost);
  }

  void awaitMade() const {
    roo::unique_lock<roo::mutex> guard(mutex_);
    while (made_count_ == 0) changed_.wait(guard);
  }

  void awaitReceived(size_t count) const {
    roo::unique_lock<roo::mutex> guard(mutex_);
    while (received_.size() < count) changed_.wait(guard);
  }

  void awaitLost() const {
    roo::unique_lock<roo::mutex> guard(mutex_);
    while (lost_.empty()) changed_.wait(guard);
  }

  int made_count() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return made_count_;
  }

  Transport* transport() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return transport_;
  }

  std::vector<std::string> received() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return received_;
  }

  std::vector<Status> lost() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return lost_;
  }

  // Device statuses passed to connectionLost(), in the order of the calls.
  std::vector<roo_io::Status> device_statuses() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return device_statuses_;
  }

  // Number of dataReceived() calls that came after connectionLost().
  int calls_after_lost() const {
    roo::lock_guard<roo::mutex> guard(mutex_);
    return calls_after_lost_;
  }

 private:
  mutable roo::mutex mutex_;
  mutable roo::condition_variable changed_;

  std::function<void(Transport&)> on_made_;
  std::function<void(Status)> on_lost_;

  Transport* transport_ = nullptr;
  int made_count_ = 0;
  int calls_after_lost_ = 0;
  std::vector<std::string> received_;
  std::vector<Status> lost_;
  std::vector<roo_io::Status> device_statuses_;
};

}  // namespace roo_serial_bridge
