#pragma once

#include <functional>
#include <memory>

#include "roo_backport.h"
#include "roo_backport/byte.h"
#include "roo_io/status.h"
#include "roo_serial_bridge/status.h"

namespace roo_serial_bridge {

class Transport;

// Consumer of a transport. Receives the bytes read from the device, and gets
// notified about the connection lifecycle.
//
// All methods are called from threads owned by the transport (or, in case of
// connectionLost(), by the ConnectionManager). connectionMade() is called
// exactly once, before any other method. connectionLost() is called exactly
// once, after the device has been closed; no other method is called after it.
class Protocol {
 public:
  virtual ~Protocol() = default;

  virtual void connectionMade(Transport& transport) {}

  // Called for every chunk read from the device, in the order of arrival.
  virtual void dataReceived(const roo::byte* data, size_t len) = 0;

  // Called when the connection has been shut down. The status is kOk if the
  // transport has been closed by its owner; otherwise, it indicates the reason.
  // `device_status` is the status returned by the failed device read or write
  // (for kReadError and kWriteError), kEndOfStream for kPeerClosed, and kOk
  // otherwise.
  virtual void connectionLost(Status status, roo_io::Status device_status) {}
};

class SimpleProtocol : public Protocol {
 public:
  using MadeFn = std::function<void(Transport& transport)>;
  using DataFn = std::function<void(const roo::byte* data, size_t len)>;
  using LostFn =
      std::function<void(Status status, roo_io::Status device_status)>;

  explicit SimpleProtocol(DataFn data_fn, MadeFn made_fn = nullptr,
                          LostFn lost_fn = nullptr)
      : made_fn_(std::move(made_fn)),
        data_fn_(std::move(data_fn)),
        lost_fn_(std::move(lost_fn)) {}

  void connectionMade(Transport& transport) override {
    if (made_fn_ != nullptr) made_fn_(transport);
  }

  void dataReceived(const roo::byte* data, size_t len) override {
    data_fn_(data, len);
  }

  void connectionLost(Status status, roo_io::Status device_status) override {
    if (lost_fn_ != nullptr) lost_fn_(status, device_status);
  }

 private:
  MadeFn made_fn_;
  DataFn data_fn_;
  LostFn lost_fn_;
};

using ProtocolFactory = std::function<std::shared_ptr<Protocol>()>;

}  // namespace roo_serial_bridge
