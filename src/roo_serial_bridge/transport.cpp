#include "roo_serial_bridge/transport.h"

#include "roo_logging.h"
#include "roo_serial_bridge/connection_manager.h"

#if !defined(MLOG_roo_serial_bridge_transport)
#define MLOG_roo_serial_bridge_transport 0
#endif

namespace roo_serial_bridge {

Transport::Transport(ConnectionManager& manager, Device& device,
                     std::shared_ptr<Protocol> protocol,
                     const TransportOptions& options)
    : manager_(manager),
      device_(&device),
      protocol_(protocol),
      reader_(device.getReader()),
      writer_(device.getWriter()),
      reader_released_(false),
      writer_released_(false),
      write_queue_(),
      pumps_stopped_(std::make_shared<roo::latch>(2)),
      closing_(false),
      chunks_written_(0),
      bytes_written_(0),
      chunks_received_(0),
      bytes_received_(0) {
  CHECK(protocol != nullptr);
  CHECK(reader_ != nullptr) << "The device is not open, or its readable side "
                               "is already locked";
  CHECK(writer_ != nullptr) << "The device is not open, or its writable side "
                               "is already locked";
  roo::thread::attributes reader_attrs;
  reader_attrs.set_name(options.reader_thread_name);
  reader_attrs.set_stack_size(options.pump_stack_size);
  reader_thread_ =
      roo::thread(reader_attrs, [this, protocol]() { readLoop(protocol); });

  roo::thread::attributes writer_attrs;
  writer_attrs.set_name(options.writer_thread_name);
  writer_attrs.set_stack_size(options.pump_stack_size);
  writer_thread_ = roo::thread(writer_attrs, [this]() { writeLoop(); });
}

Transport::~Transport() {
  if (shutdown(kNotClosed, roo_io::kOk)) {
    LOG(ERROR) << "Transport was not closed!";
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
}

void Transport::write(const roo::byte* data, size_t len) {
  write(Bytes(data, data + len));
}

void Transport::write(Bytes data) {
  if (data.empty()) return;
  if (!write_queue_.push(std::move(data))) {
    MLOG(roo_serial_bridge_transport)
        << "Dropping write to a transport that is shutting down";
  }
}

void Transport::setConsumer(std::shared_ptr<Protocol> protocol) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (closing_) {
    MLOG(roo_serial_bridge_transport)
        << "Ignoring consumer change on a transport that is shutting down";
    return;
  }
  protocol_ = std::move(protocol);
}

Protocol& Transport::getConsumer() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  CHECK(protocol_ != nullptr) << "Transport has already been shut down";
  return *protocol_;
}

bool Transport::isClosing() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return closing_;
}

void Transport::close() { shutdown(kOk, roo_io::kOk); }

std::shared_ptr<Protocol> Transport::consumer() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return protocol_;
}

void Transport::readLoop(std::shared_ptr<Protocol> protocol) {
  protocol->connectionMade(*this);
  protocol.reset();
  Bytes chunk;
  while (true) {
    chunk.clear();
    roo_io::Status status = reader_->read(chunk);
    if (status == roo_io::kOk) {
      if (chunk.empty()) continue;
      std::shared_ptr<Protocol> consumer = this->consumer();
      if (consumer == nullptr) break;
      ++chunks_received_;
      bytes_received_ += chunk.size();
      consumer->dataReceived(chunk.data(), chunk.size());
      continue;
    }
    if (status == roo_io::kEndOfStream) {
      MLOG(roo_serial_bridge_transport) << "Device signaled end of stream";
      shutdown(kPeerClosed, roo_io::kEndOfStream);
      break;
    }
    // Released by shutdown(), or failed.
    if (!isClosing()) {
      LOG(WARNING) << "Serial read failed: " << status;
      shutdown(kReadError, status);
    }
    break;
  }
  pumps_stopped_->count_down();
}

void Transport::writeLoop() {
  Bytes chunk;
  while (write_queue_.pop(chunk)) {
    roo_io::Status status = writer_->write(chunk.data(), chunk.size());
    if (status != roo_io::kOk) {
      if (!isClosing()) {
        LOG(WARNING) << "Serial write failed: " << status;
        shutdown(kWriteError, status);
      }
      break;
    }
    ++chunks_written_;
    bytes_written_ += chunk.size();
  }
  pumps_stopped_->count_down();
}

bool Transport::shutdown(Status status, roo_io::Status device_status) {
  Device* device;
  std::shared_ptr<Protocol> protocol;
  {
    roo::lock_guard<roo::mutex> guard(mutex_);
    if (closing_) return false;
    closing_ = true;
    // Stops the outbound pump.
    write_queue_.close();
    // Stops the inbound pump, by waking up its pending read.
    if (!reader_released_) {
      reader_->release();
      reader_released_ = true;
    }
    if (!writer_released_) {
      writer_->release();
      writer_released_ = true;
    }
    device = device_;
    device_ = nullptr;
    protocol = std::move(protocol_);
    protocol_ = nullptr;
  }
  MLOG(roo_serial_bridge_transport)
      << "Shutting down: " << status << " (" << device_status << ")";
  std::shared_ptr<roo::latch> pumps_stopped = pumps_stopped_;
  manager_.release(
      [device, pumps_stopped]() {
        pumps_stopped->wait();
        device->close();
      },
      [protocol, status, device_status]() {
        if (protocol != nullptr) {
          protocol->connectionLost(status, device_status);
        }
      });
  return true;
}

}  // namespace roo_serial_bridge
