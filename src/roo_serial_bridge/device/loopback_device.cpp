#include "roo_serial_bridge/device/loopback_device.h"

#include "roo_logging.h"

namespace roo_serial_bridge {

class LoopbackDevice::Reader : public DeviceReader {
 public:
  Reader(LoopbackDevice& device, uint32_t lease)
      : device_(device), lease_(lease) {}

  ~Reader() override { release(); }

  roo_io::Status read(Bytes& data) override {
    return device_.read(lease_, data);
  }

  void release() override { device_.releaseReader(lease_); }

 private:
  LoopbackDevice& device_;
  uint32_t lease_;
};

class LoopbackDevice::Writer : public DeviceWriter {
 public:
  Writer(LoopbackDevice& device, uint32_t lease)
      : device_(device), lease_(lease) {}

  ~Writer() override { release(); }

  roo_io::Status write(const roo::byte* data, size_t len) override {
    return device_.write(lease_, data, len);
  }

  void release() override { device_.releaseWriter(lease_); }

 private:
  LoopbackDevice& device_;
  uint32_t lease_;
};

LoopbackDevice::LoopbackDevice()
    : open_(false),
      options_{0, kFlowControlNone},
      next_open_status_(roo_io::kOk),
      end_of_stream_(false),
      pending_(),
      reader_lease_(0),
      writer_lease_(0),
      next_lease_(1) {}

roo_io::Status LoopbackDevice::open(const SerialOptions& options) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (next_open_status_ != roo_io::kOk) {
    roo_io::Status status = next_open_status_;
    next_open_status_ = roo_io::kOk;
    return status;
  }
  if (open_) {
    LOG(WARNING) << "LoopbackDevice: already open";
    return roo_io::kConnectionError;
  }
  open_ = true;
  options_ = options;
  end_of_stream_ = false;
  pending_.clear();
  return roo_io::kOk;
}

std::unique_ptr<DeviceReader> LoopbackDevice::getReader() {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (!open_ || reader_lease_ != 0) return nullptr;
  reader_lease_ = next_lease_++;
  return std::unique_ptr<DeviceReader>(new Reader(*this, reader_lease_));
}

std::unique_ptr<DeviceWriter> LoopbackDevice::getWriter() {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (!open_ || writer_lease_ != 0) return nullptr;
  writer_lease_ = next_lease_++;
  return std::unique_ptr<DeviceWriter>(new Writer(*this, writer_lease_));
}

void LoopbackDevice::close() {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (reader_lease_ != 0 || writer_lease_ != 0) {
    LOG(WARNING) << "LoopbackDevice: closing while the streams are locked";
  }
  open_ = false;
  reader_lease_ = 0;
  writer_lease_ = 0;
  pending_.clear();
  readable_.notify_all();
}

void LoopbackDevice::endOfStream() {
  roo::lock_guard<roo::mutex> guard(mutex_);
  end_of_stream_ = true;
  readable_.notify_all();
}

void LoopbackDevice::failNextOpen(roo_io::Status status) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  next_open_status_ = status;
}

bool LoopbackDevice::isOpen() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return open_;
}

SerialOptions LoopbackDevice::options() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return options_;
}

roo_io::Status LoopbackDevice::read(uint32_t lease, Bytes& data) {
  roo::unique_lock<roo::mutex> guard(mutex_);
  while (lease == reader_lease_ && pending_.empty() && !end_of_stream_) {
    readable_.wait(guard);
  }
  if (lease != reader_lease_) return roo_io::kClosed;
  if (!pending_.empty()) {
    data = std::move(pending_.front());
    pending_.pop_front();
    return roo_io::kOk;
  }
  return roo_io::kEndOfStream;
}

roo_io::Status LoopbackDevice::write(uint32_t lease, const roo::byte* data,
                                     size_t len) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (lease != writer_lease_) return roo_io::kClosed;
  pending_.emplace_back(data, data + len);
  readable_.notify_all();
  return roo_io::kOk;
}

void LoopbackDevice::releaseReader(uint32_t lease) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (lease != reader_lease_) return;
  reader_lease_ = 0;
  readable_.notify_all();
}

void LoopbackDevice::releaseWriter(uint32_t lease) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (lease != writer_lease_) return;
  writer_lease_ = 0;
}

}  // namespace roo_serial_bridge
