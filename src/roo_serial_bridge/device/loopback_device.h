#pragma once

#include <deque>

#include "roo_serial_bridge/device/device.h"
#include "roo_threads.h"
#include "roo_threads/condition_variable.h"
#include "roo_threads/mutex.h"

namespace roo_serial_bridge {

// In-memory device that echoes back everything written to it. Each write is
// delivered to the reader as a single chunk.
class LoopbackDevice : public Device {
 public:
  LoopbackDevice();

  roo_io::Status open(const SerialOptions& options) override;

  std::unique_ptr<DeviceReader> getReader() override;

  std::unique_ptr<DeviceWriter> getWriter() override;

  void close() override;

  // Makes the reader report end-of-stream, once it has consumed all the data
  // written so far.
  void endOfStream();

  // Makes the next call to open() fail with the specified status.
  void failNextOpen(roo_io::Status status);

  bool isOpen() const;

  // Returns the options passed to the most recent successful open().
  SerialOptions options() const;

 private:
  class Reader;
  class Writer;

  roo_io::Status read(uint32_t lease, Bytes& data);
  roo_io::Status write(uint32_t lease, const roo::byte* data, size_t len);
  void releaseReader(uint32_t lease);
  void releaseWriter(uint32_t lease);

  mutable roo::mutex mutex_;
  roo::condition_variable readable_;

  bool open_;
  SerialOptions options_;
  roo_io::Status next_open_status_;
  bool end_of_stream_;
  std::deque<Bytes> pending_;

  // Lease of the current reader (resp. writer), or zero if not locked.
  uint32_t reader_lease_;
  uint32_t writer_lease_;
  uint32_t next_lease_;
};

}  // namespace roo_serial_bridge
