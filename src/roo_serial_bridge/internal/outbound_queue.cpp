#include "roo_serial_bridge/internal/outbound_queue.h"

namespace roo_serial_bridge {
namespace internal {

bool OutboundQueue::push(Bytes chunk) {
  roo::lock_guard<roo::mutex> guard(mutex_);
  if (closed_) return false;
  chunks_.push_back(std::move(chunk));
  nonempty_.notify_all();
  return true;
}

bool OutboundQueue::pop(Bytes& chunk) {
  roo::unique_lock<roo::mutex> guard(mutex_);
  while (!closed_ && chunks_.empty()) {
    nonempty_.wait(guard);
  }
  if (closed_) return false;
  chunk = std::move(chunks_.front());
  chunks_.pop_front();
  return true;
}

void OutboundQueue::close() {
  roo::lock_guard<roo::mutex> guard(mutex_);
  closed_ = true;
  nonempty_.notify_all();
}

bool OutboundQueue::closed() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return closed_;
}

size_t OutboundQueue::size() const {
  roo::lock_guard<roo::mutex> guard(mutex_);
  return chunks_.size();
}

}  // namespace internal
}  // namespace roo_serial_bridge
