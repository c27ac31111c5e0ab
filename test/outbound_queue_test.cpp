#include "roo_serial_bridge/internal/outbound_queue.h"

#include <string.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"
#include "roo_threads.h"
#include "roo_threads/thread.h"

namespace roo_serial_bridge {
namespace internal {

namespace {

Bytes Chunk(const char* str) {
  const roo::byte* begin = (const roo::byte*)str;
  return Bytes(begin, begin + strlen(str));
}

}  // namespace

TEST(OutboundQueue, Fifo) {
  OutboundQueue queue;
  EXPECT_TRUE(queue.push(Chunk("a")));
  EXPECT_TRUE(queue.push(Chunk("bc")));
  EXPECT_TRUE(queue.push(Chunk("def")));
  EXPECT_EQ(queue.size(), 3u);
  Bytes chunk;
  ASSERT_TRUE(queue.pop(chunk));
  EXPECT_EQ(chunk, Chunk("a"));
  ASSERT_TRUE(queue.pop(chunk));
  EXPECT_EQ(chunk, Chunk("bc"));
  ASSERT_TRUE(queue.pop(chunk));
  EXPECT_EQ(chunk, Chunk("def"));
  EXPECT_EQ(queue.size(), 0u);
}

TEST(OutboundQueue, PopBlocksUntilPush) {
  OutboundQueue queue;
  std::atomic<bool> popped(false);
  Bytes chunk;
  roo::thread consumer([&]() {
    EXPECT_TRUE(queue.pop(chunk));
    popped = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(popped);
  queue.push(Chunk("xyz"));
  consumer.join();
  EXPECT_TRUE(popped);
  EXPECT_EQ(chunk, Chunk("xyz"));
}

TEST(OutboundQueue, CloseWakesPop) {
  OutboundQueue queue;
  std::atomic<bool> result(true);
  roo::thread consumer([&]() {
    Bytes chunk;
    result = queue.pop(chunk);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();
  EXPECT_FALSE(result);
  EXPECT_TRUE(queue.closed());
}

TEST(OutboundQueue, PushAfterCloseIsRejected) {
  OutboundQueue queue;
  queue.close();
  EXPECT_FALSE(queue.push(Chunk("late")));
  EXPECT_EQ(queue.size(), 0u);
}

TEST(OutboundQueue, QueuedChunksNotReturnedAfterClose) {
  OutboundQueue queue;
  queue.push(Chunk("pending"));
  queue.close();
  Bytes chunk = Chunk("untouched");
  EXPECT_FALSE(queue.pop(chunk));
  EXPECT_EQ(chunk, Chunk("untouched"));
}

TEST(OutboundQueue, CloseIsIdempotent) {
  OutboundQueue queue;
  EXPECT_FALSE(queue.closed());
  queue.close();
  queue.close();
  EXPECT_TRUE(queue.closed());
}

}  // namespace internal
}  // namespace roo_serial_bridge
