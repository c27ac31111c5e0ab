// This example opens a connection to an in-memory loopback device, writes a
// few messages, and prints them back as they are echoed by the device. It then
// closes the connection, and waits for the device to be released.

#include <string>

#include "roo_logging.h"
#include "roo_serial_bridge.h"
#include "roo_threads.h"
#include "roo_threads/latch.h"

using namespace roo_serial_bridge;

static const char* kMessages[] = {"Hello", "serial", "world!"};
static const int kMessageCount = 3;

int main(int argc, char** argv) {
  LoopbackDevice device;
  ConnectionManager manager(device);

  roo::latch all_received(kMessageCount);
  roo::latch lost(1);

  SerialConfig config(115200);
  ConnectionManager::Connection connection = manager.createConnection(
      [&]() {
        return std::make_shared<SimpleProtocol>(
            [&](const roo::byte* data, size_t len) {
              LOG(INFO) << "Received: "
                        << std::string((const char*)data, len);
              all_received.count_down();
            },
            [](Transport& transport) { LOG(INFO) << "Connection made"; },
            [&](Status status, roo_io::Status device_status) {
              LOG(INFO) << "Connection lost: " << status << " ("
                        << device_status << ")";
              lost.count_down();
            });
      },
      config);
  if (connection.status != kOk) {
    LOG(ERROR) << "Failed to connect: " << connection.status;
    return 1;
  }

  for (int i = 0; i < kMessageCount; ++i) {
    std::string msg = kMessages[i];
    connection.transport->write((const roo::byte*)msg.data(), msg.size());
  }
  all_received.wait();

  connection.transport->close();
  lost.wait();
  LOG(INFO) << "Bytes written: " << connection.transport->bytes_written()
            << ", received: " << connection.transport->bytes_received();
  manager.awaitDrain();
  return 0;
}
