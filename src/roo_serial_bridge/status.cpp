#include "roo_serial_bridge/status.h"

namespace roo_serial_bridge {

const char* StatusAsString(Status status) {
  switch (status) {
    case kOk:
      return "OK";
    case kPeerClosed:
      return "other side has closed";
    case kReadError:
      return "read error";
    case kWriteError:
      return "write error";
    case kNotClosed:
      return "transport was not closed";
    case kInvalidArgument:
      return "invalid argument";
    case kNoDevice:
      return "no device";
    case kOpenError:
      return "open error";
    default:
      return "unknown error";
  }
}

roo_logging::Stream& operator<<(roo_logging::Stream& s, Status status) {
  s << StatusAsString(status);
  return s;
}

}  // namespace roo_serial_bridge
