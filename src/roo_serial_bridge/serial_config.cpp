#include "roo_serial_bridge/serial_config.h"

namespace roo_serial_bridge {

Status SerialConfig::validate() const {
  if (baud_rate == 0) return kInvalidArgument;
  return kOk;
}

SerialOptions SerialConfig::toOptions() const {
  SerialOptions options;
  options.baud_rate = baud_rate;
  options.flow_control = rtscts ? kFlowControlHardware : kFlowControlNone;
  return options;
}

}  // namespace roo_serial_bridge
