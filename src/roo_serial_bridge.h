#pragma once

#include "roo_serial_bridge/connection_manager.h"
#include "roo_serial_bridge/device/device.h"
#include "roo_serial_bridge/device/loopback_device.h"
#include "roo_serial_bridge/protocol.h"
#include "roo_serial_bridge/serial_config.h"
#include "roo_serial_bridge/status.h"
#include "roo_serial_bridge/transport.h"
