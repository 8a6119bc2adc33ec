#pragma once

// AQSENSE - Register codec and drivers for low-cost air-quality sensors
//
// A header-only C++20 library describing hardware registers as bit-packed
// fields with pluggable encodings.
//
// Codec Features:
// - Declarative field, register and device descriptors validated at construction
// - Bit mask and shift handling, big and little endian fields
// - Unsigned, signed, flag, raw byte, lookup table and fixed-point encoders
// - OR-merging of fields that share bytes
//
// Access Features:
// - Transport-agnostic register accessors with a value cache
// - Read-only and write-only register accessors
// - Bounded retries that invalidate stale caches
//
// Drivers:
// - Bosch BMP280, Texas Instruments HDC1080, ScioSense CCS811 (I2C)
// - Senseair S8 (Modbus RTU), Plantower PMS7003 (serial)

// ====================
// Core
// ====================

#include "aqsense/core/endian.hpp"
#include "aqsense/core/error.hpp"
#include "aqsense/core/types.hpp"
#include "aqsense/core/value.hpp"
#include "aqsense/version.hpp"

// ====================
// Codec
// ====================

#include "aqsense/codec/device.hpp"
#include "aqsense/codec/encoder.hpp"
#include "aqsense/codec/field.hpp"
#include "aqsense/codec/register.hpp"

// ====================
// Register access
// ====================

#include "aqsense/access/device_api.hpp"
#include "aqsense/access/register_access.hpp"
#include "aqsense/access/retry.hpp"
#include "aqsense/access/transport.hpp"

// ====================
// Drivers
// ====================

#include "aqsense/sensors/bmp280.hpp"
#include "aqsense/sensors/ccs811.hpp"
#include "aqsense/sensors/hdc1080.hpp"
#include "aqsense/serial/modbus.hpp"
#include "aqsense/serial/pms7003.hpp"
#include "aqsense/serial/senseair_s8.hpp"
#include "aqsense/serial/serial_port.hpp"

// ====================
// Utilities
// ====================

#include "aqsense/utils/memory_transport.hpp"
