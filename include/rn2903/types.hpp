/**
 * @file types.hpp
 * @brief Value types shared by the command builders, the classifier and the driver.
 *
 * ## Capacities
 * The protocol core is heap-free: every buffer is an ETL fixed-capacity container
 * sized for the largest line the RN2903 can produce or accept.
 *
 * | Constant             | Value | Why                                              |
 * |----------------------|-------|--------------------------------------------------|
 * | RN2903_PACKET_MAX    | 255   | radio payload limit                              |
 * | RN2903_LINE_MAX      | 544   | "radio_rx  " + 510 hex digits, with headroom     |
 * | RN2903_COMMAND_MAX   | 544   | "radio tx " + 510 hex digits + CR LF             |
 *
 * ## NVM
 * The user-writable EEPROM window is 0x300..0x3FF. `NvmAddress::create()` is the
 * only way to obtain an address, so every address that reaches a command builder
 * is already known to be in range.
 */
#pragma once
#include "etl/string.h"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

#include "rn2903/status.hpp"

namespace rn2903 {

static constexpr size_t   RN2903_PACKET_MAX  = 255;
static constexpr size_t   RN2903_LINE_MAX    = 544;
static constexpr size_t   RN2903_COMMAND_MAX = 544;
static constexpr uint16_t RN2903_NVM_FIRST   = 0x300;
static constexpr uint16_t RN2903_NVM_LAST    = 0x3FF;
static constexpr uint8_t  RN2903_GPIO_MAX    = 14;     ///< GPIO0..GPIO14

/// One response line (delimiter stripped) or a value carried inside it.
using LineStr = etl::string<RN2903_LINE_MAX>;

/// One received or to-be-transmitted radio payload.
using Packet = etl::vector<uint8_t, RN2903_PACKET_MAX>;

/// Modulation schemes supported by the transceiver.
enum class ModulationMode : uint8_t { LoRa = 0, Fsk = 1 };

/// Wire token for a modulation mode ("lora" / "fsk").
const char* to_string(ModulationMode mode);

/// Parse the device's wire token (case-insensitive). false if unknown.
bool parse_modulation(const char* text, ModulationMode& out);

/**
 * @brief Validated address inside the user NVM window.
 *
 * Immutable once created. A default-constructed address points at the first
 * user byte so that no instance can ever hold an out-of-range value.
 */
class NvmAddress {
public:
  NvmAddress() = default;

  /**
   * @brief Validate @p raw and produce an address.
   * @return Ok, or InvalidAddress when @p raw is outside 0x300..0x3FF
   *         (@p out is left untouched in that case).
   */
  static Status create(uint16_t raw, NvmAddress& out);

  uint16_t value() const { return value_; }

  bool operator==(const NvmAddress& o) const { return value_ == o.value_; }
  bool operator!=(const NvmAddress& o) const { return value_ != o.value_; }

private:
  explicit NvmAddress(uint16_t v) : value_(v) {}

  uint16_t value_{RN2903_NVM_FIRST};
};

} // namespace rn2903
