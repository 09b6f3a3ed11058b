/**
 * @page rn2903-commands RN2903 Command Builders
 * @file commands.hpp
 * @brief Request builders: typed parameters in, one CR LF terminated command line out.
 *
 * @details
 * PURPOSE
 * -------
 * The RN2903 speaks a line-oriented ASCII protocol: space-separated tokens, one
 * command per line, every line ending in "\r\n". This header is the only place
 * that knows how each command is spelled. Everything above it (the driver, the
 * CLI dispatcher) deals in typed values; everything below it (the transaction
 * engine, the serial link) deals in bytes.
 *
 * WIRE CONVENTIONS
 * ----------------
 * - Families: `sys ...` (module), `mac ...` (network stack), `radio ...` (raw radio).
 * - Hex is lowercase with no "0x": NVM addresses ("300"), NVM bytes ("ab"),
 *   radio payloads ("48656c6c6f").
 * - Decimal everywhere else: frequency in Hz, power in dBm, rx window, watchdog ms.
 * - Spreading factor carries its own prefix: "radio set sf sf9".
 *
 * COMMAND OBJECT
 * --------------
 * A `Command` is built fresh for every call and never mutated afterwards: the
 * only constructor takes the body and appends the delimiter, and the class has
 * no setters. Builders are small, explicit free functions so the full
 * vocabulary is greppable in one file.
 *
 * EXAMPLE
 * -------
 * @code
 *   rn2903::NvmAddress addr;
 *   rn2903::NvmAddress::create(0x300, addr);
 *   auto cmd = rn2903::make_sys_set_nvm(addr, 0xAB);
 *   // cmd.c_str() == "sys set nvm 300 ab\r\n"
 * @endcode
 *
 * MAINTENANCE
 * -----------
 * - Keep builders explicit; do not collapse them into a generic formatter.
 * - Range checks that the device would also make (pin number, payload length)
 *   belong in the driver, before a builder is called.
 */
#pragma once
#include "etl/string.h"
#include <optional>
#include <stdint.h>
#include <stddef.h>

#include "rn2903/types.hpp"

namespace rn2903 {

/// Protocol line delimiter, appended to every command.
static constexpr const char* RN2903_DELIMITER = "\r\n";

/**
 * @brief One immutable protocol instruction, delimiter included.
 */
class Command {
public:
  using Text = etl::string<RN2903_COMMAND_MAX>;

  /// Take a command body (no delimiter) and seal it with CR LF.
  explicit Command(const etl::istring& body);

  const char*    c_str() const { return text_.c_str(); }
  const uint8_t* data()  const { return reinterpret_cast<const uint8_t*>(text_.data()); }
  size_t         size()  const { return text_.size(); }

  /// Length of the body without the trailing CR LF.
  size_t body_size() const { return text_.size() >= 2 ? text_.size() - 2 : 0; }

  const Text& text() const { return text_; }

private:
  Text text_;
};

// =============================== sys ===============================

Command make_sys_get_ver();                                    ///< sys get ver
Command make_sys_reset();                                      ///< sys reset
Command make_sys_factory_reset();                              ///< sys factoryRESET
Command make_sys_get_nvm(NvmAddress addr);                     ///< sys get nvm <addr>
Command make_sys_set_nvm(NvmAddress addr, uint8_t value);      ///< sys set nvm <addr> <byte>
Command make_sys_set_pindig(uint8_t gpio, bool high);          ///< sys set pindig GPIOn <0|1>
Command make_sys_get_vdd();                                    ///< sys get vdd
Command make_sys_get_hweui();                                  ///< sys get hweui

// =============================== mac ===============================

Command make_mac_pause();                                      ///< mac pause
Command make_mac_resume();                                     ///< mac resume
Command make_mac_get_status();                                 ///< mac get status
Command make_mac_get_deveui();                                 ///< mac get deveui

// ============================== radio ==============================

Command make_radio_set_mod(ModulationMode mode);               ///< radio set mod <lora|fsk>
Command make_radio_get_mod();                                  ///< radio get mod
Command make_radio_set_freq(uint32_t hz);                      ///< radio set freq <hz>
Command make_radio_get_freq();                                 ///< radio get freq
Command make_radio_set_sf(uint8_t sf);                         ///< radio set sf sf<n>
Command make_radio_set_pwr(int8_t dbm);                        ///< radio set pwr <dbm>
Command make_radio_set_wdt(uint32_t ms);                       ///< radio set wdt <ms>
Command make_radio_rx(uint16_t window);                        ///< radio rx <window>

/**
 * @brief radio tx <hex payload>.
 * @pre 1 <= packet.size() <= RN2903_PACKET_MAX (checked by the driver).
 */
Command make_radio_tx(const Packet& packet);

/**
 * @brief Wrap caller-supplied text as a command (escape hatch for unlisted commands).
 * @return std::nullopt if @p text is null, empty, contains CR or LF, or does not fit.
 */
std::optional<Command> make_raw(const char* text);

} // namespace rn2903
