/**
 * @file driver.hpp
 * @brief Typed RN2903 operations: one method per supported command.
 *
 * @details
 * PURPOSE
 * -------
 * `Driver` is the only API a caller needs. Each method has the same shape:
 *
 *   validate arguments -> check DeviceState -> build Command -> Engine::transact
 *   -> decode ClassifiedResponse -> typed value (out-param) + Status
 *
 * Callers never see raw device text unless they ask for it (`send_raw`).
 *
 * OWNERSHIP
 * ---------
 * The driver borrows an already-open transport::ITransport and assumes exclusive
 * use of it for its own lifetime. It never opens, reconfigures or closes the
 * link. One driver per link; calls are strictly sequential.
 *
 * STATE
 * -----
 * DeviceState is a cache of what the device last *confirmed*:
 *  - radio_* methods require the network stack paused (TransceiverBusy) and no
 *    other radio rx/tx running (RadioInFlight). Both are checked before any
 *    byte is written.
 *  - mac_get_* methods require the stack active (NetworkStackPaused).
 *  - mac_pause / mac_resume / resets update the cache only after the device
 *    answered with a success.
 * If a reply is lost, the cache can disagree with the device; the protocol has
 * no query for the pause state, so the driver does not try to repair it.
 *
 * ERRORS
 * ------
 * No exceptions. Every method returns Status; values go through out-params
 * which are written only on success. Nothing is logged, retried or swallowed.
 *
 * EXAMPLE
 * -------
 * @code
 *   rn2903::transport::LinuxSerial link;
 *   if (!link.open("/dev/ttyUSB0")) return 1;
 *   rn2903::Driver drv(link);
 *
 *   std::optional<uint32_t> pause_ms;
 *   if (!drv.mac_pause(pause_ms).ok()) return 1;
 *
 *   std::optional<rn2903::Packet> pkt;
 *   rn2903::Status st = drv.radio_rx(0, pkt);
 *   if (st.ok() && pkt) handle(*pkt);          // nullopt = nothing received
 *   drv.mac_resume();
 * @endcode
 */
#pragma once
#include <optional>
#include <stdint.h>

#include "rn2903/classifier.hpp"
#include "rn2903/commands.hpp"
#include "rn2903/engine.hpp"
#include "rn2903/state_model.hpp"
#include "rn2903/status.hpp"
#include "rn2903/types.hpp"
#include "rn2903/transport/transport_base.hpp"

namespace rn2903 {

static constexpr uint32_t RN2903_FREQ_MIN_HZ = 902000000;
static constexpr uint32_t RN2903_FREQ_MAX_HZ = 928000000;
static constexpr uint8_t  RN2903_SF_MIN      = 7;
static constexpr uint8_t  RN2903_SF_MAX      = 12;
static constexpr int8_t   RN2903_PWR_MIN     = 2;
static constexpr int8_t   RN2903_PWR_MAX     = 20;

/// Deadline for each kind of reply, in milliseconds.
struct DriverTimeouts {
  uint32_t command_ms{1000};   ///< ordinary request/response
  uint32_t reset_ms{3000};     ///< reboot banner after sys reset / factoryRESET
  uint32_t rx_ms{15000};       ///< second line of radio rx
  uint32_t tx_ms{10000};       ///< second line of radio tx
};

class Driver {
public:
  explicit Driver(transport::ITransport& link, const DriverTimeouts& timeouts = DriverTimeouts{})
    : engine_(link), timeouts_(timeouts) {}

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  // ----------------------------- sys -----------------------------

  /// `sys get ver`, then require an "RN2903" banner (WrongDevice otherwise).
  Status verify_device(LineStr& version);

  /// Whole version line. Anything but a value reply is BadResponse.
  Status system_version_bytes(LineStr& version);

  /**
   * @brief `sys factoryRESET` / `sys reset`.
   *
   * The module reboots and prints its banner. `ok` or a line starting with
   * "RN2903" is success, and DeviceState returns to its boot defaults. The
   * link itself is not re-initialized here.
   */
  Status system_factory_reset();
  Status system_module_reset();

  Status system_get_nvm(NvmAddress addr, uint8_t& value);
  Status system_set_nvm(NvmAddress addr, uint8_t value);

  /// `sys set pindig GPIOn 0|1`. InvalidArgument for pins above GPIO14.
  Status system_set_pin_digital(uint8_t gpio, bool high);

  Status system_get_vdd(uint16_t& millivolts);
  Status system_get_hweui(uint64_t& eui);

  // ----------------------------- mac -----------------------------

  /**
   * @brief Suspend the LoRaWAN stack so radio commands become legal.
   * @param duration_ms Device-reported pause length when it sent one.
   * @return Ok; CannotPause when already paused (no I/O), when the device
   *         reports a zero duration, or when it answers with an error token
   *         (kind preserved in Status::device).
   */
  Status mac_pause(std::optional<uint32_t>& duration_ms);

  /// Give the transceiver back to the stack. CannotResume mirrors mac_pause.
  Status mac_resume();

  Status mac_get_status(uint32_t& status_word);
  Status mac_get_deveui(uint64_t& eui);

  // ---------------------------- radio ----------------------------

  Status radio_set_modulation_mode(ModulationMode mode);
  Status radio_get_modulation_mode(ModulationMode& mode);
  Status radio_set_frequency(uint32_t hz);
  Status radio_get_frequency(uint32_t& hz);
  Status radio_set_spreading_factor(uint8_t sf);
  Status radio_set_power(int8_t dbm);
  Status radio_set_watchdog(uint32_t ms);

  /**
   * @brief `radio rx <window>` and wait for the reception outcome.
   *
   * @p packet is std::nullopt when the device reports `radio_err` (window
   * closed without data). That is a normal polling result, not an error.
   * radio_operation_in_flight is set for the duration of the call and cleared
   * on every exit path.
   */
  Status radio_rx(uint16_t window, std::optional<Packet>& packet);
  Status radio_rx(uint16_t window, uint32_t timeout_ms, std::optional<Packet>& packet);

  /// `radio tx <hex>`; 1..255 bytes. `radio_err` completion is DeviceError(RadioError).
  Status radio_tx(const Packet& packet);

  // ---------------------------- misc -----------------------------

  /// Send one arbitrary command line. Does not consult or update DeviceState.
  Status send_raw(const char* text, Expect expect, ClassifiedResponse& out);

  const DeviceState&    state() const    { return state_; }
  const DriverTimeouts& timeouts() const { return timeouts_; }

  void set_trace(TraceFn fn, void* ctx) { engine_.set_trace(fn, ctx); }

private:
  Status ack(const Command& cmd);
  Status value(const Command& cmd, ClassifiedResponse& out);
  Status reset(const Command& cmd);

  Engine         engine_;
  DeviceState    state_;
  DriverTimeouts timeouts_;
};

} // namespace rn2903
