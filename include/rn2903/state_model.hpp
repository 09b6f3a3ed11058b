/**
 * @file state_model.hpp
 * @brief Local mirror of the two device modes that gate which commands are legal.
 *
 * @details
 * The RN2903 has two independent modes the host must track itself, because the
 * device only reports them indirectly (by refusing commands):
 *
 *  - network_stack_active: the LoRaWAN MAC owns the transceiver. Radio
 *    commands are only legal after `mac pause` succeeded; MAC commands are
 *    only legal while it is active. Starts true; `sys reset` and
 *    `sys factoryRESET` bring it back to true.
 *  - radio_operation_in_flight: a radio rx/tx has been issued and has not
 *    finished yet. While set, no other radio command may start.
 *
 * The checks are pure and run before any byte is written: a refused call
 * never touches the link. State changes only happen through the confirm_*
 * functions, which the driver calls after the device has confirmed.
 */
#pragma once
#include "rn2903/status.hpp"

namespace rn2903 {

struct DeviceState {
  bool network_stack_active{true};
  bool radio_operation_in_flight{false};
};

Status check_pause(const DeviceState& s);    ///< CannotPause when already paused
Status check_resume(const DeviceState& s);   ///< CannotResume when already active
Status check_radio(const DeviceState& s);    ///< TransceiverBusy / RadioInFlight
Status check_mac(const DeviceState& s);      ///< NetworkStackPaused

void confirm_paused(DeviceState& s);
void confirm_resumed(DeviceState& s);
void confirm_reset(DeviceState& s);

/**
 * @brief Scoped radio-operation marker.
 *
 * Sets radio_operation_in_flight on construction and clears it when the scope
 * ends, whatever path the operation returns through (success, device error,
 * timeout). A flag can therefore never outlive a failed rx/tx.
 */
class RadioFlight {
public:
  explicit RadioFlight(DeviceState& s) : s_(s) { s_.radio_operation_in_flight = true; }
  ~RadioFlight() { s_.radio_operation_in_flight = false; }

  RadioFlight(const RadioFlight&) = delete;
  RadioFlight& operator=(const RadioFlight&) = delete;

private:
  DeviceState& s_;
};

} // namespace rn2903
