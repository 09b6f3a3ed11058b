// ============================================================================
// state_model.cpp: implementation for state_model.hpp
// ============================================================================

#include "rn2903/state_model.hpp"

namespace rn2903 {

Status check_pause(const DeviceState& s) {
  return s.network_stack_active ? Status::success()
                                : Status::from(StatusCode::CannotPause);
}

Status check_resume(const DeviceState& s) {
  return s.network_stack_active ? Status::from(StatusCode::CannotResume)
                                : Status::success();
}

Status check_radio(const DeviceState& s) {
  if (s.network_stack_active)      return Status::from(StatusCode::TransceiverBusy);
  if (s.radio_operation_in_flight) return Status::from(StatusCode::RadioInFlight);
  return Status::success();
}

Status check_mac(const DeviceState& s) {
  return s.network_stack_active ? Status::success()
                                : Status::from(StatusCode::NetworkStackPaused);
}

void confirm_paused(DeviceState& s)  { s.network_stack_active = false; }
void confirm_resumed(DeviceState& s) { s.network_stack_active = true; }

void confirm_reset(DeviceState& s) {
  s.network_stack_active      = true;
  s.radio_operation_in_flight = false;
}

} // namespace rn2903
