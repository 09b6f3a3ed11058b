// ============================================================================
// status.cpp: implementation for status.hpp
// ============================================================================

#include "rn2903/status.hpp"

#include <stdio.h>   // snprintf for describe()

namespace rn2903 {

bool is_transport_failure(StatusCode code) {
  return code == StatusCode::Timeout || code == StatusCode::IoFailure;
}

const char* to_string(StatusCode code) {
  switch (code) {
    case StatusCode::Ok:                 return "ok";
    case StatusCode::Timeout:            return "timeout";
    case StatusCode::IoFailure:          return "io_failure";
    case StatusCode::DeviceError:        return "device_error";
    case StatusCode::BadResponse:        return "bad_response";
    case StatusCode::CannotPause:        return "cannot_pause";
    case StatusCode::CannotResume:       return "cannot_resume";
    case StatusCode::TransceiverBusy:    return "transceiver_busy";
    case StatusCode::RadioInFlight:      return "radio_in_flight";
    case StatusCode::NetworkStackPaused: return "network_stack_paused";
    case StatusCode::InvalidAddress:     return "invalid_address";
    case StatusCode::InvalidArgument:    return "invalid_argument";
    case StatusCode::WrongDevice:        return "wrong_device";
  }
  return "unknown";
}

// Tokens match what the device prints, so logs line up with a serial capture.
const char* to_string(DeviceErrorKind kind) {
  switch (kind) {
    case DeviceErrorKind::None:                     return "none";
    case DeviceErrorKind::InvalidParameter:         return "invalid_param";
    case DeviceErrorKind::InvalidCommand:           return "invalid_command";
    case DeviceErrorKind::NotJoined:                return "not_joined";
    case DeviceErrorKind::NoFreeChannel:            return "no_free_ch";
    case DeviceErrorKind::Silent:                   return "silent";
    case DeviceErrorKind::FrameCounterRejoinNeeded: return "frame_counter_err_rejoin_needed";
    case DeviceErrorKind::Busy:                     return "busy";
    case DeviceErrorKind::MacPaused:                return "mac_paused";
    case DeviceErrorKind::InvalidDataLength:        return "invalid_data_len";
    case DeviceErrorKind::KeysNotInitialized:       return "keys_not_init";
    case DeviceErrorKind::Denied:                   return "denied";
    case DeviceErrorKind::MacError:                 return "mac_err";
    case DeviceErrorKind::RadioError:               return "radio_err";
    case DeviceErrorKind::Unknown:                  return "unknown_err";
  }
  return "unknown_err";
}

const char* describe(const Status& st, char* buf, unsigned cap) {
  if (!buf || cap == 0) return "";
  if (st.device != DeviceErrorKind::None)
    snprintf(buf, cap, "%s:%s", to_string(st.code), to_string(st.device));
  else
    snprintf(buf, cap, "%s", to_string(st.code));
  return buf;
}

} // namespace rn2903
