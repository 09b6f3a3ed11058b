/**
 * @file status.hpp
 * @brief Typed outcome of every driver call: status code plus device error category.
 *
 * @details
 * PURPOSE
 * -------
 * Nothing in the driver throws. Every fallible call returns a `Status` and hands its
 * domain value back through an out-parameter. The code says *where* it failed:
 *
 * | Group              | Codes                                                    |
 * |--------------------|----------------------------------------------------------|
 * | Transport failure  | Timeout, IoFailure                                       |
 * | Device rejected    | DeviceError (category in `device`)                       |
 * | Protocol mismatch  | BadResponse                                              |
 * | Local precondition | CannotPause, CannotResume, TransceiverBusy,              |
 * |                    | RadioInFlight, NetworkStackPaused                        |
 * | Local validation   | InvalidAddress, InvalidArgument                          |
 * | Identity           | WrongDevice                                              |
 *
 * Local precondition and validation codes are raised before any byte reaches the
 * serial link. Transport failures are reported as-is and never retried here.
 *
 * `to_string()` yields stable lowercase tokens (e.g. "timeout", "invalid_param")
 * so CLI output can be grepped by scripts.
 */
#pragma once
#include <stdint.h>

namespace rn2903 {

enum class StatusCode : uint8_t {
  Ok = 0,
  Timeout,             ///< no delimiter before the per-call deadline
  IoFailure,           ///< transport write/read error
  DeviceError,         ///< device understood and rejected the command
  BadResponse,         ///< reply did not match the shape expected for the command
  CannotPause,         ///< stack already paused, or device refused to pause
  CannotResume,        ///< stack already active, or device refused to resume
  TransceiverBusy,     ///< radio command while the network stack is active
  RadioInFlight,       ///< another radio rx/tx is still running on this driver
  NetworkStackPaused,  ///< MAC command while the network stack is paused
  InvalidAddress,      ///< NVM address outside the user range
  InvalidArgument,     ///< parameter rejected before formatting
  WrongDevice          ///< version banner is not an RN2903
};

/// Device-defined error categories (closed vocabulary, see classifier.hpp).
enum class DeviceErrorKind : uint8_t {
  None = 0,
  InvalidParameter,          // invalid_param
  InvalidCommand,            // invalid_command
  NotJoined,                 // not_joined
  NoFreeChannel,             // no_free_ch
  Silent,                    // silent
  FrameCounterRejoinNeeded,  // frame_counter_err_rejoin_needed
  Busy,                      // busy
  MacPaused,                 // mac_paused
  InvalidDataLength,         // invalid_data_len
  KeysNotInitialized,        // keys_not_init
  Denied,                    // denied
  MacError,                  // mac_err
  RadioError,                // radio_err
  Unknown                    // error-shaped token outside the vocabulary
};

struct Status {
  StatusCode      code{StatusCode::Ok};
  DeviceErrorKind device{DeviceErrorKind::None};

  bool ok() const { return code == StatusCode::Ok; }

  static Status success() { return Status{}; }

  static Status from(StatusCode c, DeviceErrorKind k = DeviceErrorKind::None) {
    Status s;
    s.code   = c;
    s.device = k;
    return s;
  }

  static Status device_error(DeviceErrorKind k) {
    return from(StatusCode::DeviceError, k);
  }
};

inline bool operator==(const Status& a, const Status& b) {
  return a.code == b.code && a.device == b.device;
}
inline bool operator!=(const Status& a, const Status& b) { return !(a == b); }

/// True for Timeout and IoFailure (the transport failure group).
bool is_transport_failure(StatusCode code);

const char* to_string(StatusCode code);
const char* to_string(DeviceErrorKind kind);

/// "device_error:invalid_param" for device errors, plain code token otherwise.
const char* describe(const Status& st, char* buf, unsigned cap);

} // namespace rn2903
