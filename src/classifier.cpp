// ============================================================================
// classifier.cpp: implementation for classifier.hpp
// ============================================================================

#include "rn2903/classifier.hpp"

#include <string.h>   // memcmp, memchr, strlen

namespace rn2903 {

// ---------------------------------------------------------------------------
// Error vocabulary, as printed by RN2903 firmware 1.0.x.
// Lookup is linear; the table is small and fixed.
// ---------------------------------------------------------------------------
struct ErrorToken {
  const char*     token;
  DeviceErrorKind kind;
};

static const ErrorToken ERROR_TOKENS[] = {
  { "invalid_param",                   DeviceErrorKind::InvalidParameter },
  { "invalid_command",                 DeviceErrorKind::InvalidCommand },
  { "not_joined",                      DeviceErrorKind::NotJoined },
  { "no_free_ch",                      DeviceErrorKind::NoFreeChannel },
  { "silent",                          DeviceErrorKind::Silent },
  { "frame_counter_err_rejoin_needed", DeviceErrorKind::FrameCounterRejoinNeeded },
  { "busy",                            DeviceErrorKind::Busy },
  { "mac_paused",                      DeviceErrorKind::MacPaused },
  { "invalid_data_len",                DeviceErrorKind::InvalidDataLength },
  { "keys_not_init",                   DeviceErrorKind::KeysNotInitialized },
  { "denied",                          DeviceErrorKind::Denied },
  { "mac_err",                         DeviceErrorKind::MacError },
  { "radio_err",                       DeviceErrorKind::RadioError },
};

static bool equals(const char* s, size_t len, const char* lit) {
  const size_t n = strlen(lit);
  return n == len && memcmp(s, lit, n) == 0;
}

static bool starts_with(const char* s, size_t len, const char* lit) {
  const size_t n = strlen(lit);
  return len >= n && memcmp(s, lit, n) == 0;
}

static bool ends_with(const char* s, size_t len, const char* lit) {
  const size_t n = strlen(lit);
  return len >= n && memcmp(s + len - n, lit, n) == 0;
}

bool error_kind_from_token(const char* token, size_t len, DeviceErrorKind& out) {
  if (!token || len == 0) return false;

  // A line that begins with a known token is that error, whatever follows:
  // "invalid_param 0x12", "busy;", "radio_err\t". No table entry is a prefix
  // of another, so the first hit is the only one.
  for (const auto& e : ERROR_TOKENS) {
    if (starts_with(token, len, e.token)) { out = e.kind; return true; }
  }

  // Error-shaped but not in the table: a newer firmware or a sibling module.
  // Values never look like this: they are numbers, hex, "lora"/"fsk",
  // "radio_rx <data>", "radio_tx_ok" or the version banner.
  if (memchr(token, ' ', len)) return false;
  if (equals(token, len, "err") || ends_with(token, len, "_err") ||
      starts_with(token, len, "invalid_")) {
    out = DeviceErrorKind::Unknown;
    return true;
  }
  return false;
}

ClassifiedResponse classify(const char* line, size_t len, Expect expect) {
  ClassifiedResponse r;
  if (!line) len = 0;

  if (len == 0) {
    r.kind = ResponseKind::Unrecognized;          // nothing to interpret
    return r;
  }

  if (equals(line, len, RN2903_OK_TOKEN)) {
    r.kind = ResponseKind::Ok;
    return r;
  }

  // Keep the bytes whatever they turn out to be. Lines are bounded by the
  // engine's buffer, but clamp anyway so a direct caller cannot overflow.
  const size_t keep = len < r.text.capacity() ? len : r.text.capacity();
  r.text.assign(line, keep);

  DeviceErrorKind kind = DeviceErrorKind::None;
  if (error_kind_from_token(line, len, kind)) {
    r.kind  = ResponseKind::DeviceError;
    r.error = kind;
    return r;
  }

  r.kind = (expect == Expect::Value) ? ResponseKind::OkWithValue
                                     : ResponseKind::Unrecognized;
  return r;
}

const char* to_string(ResponseKind kind) {
  switch (kind) {
    case ResponseKind::Ok:           return "ok";
    case ResponseKind::OkWithValue:  return "ok_with_value";
    case ResponseKind::DeviceError:  return "device_error";
    case ResponseKind::Unrecognized: return "unrecognized";
  }
  return "unrecognized";
}

} // namespace rn2903
