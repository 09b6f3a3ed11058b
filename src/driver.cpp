// ============================================================================
// driver.cpp: implementation for driver.hpp
// ============================================================================

#include "rn2903/driver.hpp"

#include <string.h>   // memcmp, strlen

#include "rn2903/hex.hpp"

namespace rn2903 {

static constexpr const char* VERSION_PREFIX = "RN2903";
static constexpr const char* RX_PREFIX      = "radio_rx";
static constexpr const char* TX_DONE        = "radio_tx_ok";

static bool starts_with(const etl::istring& s, const char* lit) {
  const size_t n = strlen(lit);
  return s.size() >= n && memcmp(s.data(), lit, n) == 0;
}

static bool equals(const etl::istring& s, const char* lit) {
  const size_t n = strlen(lit);
  return s.size() == n && memcmp(s.data(), lit, n) == 0;
}

// ---------------------------------------------------------------------------
// Response shape helpers
// ---------------------------------------------------------------------------

// `ok` required. Device errors keep their kind; anything else is BadResponse.
static Status expect_ok(const ClassifiedResponse& r) {
  if (r.is(ResponseKind::Ok))          return Status::success();
  if (r.is(ResponseKind::DeviceError)) return Status::device_error(r.error);
  return Status::from(StatusCode::BadResponse);
}

static Status expect_value(const ClassifiedResponse& r) {
  if (r.is(ResponseKind::OkWithValue)) return Status::success();
  if (r.is(ResponseKind::DeviceError)) return Status::device_error(r.error);
  return Status::from(StatusCode::BadResponse);
}

// "radio_rx <hex>" -> bytes. The firmware pads with one or two spaces.
static bool decode_rx_payload(const etl::istring& text, Packet& out) {
  const size_t n = strlen(RX_PREFIX);
  if (text.size() <= n || text[n] != ' ') return false;
  size_t i = n;
  while (i < text.size() && text[i] == ' ') ++i;
  if (i == text.size()) return false;
  return parse_hex_bytes(text.data() + i, text.size() - i, out);
}

Status Driver::ack(const Command& cmd) {
  ClassifiedResponse r;
  Status st = engine_.transact(cmd, Expect::Ack, timeouts_.command_ms, r);
  if (!st.ok()) return st;
  return expect_ok(r);
}

Status Driver::value(const Command& cmd, ClassifiedResponse& out) {
  Status st = engine_.transact(cmd, Expect::Value, timeouts_.command_ms, out);
  if (!st.ok()) return st;
  return expect_value(out);
}

// ============================== sys ==============================

Status Driver::verify_device(LineStr& version) {
  LineStr v;
  Status st = system_version_bytes(v);
  if (!st.ok()) return st;
  if (!starts_with(v, VERSION_PREFIX)) return Status::from(StatusCode::WrongDevice);
  version = v;
  return Status::success();
}

Status Driver::system_version_bytes(LineStr& version) {
  ClassifiedResponse r;
  Status st = engine_.transact(make_sys_get_ver(), Expect::Value, timeouts_.command_ms, r);
  if (!st.ok()) return st;
  if (!r.is(ResponseKind::OkWithValue)) return Status::from(StatusCode::BadResponse);
  version = r.text;
  return Status::success();
}

Status Driver::reset(const Command& cmd) {
  ClassifiedResponse r;
  Status st = engine_.transact(cmd, Expect::Value, timeouts_.reset_ms, r);
  if (!st.ok()) return st;

  const bool rebooted = r.is(ResponseKind::Ok) ||
                        (r.is(ResponseKind::OkWithValue) && starts_with(r.text, VERSION_PREFIX));
  if (!rebooted) return Status::from(StatusCode::BadResponse);

  confirm_reset(state_);
  return Status::success();
}

Status Driver::system_factory_reset() { return reset(make_sys_factory_reset()); }
Status Driver::system_module_reset()  { return reset(make_sys_reset()); }

Status Driver::system_get_nvm(NvmAddress addr, uint8_t& value) {
  ClassifiedResponse r;
  Status st = engine_.transact(make_sys_get_nvm(addr), Expect::Value, timeouts_.command_ms, r);
  if (!st.ok()) return st;

  uint8_t v = 0;
  if (!r.is(ResponseKind::OkWithValue) || !parse_hex_u8(r.text.data(), r.text.size(), v)) {
    return Status::from(StatusCode::BadResponse);
  }
  value = v;
  return Status::success();
}

Status Driver::system_set_nvm(NvmAddress addr, uint8_t value) {
  return ack(make_sys_set_nvm(addr, value));
}

Status Driver::system_set_pin_digital(uint8_t gpio, bool high) {
  if (gpio > RN2903_GPIO_MAX) return Status::from(StatusCode::InvalidArgument);
  return ack(make_sys_set_pindig(gpio, high));
}

Status Driver::system_get_vdd(uint16_t& millivolts) {
  ClassifiedResponse r;
  Status st = value(make_sys_get_vdd(), r);
  if (!st.ok()) return st;

  uint32_t mv = 0;
  if (!parse_dec_u32(r.text.data(), r.text.size(), mv) || mv > 0xFFFFu) {
    return Status::from(StatusCode::BadResponse);
  }
  millivolts = static_cast<uint16_t>(mv);
  return Status::success();
}

Status Driver::system_get_hweui(uint64_t& eui) {
  ClassifiedResponse r;
  Status st = value(make_sys_get_hweui(), r);
  if (!st.ok()) return st;

  uint64_t v = 0;
  if (r.text.size() != 16 || !parse_hex_u64(r.text.data(), r.text.size(), v)) {
    return Status::from(StatusCode::BadResponse);
  }
  eui = v;
  return Status::success();
}

// ============================== mac ==============================

Status Driver::mac_pause(std::optional<uint32_t>& duration_ms) {
  Status st = check_pause(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = engine_.transact(make_mac_pause(), Expect::Value, timeouts_.command_ms, r);
  if (!st.ok()) return st;

  switch (r.kind) {
    case ResponseKind::Ok:
      confirm_paused(state_);
      duration_ms = std::nullopt;
      return Status::success();

    case ResponseKind::OkWithValue: {
      uint32_t ms = 0;
      if (!parse_dec_u32(r.text.data(), r.text.size(), ms)) {
        return Status::from(StatusCode::BadResponse);
      }
      if (ms == 0) return Status::from(StatusCode::CannotPause);   // stack refused
      confirm_paused(state_);
      duration_ms = ms;
      return Status::success();
    }

    case ResponseKind::DeviceError:
      return Status::from(StatusCode::CannotPause, r.error);

    case ResponseKind::Unrecognized:
    default:
      return Status::from(StatusCode::BadResponse);
  }
}

Status Driver::mac_resume() {
  Status st = check_resume(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = engine_.transact(make_mac_resume(), Expect::Ack, timeouts_.command_ms, r);
  if (!st.ok()) return st;

  if (r.is(ResponseKind::DeviceError)) return Status::from(StatusCode::CannotResume, r.error);
  if (!r.is(ResponseKind::Ok))         return Status::from(StatusCode::BadResponse);

  confirm_resumed(state_);
  return Status::success();
}

Status Driver::mac_get_status(uint32_t& status_word) {
  Status st = check_mac(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = value(make_mac_get_status(), r);
  if (!st.ok()) return st;

  uint32_t v = 0;
  if (!parse_hex_u32(r.text.data(), r.text.size(), v)) return Status::from(StatusCode::BadResponse);
  status_word = v;
  return Status::success();
}

Status Driver::mac_get_deveui(uint64_t& eui) {
  Status st = check_mac(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = value(make_mac_get_deveui(), r);
  if (!st.ok()) return st;

  uint64_t v = 0;
  if (r.text.size() != 16 || !parse_hex_u64(r.text.data(), r.text.size(), v)) {
    return Status::from(StatusCode::BadResponse);
  }
  eui = v;
  return Status::success();
}

// ============================= radio =============================

Status Driver::radio_set_modulation_mode(ModulationMode mode) {
  Status st = check_radio(state_);
  if (!st.ok()) return st;
  return ack(make_radio_set_mod(mode));
}

Status Driver::radio_get_modulation_mode(ModulationMode& mode) {
  Status st = check_radio(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = value(make_radio_get_mod(), r);
  if (!st.ok()) return st;

  ModulationMode m = ModulationMode::LoRa;
  if (!parse_modulation(r.text.c_str(), m)) return Status::from(StatusCode::BadResponse);
  mode = m;
  return Status::success();
}

Status Driver::radio_set_frequency(uint32_t hz) {
  if (hz < RN2903_FREQ_MIN_HZ || hz > RN2903_FREQ_MAX_HZ) {
    return Status::from(StatusCode::InvalidArgument);
  }
  Status st = check_radio(state_);
  if (!st.ok()) return st;
  return ack(make_radio_set_freq(hz));
}

Status Driver::radio_get_frequency(uint32_t& hz) {
  Status st = check_radio(state_);
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = value(make_radio_get_freq(), r);
  if (!st.ok()) return st;

  uint32_t v = 0;
  if (!parse_dec_u32(r.text.data(), r.text.size(), v)) return Status::from(StatusCode::BadResponse);
  hz = v;
  return Status::success();
}

Status Driver::radio_set_spreading_factor(uint8_t sf) {
  if (sf < RN2903_SF_MIN || sf > RN2903_SF_MAX) return Status::from(StatusCode::InvalidArgument);
  Status st = check_radio(state_);
  if (!st.ok()) return st;
  return ack(make_radio_set_sf(sf));
}

Status Driver::radio_set_power(int8_t dbm) {
  if (dbm < RN2903_PWR_MIN || dbm > RN2903_PWR_MAX) return Status::from(StatusCode::InvalidArgument);
  Status st = check_radio(state_);
  if (!st.ok()) return st;
  return ack(make_radio_set_pwr(dbm));
}

Status Driver::radio_set_watchdog(uint32_t ms) {
  Status st = check_radio(state_);
  if (!st.ok()) return st;
  return ack(make_radio_set_wdt(ms));
}

Status Driver::radio_rx(uint16_t window, std::optional<Packet>& packet) {
  return radio_rx(window, timeouts_.rx_ms, packet);
}

// ---------------------------------------------------------------------------
// radio_rx()
// ----------
// Two lines: `ok` when reception starts, then `radio_rx <hex>` or `radio_err`
// when the window closes. Some firmware skips the `ok`, so a first line that
// is already the outcome is accepted as-is.
// ---------------------------------------------------------------------------
Status Driver::radio_rx(uint16_t window, uint32_t timeout_ms, std::optional<Packet>& packet) {
  Status st = check_radio(state_);
  if (!st.ok()) return st;

  RadioFlight flight(state_);

  ClassifiedResponse r;
  st = engine_.transact(make_radio_rx(window), Expect::Value, timeouts_.command_ms, r);
  if (!st.ok()) return st;

  if (r.is(ResponseKind::Ok)) {
    st = engine_.await_response(Expect::Value, timeout_ms, r);
    if (!st.ok()) return st;
  }

  if (r.is_device_error(DeviceErrorKind::RadioError)) {   // window closed, no data
    packet = std::nullopt;
    return Status::success();
  }
  if (r.is(ResponseKind::DeviceError)) return Status::device_error(r.error);

  Packet p;
  if (!r.is(ResponseKind::OkWithValue) || !starts_with(r.text, RX_PREFIX) ||
      !decode_rx_payload(r.text, p)) {
    return Status::from(StatusCode::BadResponse);
  }
  packet = p;
  return Status::success();
}

Status Driver::radio_tx(const Packet& packet) {
  if (packet.empty()) return Status::from(StatusCode::InvalidArgument);
  Status st = check_radio(state_);
  if (!st.ok()) return st;

  RadioFlight flight(state_);

  st = ack(make_radio_tx(packet));
  if (!st.ok()) return st;

  ClassifiedResponse r;
  st = engine_.await_response(Expect::Value, timeouts_.tx_ms, r);
  if (!st.ok()) return st;

  if (r.is(ResponseKind::OkWithValue) && equals(r.text, TX_DONE)) return Status::success();
  if (r.is(ResponseKind::DeviceError)) return Status::device_error(r.error);
  return Status::from(StatusCode::BadResponse);
}

// ============================== misc =============================

Status Driver::send_raw(const char* text, Expect expect, ClassifiedResponse& out) {
  std::optional<Command> cmd = make_raw(text);
  if (!cmd) return Status::from(StatusCode::InvalidArgument);
  return engine_.transact(*cmd, expect, timeouts_.command_ms, out);
}

} // namespace rn2903
