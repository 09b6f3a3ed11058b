// ============================================================================
// command_dispatch.cpp: implementation for command_dispatch.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file command_dispatch.cpp
 */

#include "command_dispatch.hpp"

#include <cctype>                // std::tolower
#include <cstdio>                // snprintf for fixed-width hex
#include <cstdlib>               // strtol / strtoull for safe string→number parsing
#include <optional>

namespace rn2903 {

// ---------- local parsing helpers (no exceptions) ----------
// These functions convert strings from CLI input into fixed-width integers.
// - strtol/strtoull (C stdlib) for predictability. Decimal unless the caller
//   passes 16; a leading zero is never octal.
// - Failure is always signaled by "false". Empty and negative input is rejected.
// - Each parser enforces explicit bounds so bad values never reach the driver.

static bool parse_u32(const std::string& s, uint32_t& out,
                      uint64_t lo=0, uint64_t hi=0xFFFFFFFFull, int base=10) {
    if (s.empty() || s[0] == '-') return false;
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, base);
    if (!e || *e) return false;
    if (v < lo || v > hi) return false;
    out = (uint32_t)v;
    return true;
}

static bool parse_u8(const std::string& s, uint8_t& out,
                     uint32_t lo=0, uint32_t hi=255, int base=10) {
    uint32_t v = 0;
    if (!parse_u32(s, v, lo, hi, base)) return false;
    out = (uint8_t)v;
    return true;
}

static bool parse_i8(const std::string& s, int8_t& out,
                     int32_t lo=-128, int32_t hi=127) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 10);
    if (!e || *e) return false;
    if (v < lo || v > hi) return false;
    out = (int8_t)v;
    return true;
}

// ---------- lowercase normalizer ----------
// Cast to unsigned char first so std::tolower is well-defined.
static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string hex_fixed(uint64_t v, int digits) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%0*llX", digits, (unsigned long long)v);
    return buf;
}

// ---------- mapping: (name, is_set) -> CommandKind ----------
// Explicit branches over tables, for transparency and offline audit.
// Names that exist only as GET (or only as SET) fall through to false.
bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind) {
    const std::string name = lower(raw_name);

    // System
    if (!is_set) {
        if (name == "ver" || name == "version") { out_kind = CommandKind::GET_VER;   return true; }
        if (name == "vdd")                      { out_kind = CommandKind::GET_VDD;   return true; }
        if (name == "hweui")                    { out_kind = CommandKind::GET_HWEUI; return true; }
        if (name == "nvm")                      { out_kind = CommandKind::GET_NVM;   return true; }
    } else {
        if (name == "nvm")                      { out_kind = CommandKind::SET_NVM;   return true; }
        if (name == "pin" || name == "pindig")  { out_kind = CommandKind::SET_PIN;   return true; }
    }

    // MAC (read-only here; the stack must be active)
    if (!is_set) {
        if (name == "mac_status" || name == "status") { out_kind = CommandKind::GET_MAC_STATUS; return true; }
        if (name == "deveui")                         { out_kind = CommandKind::GET_DEVEUI;     return true; }
    }

    // Radio
    if (!is_set) {
        if (name == "mod")  { out_kind = CommandKind::GET_MOD;  return true; }
        if (name == "freq") { out_kind = CommandKind::GET_FREQ; return true; }
    } else {
        if (name == "mod")                     { out_kind = CommandKind::SET_MOD;  return true; }
        if (name == "freq")                    { out_kind = CommandKind::SET_FREQ; return true; }
        if (name == "sf")                      { out_kind = CommandKind::SET_SF;   return true; }
        if (name == "pwr" || name == "tx_pwr") { out_kind = CommandKind::SET_PWR;  return true; }
        if (name == "wdt")                     { out_kind = CommandKind::SET_WDT;  return true; }
    }

    return false;
}

// ---------- parse_request ----------
// "name[:qualifier]" + optional value -> typed Request.
bool parse_request(const std::string& raw, bool is_set, const std::string& value,
                   Request& out, std::string& err) {
    const std::string full = lower(raw);
    const size_t colon = full.find(':');
    const std::string name      = full.substr(0, colon);
    const std::string qualifier = (colon == std::string::npos) ? std::string() : full.substr(colon + 1);

    Request req;
    if (!name_to_kind(name, is_set, req.kind)) { err = "unknown_param:" + raw; return false; }
    req.name = name;

    switch (req.kind) {
        case CommandKind::GET_NVM:
        case CommandKind::SET_NVM: {
            uint32_t a = 0;
            if (!parse_u32(qualifier, a, 0, 0xFFFF, 16)) { err = "bad_address:" + qualifier; return false; }
            if (!NvmAddress::create((uint16_t)a, req.addr).ok()) {
                err = "bad_address:nvm(300..3ff)"; return false;
            }
            req.name = "nvm:" + lower(hex_fixed(a, 3));
            if (req.kind == CommandKind::SET_NVM &&
                !parse_u32(value, req.u32, 0, 0xFF, 16)) { err = "bad_value:nvm(00..ff)"; return false; }
            break;
        }
        case CommandKind::SET_PIN: {
            // "gpio5" or "5"
            std::string digits = qualifier;
            if (digits.rfind("gpio", 0) == 0) digits = digits.substr(4);
            if (!parse_u8(digits, req.gpio, 0, RN2903_GPIO_MAX, 10)) {
                err = "bad_pin:" + qualifier; return false;
            }
            req.name = "pin:GPIO" + std::to_string(req.gpio);
            const std::string v = lower(value);
            if (v == "1" || v == "on" || v == "high")     req.u32 = 1;
            else if (v == "0" || v == "off" || v == "low") req.u32 = 0;
            else { err = "bad_value:pin(0|1)"; return false; }
            break;
        }
        case CommandKind::SET_MOD:
            if (!parse_modulation(value.c_str(), req.mode)) { err = "bad_value:mod(lora|fsk)"; return false; }
            break;
        case CommandKind::SET_FREQ:
            if (!parse_u32(value, req.u32, RN2903_FREQ_MIN_HZ, RN2903_FREQ_MAX_HZ, 10)) {
                err = "bad_value:freq(902000000..928000000)"; return false;
            }
            break;
        case CommandKind::SET_SF: {
            std::string v = lower(value);
            if (v.rfind("sf", 0) == 0) v = v.substr(2);          // accept "sf9" as well as "9"
            if (!parse_u32(v, req.u32, RN2903_SF_MIN, RN2903_SF_MAX, 10)) {
                err = "bad_value:sf(7..12)"; return false;
            }
            break;
        }
        case CommandKind::SET_PWR:
            if (!parse_i8(value, req.i8, RN2903_PWR_MIN, RN2903_PWR_MAX)) {
                err = "bad_value:pwr(2..20)"; return false;
            }
            break;
        case CommandKind::SET_WDT:
            if (!parse_u32(value, req.u32, 0, 0xFFFFFFFFull, 10)) { err = "bad_value:wdt_ms"; return false; }
            break;
        default:
            break;                                               // GETs take no value
    }

    out = req;
    return true;
}

bool is_radio_kind(CommandKind kind) {
    switch (kind) {
        case CommandKind::GET_MOD:
        case CommandKind::SET_MOD:
        case CommandKind::GET_FREQ:
        case CommandKind::SET_FREQ:
        case CommandKind::SET_SF:
        case CommandKind::SET_PWR:
        case CommandKind::SET_WDT:
            return true;
        default:
            return false;
    }
}

// ---------- run_one ----------
// Exactly one Driver call per kind. Fields are appended only on success.
static Status run_one(Driver& drv, const Request& req, Fields& fields) {
    Status st;
    switch (req.kind) {
        case CommandKind::GET_VER: {
            LineStr v;
            st = drv.system_version_bytes(v);
            if (st.ok()) fields.emplace_back(req.name, v.c_str());
            return st;
        }
        case CommandKind::GET_VDD: {
            uint16_t mv = 0;
            st = drv.system_get_vdd(mv);
            if (st.ok()) fields.emplace_back("vdd_mv", std::to_string(mv));
            return st;
        }
        case CommandKind::GET_HWEUI: {
            uint64_t eui = 0;
            st = drv.system_get_hweui(eui);
            if (st.ok()) fields.emplace_back(req.name, hex_fixed(eui, 16));
            return st;
        }
        case CommandKind::GET_NVM: {
            uint8_t b = 0;
            st = drv.system_get_nvm(req.addr, b);
            if (st.ok()) fields.emplace_back(req.name, lower(hex_fixed(b, 2)));
            return st;
        }
        case CommandKind::SET_NVM:
            st = drv.system_set_nvm(req.addr, (uint8_t)req.u32);
            if (st.ok()) fields.emplace_back(req.name, lower(hex_fixed(req.u32, 2)));
            return st;
        case CommandKind::SET_PIN:
            st = drv.system_set_pin_digital(req.gpio, req.u32 != 0);
            if (st.ok()) fields.emplace_back(req.name, std::to_string(req.u32));
            return st;
        case CommandKind::GET_MAC_STATUS: {
            uint32_t word = 0;
            st = drv.mac_get_status(word);
            if (st.ok()) fields.emplace_back(req.name, hex_fixed(word, 8));
            return st;
        }
        case CommandKind::GET_DEVEUI: {
            uint64_t eui = 0;
            st = drv.mac_get_deveui(eui);
            if (st.ok()) fields.emplace_back(req.name, hex_fixed(eui, 16));
            return st;
        }
        case CommandKind::GET_MOD: {
            ModulationMode m = ModulationMode::LoRa;
            st = drv.radio_get_modulation_mode(m);
            if (st.ok()) fields.emplace_back(req.name, to_string(m));
            return st;
        }
        case CommandKind::SET_MOD:
            st = drv.radio_set_modulation_mode(req.mode);
            if (st.ok()) fields.emplace_back(req.name, to_string(req.mode));
            return st;
        case CommandKind::GET_FREQ: {
            uint32_t hz = 0;
            st = drv.radio_get_frequency(hz);
            if (st.ok()) fields.emplace_back(req.name, std::to_string(hz));
            return st;
        }
        case CommandKind::SET_FREQ:
            st = drv.radio_set_frequency(req.u32);
            if (st.ok()) fields.emplace_back(req.name, std::to_string(req.u32));
            return st;
        case CommandKind::SET_SF:
            st = drv.radio_set_spreading_factor((uint8_t)req.u32);
            if (st.ok()) fields.emplace_back(req.name, "sf" + std::to_string(req.u32));
            return st;
        case CommandKind::SET_PWR:
            st = drv.radio_set_power(req.i8);
            if (st.ok()) fields.emplace_back(req.name, std::to_string(req.i8));
            return st;
        case CommandKind::SET_WDT:
            st = drv.radio_set_watchdog(req.u32);
            if (st.ok()) fields.emplace_back(req.name, std::to_string(req.u32));
            return st;
    }
    return Status::from(StatusCode::InvalidArgument);
}

// ---------- run_request ----------
Status run_request(Driver& drv, const Request& req, Fields& fields) {
    if (!is_radio_kind(req.kind)) return run_one(drv, req, fields);
    return with_paused_stack(drv, [&]() { return run_one(drv, req, fields); });
}

int exit_code_for(const Status& st) {
    switch (st.code) {
        case StatusCode::Ok:                 return 0;
        case StatusCode::IoFailure:          return 1;
        case StatusCode::InvalidAddress:
        case StatusCode::InvalidArgument:    return 2;
        case StatusCode::Timeout:            return 3;
        case StatusCode::DeviceError:        return 4;
        case StatusCode::BadResponse:
        case StatusCode::WrongDevice:        return 5;
        case StatusCode::CannotPause:
        case StatusCode::CannotResume:
        case StatusCode::TransceiverBusy:
        case StatusCode::RadioInFlight:
        case StatusCode::NetworkStackPaused: return 6;
    }
    return 1;
}

} // namespace rn2903
