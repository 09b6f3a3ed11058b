#include "rn2903/commands.hpp"   // Our own header: declares Command and the builders
#include "rn2903/hex.hpp"        // lowercase hex / decimal appenders

#include <string.h>              // strlen, strpbrk for make_raw()

namespace rn2903 {
// ============================================================================
// Low-level helpers
// ============================================================================
// Every builder starts a body from a fixed verb phrase, appends typed
// parameters separated by single spaces, and seals it into a Command.
// Capacities are sized so no builder can overflow (see types.hpp).

using Body = Command::Text;

static inline Body verb(const char* phrase) {
    Body b;
    b.assign(phrase);
    return b;
}

static inline void space(Body& b) {
    b.push_back(' ');
}

Command::Command(const etl::istring& body) {
    text_.assign(body.begin(), body.end());
    text_.append(RN2903_DELIMITER);
}

// ============================================================================
// sys
// ============================================================================

Command make_sys_get_ver()       { return Command(verb("sys get ver")); }
Command make_sys_reset()         { return Command(verb("sys reset")); }
Command make_sys_factory_reset() { return Command(verb("sys factoryRESET")); }   // device spelling
Command make_sys_get_vdd()       { return Command(verb("sys get vdd")); }
Command make_sys_get_hweui()     { return Command(verb("sys get hweui")); }

Command make_sys_get_nvm(NvmAddress addr) {
    auto b = verb("sys get nvm");
    space(b);
    append_hex(b, addr.value());                    // "300".."3ff"
    return Command(b);
}

Command make_sys_set_nvm(NvmAddress addr, uint8_t value) {
    auto b = verb("sys set nvm");
    space(b);
    append_hex(b, addr.value());
    space(b);
    append_hex_u8(b, value);                        // always two digits
    return Command(b);
}

// Pin names are "GPIO0".."GPIO14"; level is a bare 0/1.
Command make_sys_set_pindig(uint8_t gpio, bool high) {
    auto b = verb("sys set pindig GPIO");
    append_dec(b, gpio);
    space(b);
    b.push_back(high ? '1' : '0');
    return Command(b);
}

// ============================================================================
// mac
// ============================================================================

Command make_mac_pause()      { return Command(verb("mac pause")); }
Command make_mac_resume()     { return Command(verb("mac resume")); }
Command make_mac_get_status() { return Command(verb("mac get status")); }
Command make_mac_get_deveui() { return Command(verb("mac get deveui")); }

// ============================================================================
// radio
// ============================================================================

Command make_radio_set_mod(ModulationMode mode) {
    auto b = verb("radio set mod");
    space(b);
    b.append(to_string(mode));
    return Command(b);
}

Command make_radio_get_mod()  { return Command(verb("radio get mod")); }
Command make_radio_get_freq() { return Command(verb("radio get freq")); }

Command make_radio_set_freq(uint32_t hz) {
    auto b = verb("radio set freq");
    space(b);
    append_dec(b, hz);
    return Command(b);
}

Command make_radio_set_sf(uint8_t sf) {
    auto b = verb("radio set sf sf");               // the value token is "sf7".."sf12"
    append_dec(b, sf);
    return Command(b);
}

Command make_radio_set_pwr(int8_t dbm) {
    auto b = verb("radio set pwr");
    space(b);
    append_dec_signed(b, dbm);
    return Command(b);
}

Command make_radio_set_wdt(uint32_t ms) {
    auto b = verb("radio set wdt");
    space(b);
    append_dec(b, ms);
    return Command(b);
}

// 0 means "listen until something arrives or the watchdog fires".
Command make_radio_rx(uint16_t window) {
    auto b = verb("radio rx");
    space(b);
    append_dec(b, window);
    return Command(b);
}

Command make_radio_tx(const Packet& packet) {
    auto b = verb("radio tx");
    space(b);
    append_hex_bytes(b, packet.data(), packet.size());
    return Command(b);
}

// ============================================================================
// Raw pass-through
// ============================================================================

std::optional<Command> make_raw(const char* text) {
    if (!text || !*text) return std::nullopt;
    if (strpbrk(text, "\r\n")) return std::nullopt;  // one command per line, no smuggling
    const size_t len = strlen(text);
    if (len + 2 > RN2903_COMMAND_MAX) return std::nullopt;  // leave room for CR LF
    Body b;
    b.assign(text, len);
    return Command(b);
}

} // namespace rn2903
