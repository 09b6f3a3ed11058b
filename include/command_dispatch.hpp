#pragma once
/**
 * @page rn2903-command-dispatch RN2903 Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Centralized resolution of CLI `--get` / `--set` names into Driver calls.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue layer between CLI arguments and the typed
 * operations in rn2903/driver.hpp. It exists so that:
 *   - `main.cpp` never has to know about individual Driver methods.
 *   - New parameters can be added by editing only this file + command_dispatch.cpp.
 *   - Parsing and validation happen before the serial port is opened.
 *
 * WHAT THIS DOES
 * --------------
 * - `CommandKind` lists every supported GET_* / SET_* operation.
 * - `name_to_kind()` maps user-facing names (`"freq"`, `"nvm"`) plus the
 *   GET/SET bit to a kind. Read-only names have no SET form.
 * - `parse_request()` splits `name:qualifier`, validates the value, and
 *   produces a fully typed `Request`. `--set sf 99` fails here with
 *   `err="bad_value:sf(7..12)"`, never on the wire.
 * - `run_request()` performs the call. Radio-layer kinds are wrapped in
 *   `mac pause` / `mac resume` so the CLI works from a freshly booted module.
 *
 * NAMES
 * -----
 * | name            | get | set | device command                  |
 * |-----------------|-----|-----|---------------------------------|
 * | ver             |  x  |     | sys get ver                     |
 * | vdd             |  x  |     | sys get vdd                     |
 * | hweui           |  x  |     | sys get hweui                   |
 * | nvm:<addr>      |  x  |  x  | sys get/set nvm <addr> [<byte>] |
 * | pin:GPIO<n>     |     |  x  | sys set pindig GPIO<n> <0/1>    |
 * | mac_status      |  x  |     | mac get status                  |
 * | deveui          |  x  |     | mac get deveui                  |
 * | mod             |  x  |  x  | radio get/set mod               |
 * | freq            |  x  |  x  | radio get/set freq              |
 * | sf              |     |  x  | radio set sf                    |
 * | pwr             |     |  x  | radio set pwr                   |
 * | wdt             |     |  x  | radio set wdt                   |
 *
 * OUTPUT
 * ------
 * run_request() fills `Fields` (ordered key/value pairs) that main.cpp prints
 * either as `key=value` tokens or as a JSON object.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rn2903/driver.hpp"

namespace rn2903 {

enum class CommandKind : uint8_t {
    GET_VER,
    GET_VDD,
    GET_HWEUI,
    GET_NVM,
    SET_NVM,
    SET_PIN,
    GET_MAC_STATUS,
    GET_DEVEUI,
    GET_MOD,
    SET_MOD,
    GET_FREQ,
    SET_FREQ,
    SET_SF,
    SET_PWR,
    SET_WDT
};

/// A validated CLI request. Only the fields its kind uses are meaningful.
struct Request {
    CommandKind    kind{CommandKind::GET_VER};
    std::string    name;                   ///< canonical output key ("freq", "nvm:300")
    NvmAddress     addr;                   ///< GET_NVM / SET_NVM
    uint8_t        gpio{0};                ///< SET_PIN
    uint32_t       u32{0};                 ///< nvm byte, pin level, freq, sf, wdt
    int8_t         i8{0};                  ///< pwr
    ModulationMode mode{ModulationMode::LoRa};
};

using Fields = std::vector<std::pair<std::string, std::string>>;

/// Map a bare name (no qualifier) and operation to a kind.
bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind);

/**
 * @brief Resolve and validate one `--get` (is_set=false) or `--set` request.
 * @param err  Short machine-readable reason on failure ("unknown_param:foo").
 */
bool parse_request(const std::string& name, bool is_set, const std::string& value,
                   Request& out, std::string& err);

/// True for kinds that need the network stack paused.
bool is_radio_kind(CommandKind kind);

/**
 * @brief Pause the network stack, run @p op, resume.
 *
 * The resume is attempted even when @p op failed, so the module is not left
 * with its stack paused. The op's own failure wins when both fail. A refused
 * pause returns before @p op runs.
 */
template <typename Op>
Status with_paused_stack(Driver& drv, Op op) {
    std::optional<uint32_t> pause_ms;
    Status st = drv.mac_pause(pause_ms);
    if (!st.ok()) return st;

    Status result  = op();
    Status resumed = drv.mac_resume();
    return result.ok() ? resumed : result;
}

/// Perform @p req on @p drv. Radio kinds run between mac_pause and mac_resume.
Status run_request(Driver& drv, const Request& req, Fields& fields);

/// CLI exit code for a failed status (0 for Ok).
int exit_code_for(const Status& st);

} // namespace rn2903
