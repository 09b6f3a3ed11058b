/**
 * @file main.cpp
 * @brief rn2903-cli: Linux one-shot runner around rn2903::Driver.
 *
 * Responsibilities:
 *  - Load settings from $XDG_CONFIG_HOME/rn2903/config.json, let CLI11 flags override them.
 *  - Validate the requested operation *before* touching the port.
 *  - Open the port, confirm it is an RN2903 (unless --no-verify), run exactly one operation.
 *  - Print `status=ok key=value ...` on stdout (or a JSON object with --format json),
 *    `status=error reason=...` on stderr, and exit with a code per failure class.
 *
 * Exit codes: 0 ok, 1 I/O or open, 2 usage, 3 timeout, 4 device rejected,
 *             5 bad response / wrong device, 6 state precondition.
 *
 * Notes:
 *  - Radio operations (--rx, --tx, radio --get/--set names) pause the LoRaWAN stack
 *    first and resume it afterwards.
 *  - --trace mirrors every line on stderr as `tx=...` / `rx=...`.
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "command_dispatch.hpp"   // parse_request(), run_request(), with_paused_stack()
#include "config.hpp"             // Config, load_config(), timeouts_from()
#include "device_registry.hpp"    // discover_devices(), save_registry()
#include "rn2903/driver.hpp"
#include "rn2903/hex.hpp"
#include "rn2903/transport/transport_linux_serial.hpp"

using json = nlohmann::json;
using namespace rn2903;

// ---------- small utilities ----------

static void trace_to_stderr(void*, TraceDir dir, const char* text, size_t len) {
  std::cerr << (dir == TraceDir::Tx ? "tx=" : "rx=") << std::string(text, len) << "\n";
}

static int fail(const Status& st, const char* during) {
  char buf[64];
  std::cerr << "status=error reason=" << describe(st, buf, sizeof(buf))
            << " op=" << during << "\n";
  return exit_code_for(st);
}

static int usage(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return 2;
}

static std::string packet_hex(const Packet& p) {
  etl::string<2 * RN2903_PACKET_MAX> s;
  append_hex_bytes(s, p.data(), p.size());
  return std::string(s.c_str());
}

static void print_fields(const Fields& fields, const std::string& format) {
  if (format == "json") {
    json j;
    j["status"] = "ok";
    for (const auto& kv : fields) j[kv.first] = kv.second;
    std::cout << j.dump() << "\n";
    return;
  }
  std::cout << "status=ok";
  for (const auto& kv : fields) std::cout << " " << kv.first << "=" << kv.second;
  std::cout << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"RN2903 LoRa transceiver CLI"};

  // ---- targeting / io ----
  std::string dev, config_path;
  int baud = 0, boot_delay_ms = 0;
  uint32_t timeout_ms = 0, rx_timeout_ms = 0, tx_timeout_ms = 0;
  bool no_verify = false, trace = false;
  std::string format = "pretty";

  CLI::Option* opt_dev     = app.add_option("--dev", dev, "Serial device (e.g. /dev/serial/by-id/...)");
  CLI::Option* opt_baud    = app.add_option("--baud", baud, "Baud rate (default 57600)");
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Command reply timeout (ms)");
  CLI::Option* opt_rx_to   = app.add_option("--rx-timeout", rx_timeout_ms, "Radio receive timeout (ms)");
  CLI::Option* opt_tx_to   = app.add_option("--tx-timeout", tx_timeout_ms, "Radio transmit completion timeout (ms)");
  CLI::Option* opt_boot    = app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms)");
  app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/rn2903/config.json)");
  app.add_flag("--no-verify", no_verify, "Skip the RN2903 version check after open");
  app.add_flag("--trace", trace, "Print every line sent/received on stderr");
  app.add_option("--format", format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));

  // ---- operations (exactly one) ----
  bool do_scan = false, do_reset = false, do_factory_reset = false;
  std::string get_name, tx_hex, raw_text;
  std::vector<std::string> set_kv;
  int rx_window = -1;
  unsigned rx_count = 1;

  app.add_flag("--scan", do_scan, "Scan serial ports for RN2903 modules, save devices.json");
  app.add_option("--get", get_name,
    "Get param: ver|vdd|hweui|nvm:<addr>|mac_status|deveui|mod|freq");
  app.add_option("--set", set_kv,
    "Set param: --set <nvm:<addr>|pin:GPIOn|mod|freq|sf|pwr|wdt> <value>")->expected(2);
  app.add_option("--rx", rx_window, "Receive with window (0 = continuous)")->check(CLI::Range(0, 65535));
  app.add_option("--count", rx_count, "With --rx: number of receive windows")->check(CLI::Range(1u, 100000u));
  app.add_option("--tx", tx_hex, "Transmit hex payload (1..255 bytes)");
  app.add_option("--raw", raw_text, "Send one raw command line, print the reply");
  app.add_flag("--reset", do_reset, "sys reset");
  app.add_flag("--factory-reset", do_factory_reset, "sys factoryRESET");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // -------- scan mode --------
  if (do_scan) {
    auto devices = discover_devices();
    for (const auto& d : devices) {
      std::cout << "dev=" << d.dev_path << " online=" << (d.online ? 1 : 0);
      if (d.online) std::cout << " ver=\"" << d.version << "\"";
      std::cout << "\n";
    }
    return save_registry(devices) ? 0 : 1;
  }

  // -------- settings: defaults <- config file <- flags --------
  Config cfg;
  {
    std::vector<std::string> warnings;
    const std::filesystem::path path =
        config_path.empty() ? default_config_path() : std::filesystem::path(config_path);
    const bool loaded = load_config(path, cfg, warnings);
    for (const auto& w : warnings) std::cerr << "status=warn reason=" << w << "\n";
    if (!loaded) return usage("config_invalid");
  }
  if (opt_dev->count())     cfg.dev           = dev;
  if (opt_baud->count())    cfg.baud          = baud;
  if (opt_timeout->count()) cfg.timeout_ms    = timeout_ms;
  if (opt_rx_to->count())   cfg.rx_timeout_ms = rx_timeout_ms;
  if (opt_tx_to->count())   cfg.tx_timeout_ms = tx_timeout_ms;
  if (opt_boot->count())    cfg.boot_delay_ms = boot_delay_ms;
  if (no_verify)            cfg.verify        = false;

  // -------- choose exactly one command --------
  int cmds = 0;
  cmds += get_name.empty() ? 0 : 1;
  cmds += (set_kv.size() == 2) ? 1 : 0;
  cmds += (rx_window >= 0) ? 1 : 0;
  cmds += tx_hex.empty() ? 0 : 1;
  cmds += raw_text.empty() ? 0 : 1;
  cmds += do_reset ? 1 : 0;
  cmds += do_factory_reset ? 1 : 0;
  if (cmds != 1) return usage("need_exactly_one_command");

  // -------- validate before opening the port --------
  Request req;
  std::string derr;
  if (!get_name.empty() && !parse_request(get_name, false, "", req, derr)) return usage(derr);
  if (set_kv.size() == 2 && !parse_request(set_kv[0], true, set_kv[1], req, derr)) return usage(derr);

  Packet tx_packet;
  if (!tx_hex.empty()) {
    if (!parse_hex_bytes(tx_hex.data(), tx_hex.size(), tx_packet) || tx_packet.empty()) {
      return usage("bad_value:tx(hex,1..255_bytes)");
    }
  }
  if (!raw_text.empty() && !make_raw(raw_text.c_str())) return usage("bad_value:raw");

  // -------- open + verify --------
  transport::LinuxSerial link;
  if (!link.open(cfg.dev, cfg.baud, cfg.boot_delay_ms)) {
    std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
    return 1;
  }

  Driver drv(link, timeouts_from(cfg));
  if (trace) drv.set_trace(&trace_to_stderr, nullptr);

  if (cfg.verify) {
    LineStr banner;
    Status st = drv.verify_device(banner);
    if (!st.ok()) return fail(st, "verify");
  }

  // -------- run --------
  Fields fields;
  Status st;

  if (!get_name.empty() || set_kv.size() == 2) {
    st = run_request(drv, req, fields);
    if (!st.ok()) return fail(st, req.name.c_str());
    print_fields(fields, format);
    return 0;
  }

  if (rx_window >= 0) {
    // One output line per window; a window with nothing received prints rx=none.
    st = with_paused_stack(drv, [&]() {
      for (unsigned i = 0; i < rx_count; ++i) {
        std::optional<Packet> pkt;
        Status s = drv.radio_rx(static_cast<uint16_t>(rx_window), cfg.rx_timeout_ms, pkt);
        if (!s.ok()) return s;
        Fields f;
        f.emplace_back("rx", pkt ? packet_hex(*pkt) : std::string("none"));
        if (pkt) f.emplace_back("len", std::to_string(pkt->size()));
        print_fields(f, format);
      }
      return Status::success();
    });
    return st.ok() ? 0 : fail(st, "rx");
  }

  if (!tx_hex.empty()) {
    st = with_paused_stack(drv, [&]() { return drv.radio_tx(tx_packet); });
    if (!st.ok()) return fail(st, "tx");
    fields.emplace_back("tx", "ok");
    fields.emplace_back("len", std::to_string(tx_packet.size()));
    print_fields(fields, format);
    return 0;
  }

  if (!raw_text.empty()) {
    ClassifiedResponse r;
    st = drv.send_raw(raw_text.c_str(), Expect::Value, r);
    if (!st.ok()) return fail(st, "raw");
    fields.emplace_back("kind", to_string(r.kind));
    if (r.is(ResponseKind::DeviceError)) fields.emplace_back("error", to_string(r.error));
    fields.emplace_back("reply", r.text.c_str());
    print_fields(fields, format);
    return r.is(ResponseKind::DeviceError) ? 4 : 0;
  }

  st = do_factory_reset ? drv.system_factory_reset() : drv.system_module_reset();
  if (!st.ok()) return fail(st, do_factory_reset ? "factory_reset" : "reset");
  fields.emplace_back(do_factory_reset ? "factory_reset" : "reset", "ok");
  print_fields(fields, format);
  return 0;
}
