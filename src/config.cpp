// ============================================================================
// config.cpp: implementation for config.hpp
// ============================================================================

#include "config.hpp"

#include <cstdlib>    // getenv
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace rn2903 {

fs::path default_config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "rn2903";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : "") / ".config" / "rn2903";
}

fs::path default_config_path() {
  return default_config_dir() / "config.json";
}

// ---------- typed field readers ----------
// Each one applies the field only if present *and* of the right type.

static void read_string(const json& j, const char* key, std::string& dst,
                        std::vector<std::string>& warnings) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_string() || it->get<std::string>().empty()) {
    warnings.push_back(std::string("bad_field:") + key);
    return;
  }
  dst = it->get<std::string>();
}

static void read_u32(const json& j, const char* key, uint32_t& dst,
                     std::vector<std::string>& warnings) {
  auto it = j.find(key);
  if (it == j.end()) return;
  // Parsed text yields unsigned for non-negative numbers; built values may be signed.
  const bool in_range = it->is_number_unsigned()
      ? it->get<uint64_t>() <= 0xFFFFFFFFull
      : it->is_number_integer() && it->get<int64_t>() >= 0 && it->get<int64_t>() <= 0xFFFFFFFFll;
  if (!in_range) {
    warnings.push_back(std::string("bad_field:") + key);
    return;
  }
  dst = it->get<uint32_t>();
}

static void read_int(const json& j, const char* key, int& dst, int lo, int hi,
                     std::vector<std::string>& warnings) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_number_integer()) { warnings.push_back(std::string("bad_field:") + key); return; }
  const int64_t v = it->get<int64_t>();
  if (v < lo || v > hi)         { warnings.push_back(std::string("bad_field:") + key); return; }
  dst = static_cast<int>(v);
}

static void read_bool(const json& j, const char* key, bool& dst,
                      std::vector<std::string>& warnings) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_boolean()) { warnings.push_back(std::string("bad_field:") + key); return; }
  dst = it->get<bool>();
}

bool config_from_json(const json& j, Config& out, std::vector<std::string>& warnings) {
  if (!j.is_object()) {
    warnings.push_back("config_not_object");
    return false;
  }
  read_string(j, "dev",           out.dev,           warnings);
  read_int   (j, "baud",          out.baud, 1200, 921600, warnings);
  read_u32   (j, "timeout_ms",    out.timeout_ms,    warnings);
  read_u32   (j, "rx_timeout_ms", out.rx_timeout_ms, warnings);
  read_u32   (j, "tx_timeout_ms", out.tx_timeout_ms, warnings);
  read_int   (j, "boot_delay_ms", out.boot_delay_ms, 0, 60000, warnings);
  read_bool  (j, "verify",        out.verify,        warnings);
  return true;
}

json config_to_json(const Config& cfg) {
  json j;
  j["dev"]           = cfg.dev;
  j["baud"]          = cfg.baud;
  j["timeout_ms"]    = cfg.timeout_ms;
  j["rx_timeout_ms"] = cfg.rx_timeout_ms;
  j["tx_timeout_ms"] = cfg.tx_timeout_ms;
  j["boot_delay_ms"] = cfg.boot_delay_ms;
  j["verify"]        = cfg.verify;
  return j;
}

bool load_config(const fs::path& path, Config& out, std::vector<std::string>& warnings) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;            // first run: defaults

  std::ifstream in(path);
  if (!in) { warnings.push_back("config_unreadable:" + path.string()); return false; }

  json j = json::parse(in, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded()) { warnings.push_back("config_parse_error:" + path.string()); return false; }

  return config_from_json(j, out, warnings);
}

bool save_config(const fs::path& path, const Config& cfg, std::string& err) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) { err = "config_dir:" + ec.message(); return false; }
  }

  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "open_failed:" + tmp.string(); return false; }
    out << config_to_json(cfg).dump(2) << "\n";
    out.flush();
    if (!out) { err = "write_failed:" + tmp.string(); return false; }
  }

  fs::rename(tmp, path, ec);
  if (ec) { err = "rename_failed:" + ec.message(); return false; }
  return true;
}

DriverTimeouts timeouts_from(const Config& cfg) {
  DriverTimeouts t;
  t.command_ms = cfg.timeout_ms;
  t.rx_ms      = cfg.rx_timeout_ms;
  t.tx_ms      = cfg.tx_timeout_ms;
  // The reboot banner needs at least the stock allowance.
  if (cfg.timeout_ms > t.reset_ms) t.reset_ms = cfg.timeout_ms;
  return t;
}

} // namespace rn2903
