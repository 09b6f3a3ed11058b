#pragma once
/**
 * @file config.hpp
 * @brief Persistent CLI settings ($XDG_CONFIG_HOME/rn2903/config.json).
 *
 * @details
 * One small JSON object, every field optional:
 *
 * @code
 *   {
 *     "dev": "/dev/ttyUSB0",
 *     "baud": 57600,
 *     "timeout_ms": 1000,
 *     "rx_timeout_ms": 15000,
 *     "tx_timeout_ms": 10000,
 *     "boot_delay_ms": 100,
 *     "verify": true
 *   }
 * @endcode
 *
 * A missing file means defaults. A field with the wrong type is reported in
 * `warnings` and left at its default; the rest of the file still applies.
 * Command-line flags override whatever was loaded.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "rn2903/driver.hpp"

namespace rn2903 {

struct Config {
  std::string dev{"/dev/ttyUSB0"};
  int         baud{57600};
  uint32_t    timeout_ms{1000};
  uint32_t    rx_timeout_ms{15000};
  uint32_t    tx_timeout_ms{10000};
  int         boot_delay_ms{100};
  bool        verify{true};
};

/// $XDG_CONFIG_HOME/rn2903, falling back to ~/.config/rn2903.
std::filesystem::path default_config_dir();
std::filesystem::path default_config_path();

/**
 * @brief Overlay recognized fields of @p j onto @p out.
 * @return false when @p j is not an object (nothing applied).
 */
bool config_from_json(const nlohmann::json& j, Config& out, std::vector<std::string>& warnings);

nlohmann::json config_to_json(const Config& cfg);

/**
 * @brief Read @p path into @p out.
 * @return true if the file is absent or parsed; false if unreadable or not
 *         valid JSON (@p warnings says why, @p out keeps its values).
 */
bool load_config(const std::filesystem::path& path, Config& out, std::vector<std::string>& warnings);

/// Write atomically (temp file + rename), creating the directory if needed.
bool save_config(const std::filesystem::path& path, const Config& cfg, std::string& err);

/// Driver deadlines derived from the configured command, rx and tx timeouts.
DriverTimeouts timeouts_from(const Config& cfg);

} // namespace rn2903
