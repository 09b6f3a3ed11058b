/**
 * @page rn2903-device-registry RN2903 Device Registry
 * @file device_registry.hpp
 * @brief Discover RN2903 modules on local serial ports and keep a roster.
 *
 * @details
 * PURPOSE
 * -------
 * A host may have several USB-UART bridges plugged in, and only some of them
 * lead to an RN2903. This module walks the candidate ports, asks each one
 * `sys get ver`, and records which answered with an RN2903 banner.
 *
 * HOW IT WORKS
 * ------------
 * - Candidates come from /dev/serial/by-id (stable names). When that directory
 *   is missing, /dev/ttyUSB* and /dev/ttyACM* are globbed instead.
 * - Each candidate is opened at 57600 8N1 and probed through the same Driver
 *   the CLI uses (Driver::verify_device), then closed again.
 * - save_registry() writes the roster as devices.json next to config.json.
 *
 * @code
 *   [
 *     {"dev_path":"/dev/ttyUSB0","online":true,"version":"RN2903 1.0.3 Aug  8 2017 15:11:09"},
 *     {"dev_path":"/dev/ttyUSB1","online":false,"version":""}
 *   ]
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Probing writes to every candidate port. Do not scan while another program
 *   is using one of them.
 * - No locking: run one scan at a time.
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rn2903 {

struct DeviceInfo {
    std::string dev_path; /**< Absolute device path (e.g., "/dev/ttyUSB0"). */
    std::string version;  /**< Version banner, empty when the port did not answer. */
    bool online{false};   /**< True if the port answered with an RN2903 banner. */
};

/// Probe every candidate serial port. Never throws; failures mark entries offline.
std::vector<DeviceInfo> discover_devices();

nlohmann::json registry_to_json(const std::vector<DeviceInfo>& devices);

/// Write devices.json into @p dir (default: the config directory).
bool save_registry(const std::vector<DeviceInfo>& devices,
                   const std::filesystem::path& dir = {});

} // namespace rn2903
