// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file device_registry.cpp
 */

#include "device_registry.hpp"
#include "config.hpp"                                  // default_config_dir()
#include "rn2903/driver.hpp"
#include "rn2903/transport/transport_linux_serial.hpp"

#include <filesystem>         // walking /dev/serial/by-id
#include <fstream>            // writing devices.json
#include <iostream>           // std::cerr for error reporting
#include <glob.h>             // glob(3) for tty fallbacks
#include <system_error>       // non-throwing filesystem ops

namespace fs = std::filesystem;

namespace rn2903 {

// ---------------------------------------------------------------------------
// Probe-time constants.
// - PROBE_BAUD:       RN2903 factory rate.
// - PROBE_TIMEOUT_MS: per device, so the whole scan stays bounded.
// - PROBE_BOOT_MS:    settle time after open.
// ---------------------------------------------------------------------------
static constexpr int      PROBE_BAUD       = 57600;
static constexpr uint32_t PROBE_TIMEOUT_MS = 1200;
static constexpr int      PROBE_BOOT_MS    = 100;


// -------- helpers --------

/*
 * probe_version()
 * ---------------
 * Open a candidate port, run verify_device(), close. Returns the banner, or
 * {} when the port could not be opened, stayed silent, or is not an RN2903.
 */
static std::string probe_version(const std::string& dev_path) {
    transport::LinuxSerial link;
    if (!link.open(dev_path, PROBE_BAUD, PROBE_BOOT_MS)) return {};

    DriverTimeouts t;
    t.command_ms = PROBE_TIMEOUT_MS;
    Driver drv(link, t);

    LineStr banner;
    if (!drv.verify_device(banner).ok()) return {};
    return std::string(banner.c_str());
}

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern. Always globfree().
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}


// -------- public API --------

std::vector<DeviceInfo> discover_devices() {
    std::vector<DeviceInfo> result;
    std::vector<std::string> candidates;

    std::error_code ec;
    const fs::path by_id("/dev/serial/by-id");
    if (fs::exists(by_id, ec)) {
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_symlink(ec)) continue;
            std::error_code cec;
            auto canon = fs::canonical(it->path(), cec);
            if (!cec) candidates.push_back(canon.string());
        }
    } else {
        append_glob(candidates, "/dev/ttyUSB*");
        append_glob(candidates, "/dev/ttyACM*");
    }

    for (const auto& dev : candidates) {
        std::string ver = probe_version(dev);
        result.push_back({dev, ver, !ver.empty()});
    }
    return result;
}

nlohmann::json registry_to_json(const std::vector<DeviceInfo>& devices) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : devices) {
        arr.push_back({{"dev_path", d.dev_path}, {"online", d.online}, {"version", d.version}});
    }
    return arr;
}

bool save_registry(const std::vector<DeviceInfo>& devices, const fs::path& dir) {
    const fs::path conf = dir.empty() ? default_config_dir() : dir;
    std::error_code ec;
    fs::create_directories(conf, ec);
    if (ec) { std::cerr << "status=error reason=config_dir " << ec.message() << "\n"; return false; }

    std::ofstream ofs(conf / "devices.json");
    if (!ofs) { std::cerr << "status=error reason=open_failed file=devices.json\n"; return false; }

    ofs << registry_to_json(devices).dump(2) << "\n";
    return static_cast<bool>(ofs);
}

} // namespace rn2903
