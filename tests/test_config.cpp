#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>   // getpid
#include "config.hpp"
#include "device_registry.hpp"

using namespace rn2903;
using json = nlohmann::json;
namespace fs = std::filesystem;

static fs::path scratch_dir(const char* tag) {
    fs::path p = fs::temp_directory_path() /
                 ("rn2903-test-" + std::string(tag) + "-" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(p, ec);
    return p;
}

TEST_CASE("Defaults match the module's factory settings") {
    Config c;
    CHECK(c.dev == "/dev/ttyUSB0");
    CHECK(c.baud == 57600);
    CHECK(c.timeout_ms == 1000);
    CHECK(c.rx_timeout_ms == 15000);
    CHECK(c.tx_timeout_ms == 10000);
    CHECK(c.boot_delay_ms == 100);
    CHECK(c.verify);
}

TEST_CASE("config_from_json applies good fields and reports bad ones") {
    json j = {
        {"dev", "/dev/ttyAMA0"},
        {"baud", "fast"},
        {"timeout_ms", 2500},
        {"verify", false},
        {"rx_timeout_ms", -5},
        {"tx_timeout_ms", 45000},
    };
    Config c;
    std::vector<std::string> warnings;
    REQUIRE(config_from_json(j, c, warnings));

    CHECK(c.dev == "/dev/ttyAMA0");
    CHECK(c.baud == 57600);                          // kept default
    CHECK(c.timeout_ms == 2500);
    CHECK(c.rx_timeout_ms == 15000);
    CHECK(c.tx_timeout_ms == 45000);
    CHECK_FALSE(c.verify);
    CHECK(warnings == std::vector<std::string>{"bad_field:baud", "bad_field:rx_timeout_ms"});
}

TEST_CASE("config_from_json rejects a non-object document") {
    Config c;
    std::vector<std::string> warnings;
    CHECK_FALSE(config_from_json(json::array({1, 2}), c, warnings));
    CHECK(warnings.size() == 1);
}

TEST_CASE("A missing config file means defaults") {
    Config c;
    std::vector<std::string> warnings;
    CHECK(load_config(scratch_dir("missing") / "config.json", c, warnings));
    CHECK(warnings.empty());
    CHECK(c.baud == 57600);
}

TEST_CASE("save_config then load_config restores the settings") {
    const fs::path dir = scratch_dir("save");
    Config c;
    c.dev = "/dev/serial/by-id/usb-FTDI-if00";
    c.timeout_ms = 1500;
    c.tx_timeout_ms = 60000;
    c.verify = false;

    std::string err;
    REQUIRE(save_config(dir / "config.json", c, err));
    CHECK_FALSE(fs::exists(dir / "config.json.tmp"));

    Config back;
    std::vector<std::string> warnings;
    REQUIRE(load_config(dir / "config.json", back, warnings));
    CHECK(warnings.empty());
    CHECK(back.dev == c.dev);
    CHECK(back.timeout_ms == 1500);
    CHECK(back.tx_timeout_ms == 60000);
    CHECK_FALSE(back.verify);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Malformed JSON is reported, not thrown") {
    const fs::path dir = scratch_dir("bad");
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "config.json");
        out << "{ \"dev\": ";
    }
    Config c;
    std::vector<std::string> warnings;
    CHECK_FALSE(load_config(dir / "config.json", c, warnings));
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].rfind("config_parse_error:", 0) == 0);
    CHECK(c.dev == "/dev/ttyUSB0");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("timeouts_from maps command, rx and tx deadlines") {
    Config c;
    c.timeout_ms = 5000;
    c.rx_timeout_ms = 30000;
    c.tx_timeout_ms = 40000;
    DriverTimeouts t = timeouts_from(c);
    CHECK(t.command_ms == 5000);
    CHECK(t.rx_ms == 30000);
    CHECK(t.tx_ms == 40000);
    CHECK(t.reset_ms == 5000);                       // never shorter than a command
}

TEST_CASE("Registry JSON lists every probed port") {
    std::vector<DeviceInfo> devs = {
        {"/dev/ttyUSB0", "RN2903 1.0.3 Aug  8 2017 15:11:09", true},
        {"/dev/ttyUSB1", "", false},
    };
    json j = registry_to_json(devs);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["dev_path"].get<std::string>() == "/dev/ttyUSB0");
    CHECK(j[0]["online"].get<bool>());
    CHECK(j[1]["version"].get<std::string>().empty());

    const fs::path dir = scratch_dir("registry");
    REQUIRE(save_registry(devs, dir));
    CHECK(fs::exists(dir / "devices.json"));
    std::error_code ec;
    fs::remove_all(dir, ec);
}
