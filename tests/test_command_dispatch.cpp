#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "command_dispatch.hpp"
#include "mock_transport.hpp"

using namespace rn2903;
using rn2903::test::MockTransport;

TEST_CASE("name_to_kind separates GET and SET vocabularies") {
    CommandKind k{};
    CHECK(name_to_kind("VER", false, k));
    CHECK(k == CommandKind::GET_VER);
    CHECK(name_to_kind("freq", true, k));
    CHECK(k == CommandKind::SET_FREQ);
    CHECK(name_to_kind("tx_pwr", true, k));
    CHECK(k == CommandKind::SET_PWR);

    CHECK_FALSE(name_to_kind("ver", true, k));       // read-only
    CHECK_FALSE(name_to_kind("sf", false, k));       // write-only
    CHECK_FALSE(name_to_kind("rssi", false, k));
}

TEST_CASE("parse_request resolves NVM addresses in hex") {
    Request r;
    std::string err;
    REQUIRE(parse_request("nvm:3FF", false, "", r, err));
    CHECK(r.kind == CommandKind::GET_NVM);
    CHECK(r.addr.value() == 0x3FF);
    CHECK(r.name == "nvm:3ff");

    REQUIRE(parse_request("nvm:310", true, "a5", r, err));
    CHECK(r.u32 == 0xA5);

    CHECK_FALSE(parse_request("nvm:200", false, "", r, err));
    CHECK(err == "bad_address:nvm(300..3ff)");
    CHECK_FALSE(parse_request("nvm", false, "", r, err));
    CHECK_FALSE(parse_request("nvm:300", true, "100", r, err));
}

TEST_CASE("parse_request validates values before any I/O") {
    Request r;
    std::string err;

    REQUIRE(parse_request("sf", true, "sf9", r, err));
    CHECK(r.u32 == 9);
    REQUIRE(parse_request("sf", true, "12", r, err));
    CHECK(r.u32 == 12);
    CHECK_FALSE(parse_request("sf", true, "99", r, err));
    CHECK(err == "bad_value:sf(7..12)");

    CHECK_FALSE(parse_request("freq", true, "868100000", r, err));
    CHECK_FALSE(parse_request("freq", true, "", r, err));
    CHECK_FALSE(parse_request("pwr", true, "-1", r, err));
    CHECK_FALSE(parse_request("mod", true, "gfsk", r, err));

    REQUIRE(parse_request("pin:gpio5", true, "on", r, err));
    CHECK(r.gpio == 5);
    CHECK(r.u32 == 1);
    CHECK(r.name == "pin:GPIO5");
    CHECK_FALSE(parse_request("pin:GPIO15", true, "1", r, err));

    CHECK_FALSE(parse_request("uptime", false, "", r, err));
    CHECK(err == "unknown_param:uptime");
}

TEST_CASE("Decimal parameters never read a leading zero as octal") {
    Request r;
    std::string err;
    REQUIRE(parse_request("wdt", true, "0100", r, err));
    CHECK(r.u32 == 100);
    REQUIRE(parse_request("freq", true, "0915000000", r, err));
    CHECK(r.u32 == 915000000u);

    CHECK_FALSE(parse_request("wdt", true, "0x10", r, err));
    CHECK(err == "bad_value:wdt_ms");
}

TEST_CASE("Radio kinds are wrapped in pause and resume") {
    MockTransport t;
    t.on("mac pause", {"4294967245"});
    t.on("radio set freq 915000000", {"ok"});
    t.on("mac resume", {"ok"});
    Driver d(t);

    Request r;
    std::string err;
    REQUIRE(parse_request("freq", true, "915000000", r, err));
    CHECK(is_radio_kind(r.kind));

    Fields f;
    REQUIRE(run_request(d, r, f).ok());
    CHECK(t.writes == std::vector<std::string>{"mac pause", "radio set freq 915000000", "mac resume"});
    REQUIRE(f.size() == 1);
    CHECK(f[0].first == "freq");
    CHECK(f[0].second == "915000000");
    CHECK(d.state().network_stack_active);
}

TEST_CASE("A failed radio op still resumes, and its own error is reported") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio get mod", {"invalid_param"});
    t.on("mac resume", {"ok"});
    Driver d(t);

    Request r;
    std::string err;
    REQUIRE(parse_request("mod", false, "", r, err));

    Fields f;
    CHECK(run_request(d, r, f) == Status::device_error(DeviceErrorKind::InvalidParameter));
    CHECK(t.writes.back() == "mac resume");
    CHECK(f.empty());
}

TEST_CASE("with_paused_stack skips the op when the pause is refused") {
    MockTransport t;
    t.on("mac pause", {"0"});
    Driver d(t);

    bool ran = false;
    Status st = with_paused_stack(d, [&]() { ran = true; return Status::success(); });
    CHECK(st == Status::from(StatusCode::CannotPause));
    CHECK_FALSE(ran);
    CHECK(t.writes == std::vector<std::string>{"mac pause"});
}

TEST_CASE("with_paused_stack reports a failed resume when the op succeeded") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("mac resume", {"busy"});
    Driver d(t);

    Status st = with_paused_stack(d, []() { return Status::success(); });
    CHECK(st.code == StatusCode::CannotResume);
    CHECK(st.device == DeviceErrorKind::Busy);
}

TEST_CASE("System kinds run without pausing") {
    MockTransport t;
    t.on("sys get hweui", {"0004A30B001A2B3C"});
    Driver d(t);

    Request r;
    std::string err;
    REQUIRE(parse_request("hweui", false, "", r, err));
    Fields f;
    REQUIRE(run_request(d, r, f).ok());
    CHECK(t.writes == std::vector<std::string>{"sys get hweui"});
    REQUIRE(f.size() == 1);
    CHECK(f[0].second == "0004A30B001A2B3C");
}

TEST_CASE("Exit codes group failures by class") {
    CHECK(exit_code_for(Status::success()) == 0);
    CHECK(exit_code_for(Status::from(StatusCode::IoFailure)) == 1);
    CHECK(exit_code_for(Status::from(StatusCode::InvalidArgument)) == 2);
    CHECK(exit_code_for(Status::from(StatusCode::Timeout)) == 3);
    CHECK(exit_code_for(Status::device_error(DeviceErrorKind::Busy)) == 4);
    CHECK(exit_code_for(Status::from(StatusCode::WrongDevice)) == 5);
    CHECK(exit_code_for(Status::from(StatusCode::TransceiverBusy)) == 6);
}
