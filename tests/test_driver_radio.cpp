#include <doctest/doctest.h>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include "rn2903/driver.hpp"
#include "mock_transport.hpp"

using namespace rn2903;
using rn2903::test::MockTransport;

static void pause_stack(Driver& d) {
    std::optional<uint32_t> ms;
    REQUIRE(d.mac_pause(ms).ok());
}

// ---------------- mac ----------------

TEST_CASE("mac_pause with ok pauses without a duration") {
    MockTransport t;
    t.on("mac pause", {"ok"});
    Driver d(t);

    std::optional<uint32_t> ms = 7u;
    REQUIRE(d.mac_pause(ms).ok());
    CHECK_FALSE(ms.has_value());
    CHECK_FALSE(d.state().network_stack_active);
}

TEST_CASE("mac_pause reports the device's pause duration") {
    MockTransport t;
    t.on("mac pause", {"4294967245"});
    Driver d(t);

    std::optional<uint32_t> ms;
    REQUIRE(d.mac_pause(ms).ok());
    REQUIRE(ms.has_value());
    CHECK(*ms == 4294967245u);
}

TEST_CASE("mac_pause with zero duration means the stack refused") {
    MockTransport t;
    t.on("mac pause", {"0"});
    Driver d(t);

    std::optional<uint32_t> ms;
    CHECK(d.mac_pause(ms).code == StatusCode::CannotPause);
    CHECK(d.state().network_stack_active);
}

TEST_CASE("mac_pause keeps the device error kind under CannotPause") {
    MockTransport t;
    t.on("mac pause", {"busy"});
    Driver d(t);

    std::optional<uint32_t> ms;
    CHECK(d.mac_pause(ms) == Status::from(StatusCode::CannotPause, DeviceErrorKind::Busy));
    CHECK(d.state().network_stack_active);
}

TEST_CASE("Pausing twice fails locally; resuming an active stack fails locally") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    Driver d(t);

    CHECK(d.mac_resume().code == StatusCode::CannotResume);
    CHECK(t.writes.empty());

    pause_stack(d);
    std::optional<uint32_t> ms;
    CHECK(d.mac_pause(ms).code == StatusCode::CannotPause);
    CHECK(t.writes.size() == 1);
}

TEST_CASE("Resume after pause restores MAC operations and disables radio") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("mac resume", {"ok"});
    t.on("mac get deveui", {"0004A30B001A2B3C"});
    Driver d(t);

    pause_stack(d);
    uint64_t eui = 0;
    CHECK(d.mac_get_deveui(eui).code == StatusCode::NetworkStackPaused);
    CHECK(t.writes.size() == 1);

    REQUIRE(d.mac_resume().ok());
    CHECK(d.state().network_stack_active);
    REQUIRE(d.mac_get_deveui(eui).ok());
    CHECK(eui == 0x0004A30B001A2B3Cull);

    const size_t before = t.writes.size();
    CHECK(d.radio_set_frequency(915000000).code == StatusCode::TransceiverBusy);
    CHECK(t.writes.size() == before);
}

TEST_CASE("mac_resume refused by the device keeps the stack paused") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("mac resume", {"mac_err"});
    Driver d(t);

    pause_stack(d);
    CHECK(d.mac_resume() == Status::from(StatusCode::CannotResume, DeviceErrorKind::MacError));
    CHECK_FALSE(d.state().network_stack_active);
}

TEST_CASE("mac_get_status decodes the hex status word") {
    MockTransport t;
    t.on("mac get status", {"00000401"});
    Driver d(t);

    uint32_t w = 0;
    REQUIRE(d.mac_get_status(w).ok());
    CHECK(w == 0x401u);
}

// ---------------- radio gating ----------------

TEST_CASE("Radio operation before pause fails with zero writes") {
    MockTransport t;
    Driver d(t);

    std::optional<Packet> pkt;
    CHECK(d.radio_set_modulation_mode(ModulationMode::LoRa).code == StatusCode::TransceiverBusy);
    CHECK(d.radio_rx(0, pkt).code == StatusCode::TransceiverBusy);
    CHECK(t.writes.empty());
    CHECK(t.reads == 0);
}

TEST_CASE("Pause followed immediately by a radio operation succeeds") {
    MockTransport t;
    t.on("mac pause", {"4294967245"});
    t.on("radio set mod lora", {"ok"});
    Driver d(t);

    pause_stack(d);
    CHECK(d.radio_set_modulation_mode(ModulationMode::LoRa).ok());
    CHECK(t.writes == std::vector<std::string>{"mac pause", "radio set mod lora"});
}

TEST_CASE("Device rejects a modulation command with invalid_param") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio set mod fsk", {"invalid_param"});
    Driver d(t);

    pause_stack(d);
    CHECK(d.radio_set_modulation_mode(ModulationMode::Fsk) ==
          Status::device_error(DeviceErrorKind::InvalidParameter));
}

TEST_CASE("Radio setters validate ranges before any I/O") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    Driver d(t);
    pause_stack(d);

    CHECK(d.radio_set_frequency(868100000).code == StatusCode::InvalidArgument);
    CHECK(d.radio_set_spreading_factor(6).code == StatusCode::InvalidArgument);
    CHECK(d.radio_set_spreading_factor(13).code == StatusCode::InvalidArgument);
    CHECK(d.radio_set_power(1).code == StatusCode::InvalidArgument);
    CHECK(d.radio_set_power(21).code == StatusCode::InvalidArgument);
    CHECK(d.radio_tx(Packet{}).code == StatusCode::InvalidArgument);
    CHECK(t.writes.size() == 1);
}

TEST_CASE("Radio getters and setters round the device") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio get mod", {"fsk"});
    t.on("radio get freq", {"923300000"});
    t.on("radio set freq 915000000", {"ok"});
    t.on("radio set sf sf9", {"ok"});
    t.on("radio set pwr 20", {"ok"});
    t.on("radio set wdt 0", {"ok"});
    Driver d(t);
    pause_stack(d);

    ModulationMode m = ModulationMode::LoRa;
    REQUIRE(d.radio_get_modulation_mode(m).ok());
    CHECK(m == ModulationMode::Fsk);

    uint32_t hz = 0;
    REQUIRE(d.radio_get_frequency(hz).ok());
    CHECK(hz == 923300000u);

    CHECK(d.radio_set_frequency(915000000).ok());
    CHECK(d.radio_set_spreading_factor(9).ok());
    CHECK(d.radio_set_power(20).ok());
    CHECK(d.radio_set_watchdog(0).ok());
}

// ---------------- radio rx ----------------

TEST_CASE("radio_rx returns the received packet") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"ok", "radio_rx  48656c6c6f"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt;
    REQUIRE(d.radio_rx(0, pkt).ok());
    REQUIRE(pkt.has_value());
    REQUIRE(pkt->size() == 5);
    CHECK(std::memcmp(pkt->data(), "Hello", 5) == 0);
    CHECK(t.last_timeout_ms == d.timeouts().rx_ms);
    CHECK_FALSE(d.state().radio_operation_in_flight);
}

TEST_CASE("radio_err after rx is the empty outcome, not an error") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"radio_err"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt = Packet{};
    Status st = d.radio_rx(0, pkt);
    CHECK(st.ok());
    CHECK_FALSE(pkt.has_value());

    t.on("radio rx 0", {"ok", "radio_err"});
    pkt = Packet{};
    CHECK(d.radio_rx(0, pkt).ok());
    CHECK_FALSE(pkt.has_value());
}

TEST_CASE("A radio_err line with trailing bytes still ends the rx window empty") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"ok", "radio_err\t"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt = Packet{};
    CHECK(d.radio_rx(0, pkt).ok());
    CHECK_FALSE(pkt.has_value());
    CHECK_FALSE(d.state().radio_operation_in_flight);
}

TEST_CASE("radio_rx surfaces busy as a device error") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"busy"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt;
    CHECK(d.radio_rx(0, pkt) == Status::device_error(DeviceErrorKind::Busy));
}

TEST_CASE("radio_rx rejects a malformed payload line") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"ok", "radio_rx 486"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt;
    CHECK(d.radio_rx(0, pkt).code == StatusCode::BadResponse);
    CHECK_FALSE(pkt.has_value());
}

TEST_CASE("rx timeout clears the in-flight flag and the next radio call succeeds") {
    MockTransport t;
    t.on("mac pause", {"4294967245"});
    t.on("radio set mod lora", {"ok"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt;
    CHECK(d.radio_rx(65535, pkt).code == StatusCode::Timeout);
    CHECK(t.writes.back() == "radio rx 65535");
    CHECK_FALSE(d.state().radio_operation_in_flight);

    CHECK(d.radio_set_modulation_mode(ModulationMode::LoRa).ok());
    CHECK(t.discards == 1);                          // stale input dropped first
}

TEST_CASE("rx window timeout comes from the explicit overload") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 100", {"ok"});
    Driver d(t);
    pause_stack(d);

    std::optional<Packet> pkt;
    CHECK(d.radio_rx(100, 250, pkt).code == StatusCode::Timeout);
    CHECK(t.last_timeout_ms == 250);
}

namespace {
struct Reentry {
    Driver* drv{nullptr};
    Status  seen;
    bool    fired{false};
};

// Fires while radio_rx is in progress and tries to start another radio command.
void reenter(void* ctx, TraceDir dir, const char*, size_t) {
    auto* r = static_cast<Reentry*>(ctx);
    if (dir != TraceDir::Tx || r->fired) return;
    r->fired = true;
    r->seen  = r->drv->radio_set_modulation_mode(ModulationMode::Fsk);
}
} // namespace

TEST_CASE("A second radio operation during rx is refused with RadioInFlight") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio rx 0", {"ok", "radio_err"});
    Driver d(t);
    pause_stack(d);

    Reentry r;
    r.drv = &d;
    d.set_trace(&reenter, &r);

    std::optional<Packet> pkt;
    CHECK(d.radio_rx(0, pkt).ok());
    REQUIRE(r.fired);
    CHECK(r.seen.code == StatusCode::RadioInFlight);
    CHECK(t.writes == std::vector<std::string>{"mac pause", "radio rx 0"});
}

// ---------------- radio tx ----------------

TEST_CASE("radio_tx waits for radio_tx_ok") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio tx 48656c6c6f", {"ok", "radio_tx_ok"});
    Driver d(t);
    pause_stack(d);

    Packet p;
    for (char c : std::string("Hello")) p.push_back(static_cast<uint8_t>(c));
    CHECK(d.radio_tx(p).ok());
    CHECK(t.last_timeout_ms == d.timeouts().tx_ms);
    CHECK_FALSE(d.state().radio_operation_in_flight);
}

TEST_CASE("radio_tx completion radio_err is a device error") {
    MockTransport t;
    t.on("mac pause", {"1000"});
    t.on("radio tx 01", {"ok", "radio_err"});
    Driver d(t);
    pause_stack(d);

    Packet p;
    p.push_back(0x01);
    CHECK(d.radio_tx(p) == Status::device_error(DeviceErrorKind::RadioError));

    t.on("radio tx 01", {"invalid_param"});
    CHECK(d.radio_tx(p) == Status::device_error(DeviceErrorKind::InvalidParameter));
    CHECK(t.reads == 4);                            // pause + (ok, radio_err) + invalid_param
}
