#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "rn2903/engine.hpp"
#include "mock_transport.hpp"

using namespace rn2903;
using rn2903::test::MockTransport;

TEST_CASE("transact writes once, reads once, strips CR LF and classifies") {
    MockTransport t;
    t.on("sys get ver", {"RN2903 1.0.3 Aug  8 2017 15:11:09"});
    Engine e(t);

    ClassifiedResponse r;
    REQUIRE(e.transact(make_sys_get_ver(), Expect::Value, 500, r).ok());
    CHECK(r.is(ResponseKind::OkWithValue));
    CHECK(r.text == LineStr("RN2903 1.0.3 Aug  8 2017 15:11:09"));

    CHECK(t.writes == std::vector<std::string>{"sys get ver"});
    CHECK(t.reads == 1);
    CHECK(t.last_timeout_ms == 500);
}

TEST_CASE("A device error is a successful transaction") {
    MockTransport t;
    t.on("radio set mod fsk", {"invalid_param"});
    Engine e(t);

    ClassifiedResponse r;
    CHECK(e.transact(make_radio_set_mod(ModulationMode::Fsk), Expect::Ack, 100, r).ok());
    CHECK(r.is_device_error(DeviceErrorKind::InvalidParameter));
    CHECK_FALSE(e.desynchronized());
}

TEST_CASE("Silence is Timeout and the next transaction discards stale input first") {
    MockTransport t;
    Engine e(t);

    ClassifiedResponse r;
    CHECK(e.transact(make_sys_get_vdd(), Expect::Value, 100, r).code == StatusCode::Timeout);
    CHECK(e.desynchronized());
    CHECK(t.discards == 0);

    // The late answer to "sys get vdd" shows up before the next command.
    t.push_line("3300");
    t.on("sys get ver", {"RN2903 1.0.3"});

    REQUIRE(e.transact(make_sys_get_ver(), Expect::Value, 100, r).ok());
    CHECK(t.discards == 1);
    CHECK(r.text == LineStr("RN2903 1.0.3"));      // not "3300"
    CHECK_FALSE(e.desynchronized());
}

TEST_CASE("Transport errors surface as IoFailure") {
    MockTransport t;
    Engine e(t);
    ClassifiedResponse r;

    t.fail_writes = true;
    CHECK(e.transact(make_sys_get_ver(), Expect::Value, 100, r).code == StatusCode::IoFailure);
    CHECK(t.reads == 0);                           // nothing to read after a failed write

    t.fail_writes = false;
    t.fail_reads  = true;
    CHECK(e.transact(make_sys_get_ver(), Expect::Value, 100, r).code == StatusCode::IoFailure);
    CHECK(e.desynchronized());
}

TEST_CASE("An over-long line is BadResponse and marks the link") {
    MockTransport t;
    Engine e(t);
    t.push_line(std::string(RN2903_LINE_MAX + 10, 'a'));

    ClassifiedResponse r;
    CHECK(e.await_response(Expect::Value, 100, r).code == StatusCode::BadResponse);
    CHECK(e.desynchronized());
    CHECK(t.pending() == 1);                       // remainder still buffered
}

TEST_CASE("await_response reads without writing") {
    MockTransport t;
    Engine e(t);
    t.push_line("radio_tx_ok");

    ClassifiedResponse r;
    REQUIRE(e.await_response(Expect::Value, 100, r).ok());
    CHECK(r.text == LineStr("radio_tx_ok"));
    CHECK(t.writes.empty());
}

TEST_CASE("A bare LF terminator is tolerated") {
    MockTransport t;
    Engine e(t);
    t.push_raw("ok\n");

    ClassifiedResponse r;
    REQUIRE(e.await_response(Expect::Ack, 100, r).ok());
    CHECK(r.is(ResponseKind::Ok));
}

namespace {
struct TraceLog {
    std::vector<std::string> lines;
};

void record(void* ctx, TraceDir dir, const char* text, size_t len) {
    static_cast<TraceLog*>(ctx)->lines.push_back(
        std::string(dir == TraceDir::Tx ? "tx=" : "rx=") + std::string(text, len));
}
} // namespace

TEST_CASE("Trace hook sees both directions without delimiters") {
    MockTransport t;
    t.on("mac pause", {"4294967245"});
    Engine e(t);
    TraceLog log;
    e.set_trace(&record, &log);

    ClassifiedResponse r;
    REQUIRE(e.transact(make_mac_pause(), Expect::Value, 100, r).ok());
    CHECK(log.lines == std::vector<std::string>{"tx=mac pause", "rx=4294967245"});
}
