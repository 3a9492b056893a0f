#include <doctest/doctest.h>
#include "rn2xx3/driver.hpp"
#include "mock_serial.hpp"
#include <string>
#include <vector>

using namespace rn2xx3;
using rn2xx3::test::MockSerial;
using Radio = Rn2483_868<MockSerial>;

// Poll until Ready or the attempt limit; returns the last status.
static PollStatus spin(Radio& rn, Outcome& out, int attempts = 64) {
    for (int i = 0; i < attempts; ++i) {
        if (rn.poll(out) == PollStatus::Ready) return PollStatus::Ready;
    }
    return PollStatus::Pending;
}

struct CaptureSink : LogSink {
    std::vector<std::string> lines;
    void write(LogLevel, const char* msg) override { lines.emplace_back(msg); }
};

TEST_CASE("hweui: labelled reply decodes to the 8-byte EUI") {
    MockSerial port;
    auto st = port.state();
    port.feed("HWEUI 0004A30B001C0530\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.hweui().ok());
    CHECK(rn.state() == State::Transmitting);

    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(st->tx == "sys get hweui\r\n");
    REQUIRE(out.ok());
    CHECK(out.command == Command::Kind::GetHwEui);

    uint8_t eui[8]{};
    REQUIRE(out.as_bytes(eui, sizeof eui));
    const uint8_t want[8] = { 0x00, 0x04, 0xA3, 0x0B, 0x00, 0x1C, 0x05, 0x30 };
    for (int i = 0; i < 8; ++i) CHECK(eui[i] == want[i]);
    CHECK(rn.state() == State::Idle);
    CHECK(rn.completed() == 1);
}

TEST_CASE("Module refusal surfaces as ModuleReportedError with the token") {
    MockSerial port;
    auto st = port.state();
    port.feed("invalid_param\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.submit(Command::set_data_rate(9)).ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(st->tx == "mac set dr 9\r\n");
    CHECK(out.error.kind == ErrorKind::ModuleReportedError);
    CHECK(out.error.module == ModuleError::InvalidParam);
    CHECK(out.error.token == ErrorToken("invalid_param"));
    CHECK_FALSE(out.error.retryable());
    CHECK(rn.state() == State::Idle);
}

TEST_CASE("Timeout after the poll budget, then the next command succeeds") {
    MockSerial port;
    auto st = port.state();
    DriverConfig cfg;
    cfg.max_polls = 5;
    Radio rn(std::move(port), cfg);

    REQUIRE(rn.join(JoinMode::Otaa).ok());
    Outcome out;
    for (int i = 0; i < 5; ++i) CHECK(rn.poll(out) == PollStatus::Pending);
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::Timeout);
    CHECK(out.error.retryable());
    CHECK(rn.state() == State::Idle);
    CHECK_FALSE(rn.line_open());                    // command was fully sent

    st->tx.clear();
    REQUIRE(rn.get_dev_eui().ok());
    for (char c : std::string("0004a30b001a55ed\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "mac get deveui\r\n");
}

TEST_CASE("Second submit is refused with Busy and does not disturb the first") {
    MockSerial port;
    auto st = port.state();
    port.feed("3300\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.vdd().ok());
    DriverError e = rn.hweui();
    CHECK(e.kind == ErrorKind::Busy);
    CHECK(e.retryable());

    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(st->tx == "sys get vdd\r\n");
    uint32_t mv = 0;
    REQUIRE(out.as_number(mv));
    CHECK(mv == 3300);
}

TEST_CASE("Overlong reply yields BufferOverflow and the driver recovers") {
    MockSerial port;
    DriverConfig cfg;
    cfg.line_limit = 8;
    port.feed("0123456789abcdef0123\r\n3300\r\n");
    Radio rn(std::move(port), cfg);

    REQUIRE(rn.hweui().ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::BufferOverflow);
    CHECK(rn.state() == State::Idle);

    REQUIRE(rn.vdd().ok());
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    uint32_t mv = 0;
    REQUIRE(out.as_number(mv));
    CHECK(mv == 3300);
}

TEST_CASE("destroy() hands the transport back for a fresh driver") {
    MockSerial port;
    auto st = port.state();
    port.feed("ok\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.save_config().ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());

    MockSerial back = std::move(rn).destroy();
    CHECK(back.state() == st);

    back.feed("invalid_param\r\n");
    Radio again(std::move(back));
    REQUIRE(again.sync().ok());
    REQUIRE(spin(again, out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "mac save\r\nz\r\n");
}

TEST_CASE("Events arriving during an exchange are queued for poll_event") {
    MockSerial port;
    port.feed("mac_tx_ok\r\nHWEUI 0004A30B001C0530\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.hweui().ok());
    Event ev;
    DriverError err;
    CHECK(rn.poll_event(ev, err) == PollStatus::Pending);   // nothing queued yet

    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());

    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.ok());
    CHECK(ev.kind == EventKind::TxOk);
    CHECK(rn.poll_event(ev, err) == PollStatus::Pending);
}

TEST_CASE("Event queue is bounded; overflowing events are counted") {
    MockSerial port;
    std::string wire;
    for (size_t i = 0; i < EVENT_QUEUE + 1; ++i) wire += "mac_err\r\n";
    wire += "on\r\n";
    port.feed(wire);
    Radio rn(std::move(port));

    REQUIRE(rn.get_adr().ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    bool on = false;
    REQUIRE(out.as_flag(on));
    CHECK(on);
    CHECK(rn.dropped_events() == 1);

    Event ev;
    DriverError err;
    for (size_t i = 0; i < EVENT_QUEUE; ++i) {
        REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
        CHECK(ev.kind == EventKind::TxFailed);
    }
    CHECK(rn.poll_event(ev, err) == PollStatus::Pending);
}

TEST_CASE("Join is two-phase: ok completes the command, accepted is an event") {
    MockSerial port;
    auto st = port.state();
    port.feed("ok\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.join(JoinMode::Otaa).ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "mac join otaa\r\n");

    Event ev;
    DriverError err;
    CHECK(rn.poll_event(ev, err) == PollStatus::Pending);
    for (char c : std::string("accepted\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.ok());
    CHECK(ev.kind == EventKind::JoinAccepted);
}

TEST_CASE("Immediate denied to mac join is a module error") {
    MockSerial port;
    port.feed("denied\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.join(JoinMode::Abp).ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::ModuleReportedError);
    CHECK(out.error.module == ModuleError::Denied);
}

TEST_CASE("Uplink with downlink, and a late invalid_data_len while idle") {
    MockSerial port;
    auto st = port.state();
    port.feed("ok\r\nmac_rx 101 000102feff\r\n");
    Radio rn(std::move(port));

    const uint8_t payload[] = { 0x23, 0xFF };
    REQUIRE(rn.transmit(ConfirmationMode::Unconfirmed, 42, payload, 2).ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "mac tx uncnf 42 23ff\r\n");

    Event ev;
    DriverError err;
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    REQUIRE(err.ok());
    CHECK(ev.kind == EventKind::Downlink);
    CHECK(ev.port == 101);
    CHECK(ev.data.size() == 5);

    for (char c : std::string("invalid_data_len\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.kind == ErrorKind::ModuleReportedError);
    CHECK(err.module == ModuleError::InvalidDataLength);
    CHECK(err.token == ErrorToken("invalid_data_len"));
}

TEST_CASE("Sleep: submissions refused until the wake-up ok") {
    MockSerial port;
    auto st = port.state();
    Radio rn(std::move(port));

    REQUIRE(rn.sleep(1000).ok());
    Outcome out;
    REQUIRE(rn.poll(out) == PollStatus::Ready);     // no immediate reply
    CHECK(out.ok());
    CHECK(st->tx == "sys sleep 1000\r\n");
    CHECK(rn.sleeping());

    CHECK(rn.hweui().kind == ErrorKind::SleepMode);

    Event ev;
    DriverError err;
    CHECK(rn.poll_event(ev, err) == PollStatus::Pending);
    for (char c : std::string("ok\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.ok());
    CHECK(ev.kind == EventKind::Wakeup);
    CHECK_FALSE(rn.sleeping());
    CHECK(rn.hweui().ok());
}

TEST_CASE("wake() clears a sleep whose wake-up was missed") {
    MockSerial port;
    Radio rn(std::move(port));
    REQUIRE(rn.sleep(100).ok());
    Outcome out;
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(rn.sleeping());
    rn.wake();
    CHECK_FALSE(rn.sleeping());
    CHECK(rn.vdd().ok());
}

TEST_CASE("expect_wakeup() takes over a module another owner put to sleep") {
    MockSerial port;
    auto st = port.state();
    Radio rn(std::move(port));

    REQUIRE(rn.expect_wakeup().ok());
    CHECK(rn.sleeping());
    CHECK(rn.hweui().kind == ErrorKind::SleepMode);

    for (char c : std::string("ok\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    Event ev;
    DriverError err;
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.ok());
    CHECK(ev.kind == EventKind::Wakeup);
    CHECK_FALSE(rn.sleeping());

    REQUIRE(rn.vdd().ok());
    CHECK(rn.expect_wakeup().kind == ErrorKind::Busy);
    Outcome out;
    CHECK(rn.poll(out) == PollStatus::Pending);
    CHECK(st->tx == "sys get vdd\r\n");
}

TEST_CASE("Writes that would block are resumed on the next poll") {
    MockSerial port;
    auto st = port.state();
    st->write_budget = 5;
    Radio rn(std::move(port));

    REQUIRE(rn.hweui().ok());
    Outcome out;
    CHECK(rn.poll(out) == PollStatus::Pending);
    CHECK(st->tx == "sys g");
    CHECK(rn.state() == State::Transmitting);

    st->write_budget = static_cast<size_t>(-1);
    for (char c : std::string("0004A30B001C0530\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "sys get hweui\r\n");
}

TEST_CASE("Timeout mid-send: the cut-off line is closed and its answer dropped") {
    MockSerial port;
    auto st = port.state();
    st->write_budget = 5;
    DriverConfig cfg;
    cfg.max_polls = 2;
    Radio rn(std::move(port), cfg);

    REQUIRE(rn.hweui().ok());
    Outcome out;
    CHECK(rn.poll(out) == PollStatus::Pending);
    CHECK(rn.poll(out) == PollStatus::Pending);
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::Timeout);
    CHECK(st->tx == "sys g");
    CHECK(rn.line_open());

    st->write_budget = static_cast<size_t>(-1);
    st->tx.clear();
    for (char c : std::string("invalid_param\r\n0004a30b001a55ed\r\n")) st->rx.push_back(static_cast<uint8_t>(c));

    REQUIRE(rn.get_dev_eui().ok());
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(st->tx == "\r\nmac get deveui\r\n");
    REQUIRE(out.ok());
    uint8_t eui[8]{};
    REQUIRE(out.as_bytes(eui, sizeof eui));
    CHECK(eui[7] == 0xED);
    CHECK_FALSE(rn.line_open());
    CHECK(st->rx.empty());
}

TEST_CASE("Cut right after the CR: only the LF is owed") {
    MockSerial port;
    auto st = port.state();
    st->write_budget = 12;                          // "sys get vdd\r" of "sys get vdd\r\n"
    DriverConfig cfg;
    cfg.max_polls = 1;
    Radio rn(std::move(port), cfg);

    REQUIRE(rn.vdd().ok());
    Outcome out;
    CHECK(rn.poll(out) == PollStatus::Pending);
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::Timeout);

    st->write_budget = static_cast<size_t>(-1);
    st->tx.clear();
    for (char c : std::string("3300\r\n3310\r\n")) st->rx.push_back(static_cast<uint8_t>(c));

    REQUIRE(rn.vdd().ok());
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(st->tx == "\nsys get vdd\r\n");
    uint32_t mv = 0;
    REQUIRE(out.as_number(mv));
    CHECK(mv == 3310);
}

TEST_CASE("Write error mid-send: the fragment's answer is dropped even while idle") {
    MockSerial port;
    auto st = port.state();
    st->write_budget = 3;
    Radio rn(std::move(port));

    REQUIRE(rn.get_adr().ok());
    Outcome out;
    CHECK(rn.poll(out) == PollStatus::Pending);
    st->write_budget = static_cast<size_t>(-1);
    st->write_error = true;
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::TransportError);
    CHECK(rn.line_open());

    st->tx.clear();
    REQUIRE(rn.sleep(1000).ok());
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.ok());
    CHECK(st->tx == "\r\nsys sleep 1000\r\n");
    CHECK(rn.sleeping());

    for (char c : std::string("invalid_param\r\nok\r\n")) st->rx.push_back(static_cast<uint8_t>(c));
    Event ev;
    DriverError err;
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.ok());
    CHECK(ev.kind == EventKind::Wakeup);
}

TEST_CASE("Stuttering transport still completes the exchange") {
    MockSerial port;
    auto st = port.state();
    st->stutter_reads = true;
    st->stutter_writes = true;
    port.feed("RN2483 1.0.3 Mar 22 2017 06:00:42\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.version().ok());
    Outcome out;
    REQUIRE(spin(rn, out, 500) == PollStatus::Ready);
    REQUIRE(out.ok());
    Model m = Model::RN2903;
    REQUIRE(out.as_model(m));
    CHECK(m == Model::RN2483);
    Text banner;
    REQUIRE(out.as_text(banner));
    CHECK(banner == Text("RN2483 1.0.3 Mar 22 2017 06:00:42"));
}

TEST_CASE("Transport failures end the exchange with TransportError") {
    MockSerial port;
    auto st = port.state();
    Radio rn(std::move(port));

    st->write_error = true;
    REQUIRE(rn.vdd().ok());
    Outcome out;
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::TransportError);
    CHECK(rn.state() == State::Idle);

    REQUIRE(rn.vdd().ok());
    st->read_error = true;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::TransportError);
}

TEST_CASE("Garbage reply is UnexpectedReply; blank lines are skipped") {
    MockSerial port;
    port.feed("\r\n\r\nwhat\r\n");
    Radio rn(std::move(port));

    REQUIRE(rn.get_up_counter().ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::UnexpectedReply);
}

TEST_CASE("Idle lines that are neither events nor errors are reported") {
    MockSerial port;
    port.feed("hello\r\n");
    Radio rn(std::move(port));

    Event ev;
    DriverError err;
    REQUIRE(rn.poll_event(ev, err) == PollStatus::Ready);
    CHECK(err.kind == ErrorKind::UnexpectedReply);
}

TEST_CASE("Refusals before anything reaches the wire") {
    MockSerial port;
    auto st = port.state();
    Radio rn(std::move(port));

    CHECK(rn.nvm_get(0x100).kind == ErrorKind::BadParameter);
    CHECK(rn.sleep(10).kind == ErrorKind::BadParameter);
    CHECK(rn.transmit(ConfirmationMode::Confirmed, 0, nullptr, 0).kind == ErrorKind::BadParameter);
    CHECK(rn.state() == State::Idle);

    Outcome out;
    REQUIRE(rn.poll(out) == PollStatus::Ready);
    CHECK(out.error.kind == ErrorKind::NoCommand);
    CHECK(st->tx.empty());
}

TEST_CASE("flush_input drops buffered bytes and partial lines") {
    MockSerial port;
    auto st = port.state();
    port.feed("stale\r\npart");
    Radio rn(std::move(port));

    CHECK(rn.flush_input().ok());
    CHECK(st->rx.empty());

    REQUIRE(rn.get_adr().ok());
    CHECK(rn.flush_input().kind == ErrorKind::Busy);
}

TEST_CASE("NVM round trip with trimmed addresses") {
    MockSerial port;
    auto st = port.state();
    port.feed("ok\r\n2a\r\n");
    Radio rn(std::move(port));

    Outcome out;
    REQUIRE(rn.nvm_set(0x3ab, 42).ok());
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    CHECK(out.ok());

    REQUIRE(rn.nvm_get(0x3ab).ok());
    REQUIRE(spin(rn, out) == PollStatus::Ready);
    uint8_t b = 0;
    REQUIRE(out.as_bytes(&b, 1));
    CHECK(b == 42);
    CHECK(st->tx == "sys set nvm 3ab 2a\r\nsys get nvm 3ab\r\n");
}

TEST_CASE("Log sink sees traffic and errors at the configured level") {
    CaptureSink sink;
    DriverConfig cfg;
    cfg.log_sink = &sink;
    cfg.log_level = LogLevel::Debug;

    MockSerial port;
    port.feed("invalid_param\r\n");
    Radio rn(std::move(port), cfg);

    REQUIRE(rn.submit(Command::set_data_rate(9)).ok());
    Outcome out;
    REQUIRE(spin(rn, out) == PollStatus::Ready);

    bool saw_send = false, saw_recv = false, saw_fail = false;
    for (const auto& l : sink.lines) {
        if (l == "send 'mac set dr 9'") saw_send = true;
        if (l == "recv 'invalid_param'") saw_recv = true;
        if (l.find("set_dr failed") != std::string::npos) saw_fail = true;
    }
    CHECK(saw_send);
    CHECK(saw_recv);
    CHECK(saw_fail);
}
