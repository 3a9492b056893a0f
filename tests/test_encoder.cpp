#include <doctest/doctest.h>
#include "rn2xx3/encoder.hpp"
#include <string>

using namespace rn2xx3;

static std::string wire(const Command& cmd) {
    CommandLine line;
    REQUIRE(encode(cmd, line));
    return std::string(line.c_str());
}

static const uint8_t EUI[8]  = { 0x00, 0x04, 0xA3, 0x0B, 0x00, 0x1A, 0x55, 0xED };
static const uint8_t ADDR[4] = { 0x26, 0x01, 0x1B, 0xDA };
static const uint8_t KEY[16] = { 0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
                                 0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF };

TEST_CASE("sys commands render their exact wire text") {
    CHECK(wire(Command::reset())         == "sys reset\r\n");
    CHECK(wire(Command::factory_reset()) == "sys factoryRESET\r\n");
    CHECK(wire(Command::get_version())   == "sys get ver\r\n");
    CHECK(wire(Command::get_hweui())     == "sys get hweui\r\n");
    CHECK(wire(Command::get_vdd())       == "sys get vdd\r\n");
    CHECK(wire(Command::sleep(1000))     == "sys sleep 1000\r\n");
    CHECK(wire(Command::sync())          == "z\r\n");
}

TEST_CASE("NVM address is trimmed hex, byte is always two digits") {
    CHECK(wire(Command::nvm_set(0x3ab, 42))   == "sys set nvm 3ab 2a\r\n");
    CHECK(wire(Command::nvm_set(0x300, 0x05)) == "sys set nvm 300 05\r\n");
    CHECK(wire(Command::nvm_get(0x3ff))       == "sys get nvm 3ff\r\n");
}

TEST_CASE("mac identity and key setters render lowercase hex") {
    CHECK(wire(Command::set_dev_addr(ADDR, 4)) == "mac set devaddr 26011bda\r\n");
    CHECK(wire(Command::set_dev_eui(EUI, 8))   == "mac set deveui 0004a30b001a55ed\r\n");
    CHECK(wire(Command::set_app_eui(EUI, 8))   == "mac set appeui 0004a30b001a55ed\r\n");
    CHECK(wire(Command::set_network_session_key(KEY, 16))
          == "mac set nwkskey 00112233445566778899aabbccddeeff\r\n");
    CHECK(wire(Command::set_app_session_key(KEY, 16))
          == "mac set appskey 00112233445566778899aabbccddeeff\r\n");
    CHECK(wire(Command::set_app_key(KEY, 16))
          == "mac set appkey 00112233445566778899aabbccddeeff\r\n");

    CHECK(wire(Command::get_dev_addr()) == "mac get devaddr\r\n");
    CHECK(wire(Command::get_dev_eui())  == "mac get deveui\r\n");
    CHECK(wire(Command::get_app_eui())  == "mac get appeui\r\n");
}

TEST_CASE("mac settings and counters") {
    CHECK(wire(Command::save_config())            == "mac save\r\n");
    CHECK(wire(Command::set_adr(true))            == "mac set adr on\r\n");
    CHECK(wire(Command::set_adr(false))           == "mac set adr off\r\n");
    CHECK(wire(Command::get_adr())                == "mac get adr\r\n");
    CHECK(wire(Command::set_up_counter(4294967295u)) == "mac set upctr 4294967295\r\n");
    CHECK(wire(Command::get_up_counter())         == "mac get upctr\r\n");
    CHECK(wire(Command::set_down_counter(0))      == "mac set dnctr 0\r\n");
    CHECK(wire(Command::get_down_counter())       == "mac get dnctr\r\n");
    CHECK(wire(Command::set_data_rate(DataRateEuCn::Sf9Bw125)) == "mac set dr 3\r\n");
    CHECK(wire(Command::set_data_rate(DataRateUs::Sf8Bw500))   == "mac set dr 4\r\n");
    CHECK(wire(Command::get_data_rate())          == "mac get dr\r\n");
}

TEST_CASE("join and transmit") {
    CHECK(wire(Command::join(JoinMode::Otaa)) == "mac join otaa\r\n");
    CHECK(wire(Command::join(JoinMode::Abp))  == "mac join abp\r\n");

    const uint8_t payload[] = { 0x23, 0xFF };
    CHECK(wire(Command::transmit(ConfirmationMode::Unconfirmed, 42, payload, 2))
          == "mac tx uncnf 42 23ff\r\n");
    CHECK(wire(Command::transmit(ConfirmationMode::Confirmed, 1, payload, 2))
          == "mac tx cnf 1 23ff\r\n");
}

TEST_CASE("largest payload still fits the command buffer") {
    uint8_t payload[PAYLOAD_MAX];
    for (size_t i = 0; i < PAYLOAD_MAX; ++i) payload[i] = static_cast<uint8_t>(i);
    CommandLine line;
    REQUIRE(encode(Command::transmit(ConfirmationMode::Confirmed, 223, payload, PAYLOAD_MAX), line));
    CHECK(line.size() == 15 + 2 * PAYLOAD_MAX + 2);   // "mac tx cnf 223 " + hex + CRLF
}

TEST_CASE("encoding into a too-small buffer fails and leaves it empty") {
    etl::string<8> small("junk");
    CHECK_FALSE(encode(Command::get_hweui(), small));
    CHECK(small.empty());
}
