#include <doctest/doctest.h>
#include "rn2xx3/log.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace rn2xx3;

namespace {
struct Capture : LogSink {
    std::vector<std::pair<LogLevel, std::string>> got;
    void write(LogLevel level, const char* msg) override { got.emplace_back(level, msg); }
};
}

TEST_CASE("Logger filters below the minimum level") {
    Capture sink;
    Logger log(&sink, LogLevel::Warn);
    log.logf(LogLevel::Debug, "hidden %d", 1);
    log.logf(LogLevel::Error, "shown %d", 2);
    REQUIRE(sink.got.size() == 1);
    CHECK(sink.got[0].first == LogLevel::Error);
    CHECK(sink.got[0].second == "shown 2");
}

TEST_CASE("Logger without a sink is inert; long messages are clipped") {
    Logger quiet;
    CHECK_FALSE(quiet.enabled(LogLevel::Error));
    quiet.logf(LogLevel::Error, "nobody hears this");

    Capture sink;
    Logger log(&sink, LogLevel::Trace);
    std::string big(RN2XX3_LOG_LINE_MAX * 2, 'x');
    log.logf(LogLevel::Info, "%s", big.c_str());
    REQUIRE(sink.got.size() == 1);
    CHECK(sink.got[0].second.size() == RN2XX3_LOG_LINE_MAX - 1);
}
