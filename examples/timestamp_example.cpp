#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <tempo.hpp>

using namespace tempo;

namespace {

// Helper function to log timestamp details
void log_timestamp(const Timestamp& ts, std::string_view label) {
    auto text = to_string(ts);
    if (!text) {
        spdlog::error("{}: cannot render ({})", label, text.error().message());
        return;
    }
    spdlog::info("{}: {} (seconds={}, nanos={}, precision={})", label, *text, ts.seconds(),
                 ts.nanos(), precision_string(ts.precision()));
}

void log_literal(std::string_view literal) {
    auto interval = parse_duration_literal(literal);
    if (!interval) {
        spdlog::error("'{}' rejected at offset {} ('{}'): {}", literal,
                      interval.error().position, interval.error().token,
                      interval.error().message());
        return;
    }
    spdlog::info("'{}' -> {{{}, {}}} = {}", literal, interval->seconds(), interval->nanoseconds(),
                 to_literal(*interval));
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("tempo timestamp examples");

    // Example 1: Creating timestamps
    log_timestamp(Timestamp::now(), "Current time");
    log_timestamp(Timestamp::from_epoch(1'335'006'000), "From epoch seconds");
    log_timestamp(Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).nanos(123'456'000).build(),
                  "From builder");
    log_timestamp(Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).utc_offset(-4 * 3'600).build(),
                  "With fixed offset");

    // Example 2: Named zones
    TimeZoneProvider zones = TimeZoneProvider::with_utc();
    zones.add(ZoneRules("America/New_York", {{1'325'376'000, -18'000},
                                             {1'331'449'200, -14'400},
                                             {1'352'008'800, -18'000}}));
    if (auto ny = zones.find("America/New_York")) {
        auto built = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).tz(*ny);
        if (built) {
            log_timestamp(built->build(), "New York wall clock");
        } else {
            spdlog::error("zone lookup failed for {}: {}", built.error().zone,
                          built.error().message());
        }
    }
    if (auto missing = zones.find("Europe/Atlantis"); !missing) {
        spdlog::error("zone '{}': {}", missing.error().zone, missing.error().message());
    }

    // Example 3: Arithmetic
    auto start = Timestamp::ymd(2012, 4, 21).hms(11, 0, 0).build();
    auto later = start + Interval(5'400, 250'000'000);
    log_timestamp(later, "Start + 1h30m0.25s");
    std::ostringstream elapsed;
    elapsed << (later - start);
    spdlog::info("Elapsed: {}", elapsed.str());
    spdlog::info("Ratio of 1h to 30m: {}", Interval(3'600, 0) / Interval(1'800, 0));

    // Example 4: Formatting
    for (std::string_view pattern : {"%B %-d, %Y", "%Y-%m-%d %I:%M:%S %P", "%a %v %T%.3f", "%Q"}) {
        auto text = format(later, pattern);
        if (text) {
            spdlog::info("format '{}' -> '{}'", pattern, *text);
        } else {
            spdlog::error("format '{}' failed at offset {}: {}", pattern, text.error().position,
                          text.error().message());
        }
    }

    // Example 5: Parsing
    for (std::string_view input :
         {"2012-04-21 11:00:00", "2012-04-21T11:00:00.5-04:00", "April 21, 2012"}) {
        auto ts = parse(input);
        if (ts) {
            log_timestamp(*ts, input);
        } else {
            spdlog::error("parse '{}' failed: {}", input, ts.error().message());
        }
    }
    if (auto ts = parse("April 21, 2012", "%B %d, %Y")) {
        log_timestamp(*ts, "Explicit pattern");
    }

    // Example 6: Duration literals and settings
    for (std::string_view literal : {"1d12h30m", "-1.5s", "1h2d", "1h2h", "1.5h"}) {
        log_literal(literal);
    }

    std::istringstream settings("# polling\ninterval = 2.5s\ntimeout = 1m\n");
    auto config = utils::DurationConfig::load(settings);
    if (!config) {
        spdlog::error("settings line {}: {}", config.error().line, config.error().message());
        return 1;
    }
    spdlog::info("loaded {} duration settings, timeout={}", config->size(),
                 to_literal(config->get_or("timeout", Interval::zero())));

    return 0;
}
