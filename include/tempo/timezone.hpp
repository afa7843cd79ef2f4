#pragma once

#include "tempo/expected.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstdint>
#include <cstdlib>

namespace tempo {

/**
 * @brief Error from a timezone offset lookup
 *
 * Lookup failures are propagated to the caller; tempo never falls back to
 * UTC when a zone cannot be resolved.
 */
struct TimeZoneError {
    enum class Code : uint8_t {
        unknown_zone, ///< No zone registered under the identifier
        out_of_range  ///< Instant precedes the zone's first offset transition
    };

    Code code;
    std::string zone;   ///< Identifier of the zone that failed
    int64_t instant{0}; ///< Instant being resolved (seconds since epoch)

    [[nodiscard]] const char* message() const noexcept {
        switch (code) {
            case Code::unknown_zone:
                return "unknown timezone identifier";
            case Code::out_of_range:
                return "instant outside the timezone's offset table";
        }
        return "unknown timezone error";
    }
};

/// One row of a zone's offset table: `offset_seconds` applies from `since` onward
struct OffsetTransition {
    int64_t since;
    int32_t offset_seconds;
};

/// Largest accepted magnitude for a UTC offset (exclusive)
inline constexpr int32_t MAX_UTC_OFFSET_SECONDS = 86'400;

/**
 * Offset table for a named zone.
 *
 * Transitions are kept sorted by `since`. An instant before the first
 * transition has no defined offset and fails with Code::out_of_range.
 * Immutable after construction; shared between TimeZone values.
 */
class ZoneRules {
public:
    ZoneRules(std::string id, std::vector<OffsetTransition> transitions)
        : id_(std::move(id)),
          transitions_(std::move(transitions)) {
        if (id_.empty()) {
            throw std::invalid_argument("zone identifier must not be empty");
        }
        if (transitions_.empty()) {
            throw std::invalid_argument("zone '" + id_ + "' needs at least one transition");
        }
        for (const auto& t : transitions_) {
            if (std::abs(t.offset_seconds) >= MAX_UTC_OFFSET_SECONDS) {
                throw std::invalid_argument("zone '" + id_ + "' has an offset beyond 24 hours");
            }
        }
        std::sort(transitions_.begin(), transitions_.end(),
                  [](const OffsetTransition& a, const OffsetTransition& b) {
                      return a.since < b.since;
                  });
    }

    /// Zone with a single offset valid for every instant
    static ZoneRules constant(std::string id, int32_t offset_seconds) {
        return ZoneRules(std::move(id), {{std::numeric_limits<int64_t>::min(), offset_seconds}});
    }

    const std::string& id() const noexcept { return id_; }
    const std::vector<OffsetTransition>& transitions() const noexcept { return transitions_; }

    expected<int32_t, TimeZoneError> offset_at(int64_t instant) const {
        auto it = std::upper_bound(
            transitions_.begin(), transitions_.end(), instant,
            [](int64_t value, const OffsetTransition& t) { return value < t.since; });
        if (it == transitions_.begin()) {
            return unexpected(TimeZoneError{TimeZoneError::Code::out_of_range, id_, instant});
        }
        return std::prev(it)->offset_seconds;
    }

private:
    std::string id_;
    std::vector<OffsetTransition> transitions_;
};

/**
 * Timezone attachment of a Timestamp: a closed set of three cases.
 *
 * - Unspecified: no zone; wall-clock fields are reported at offset 0
 * - FixedOffset: constant offset in seconds east of UTC
 * - Named: offset resolved from a ZoneRules table per instant
 *
 * The tag never changes the absolute instant of a Timestamp; it only selects
 * which wall-clock fields accessors and the formatter report.
 */
class TimeZone {
public:
    struct Unspecified {
        constexpr bool operator==(const Unspecified&) const noexcept = default;
    };

    struct FixedOffset {
        int32_t seconds{0};
        constexpr bool operator==(const FixedOffset&) const noexcept = default;
    };

    struct Named {
        std::shared_ptr<const ZoneRules> rules;
        bool operator==(const Named& other) const noexcept {
            return rules == other.rules ||
                   (rules && other.rules && rules->id() == other.rules->id());
        }
    };

    using Variant = std::variant<Unspecified, FixedOffset, Named>;

    TimeZone() noexcept = default;

    static TimeZone unspecified() noexcept { return TimeZone(); }

    static TimeZone utc() noexcept { return TimeZone(FixedOffset{0}); }

    static TimeZone fixed(int32_t offset_seconds) {
        if (std::abs(offset_seconds) >= MAX_UTC_OFFSET_SECONDS) {
            throw std::invalid_argument("UTC offset must be less than 24 hours");
        }
        return TimeZone(FixedOffset{offset_seconds});
    }

    static TimeZone named(std::shared_ptr<const ZoneRules> rules) {
        if (!rules) {
            throw std::invalid_argument("named timezone requires zone rules");
        }
        return TimeZone(Named{std::move(rules)});
    }

    bool is_unspecified() const noexcept { return std::holds_alternative<Unspecified>(zone_); }
    bool is_fixed() const noexcept { return std::holds_alternative<FixedOffset>(zone_); }
    bool is_named() const noexcept { return std::holds_alternative<Named>(zone_); }

    const Variant& variant() const noexcept { return zone_; }

    /// Zone identifier for Named zones, empty otherwise
    std::string_view id() const noexcept {
        if (const auto* named = std::get_if<Named>(&zone_)) {
            return named->rules->id();
        }
        return {};
    }

    /// Offset east of UTC in effect at `instant` (seconds since epoch)
    expected<int32_t, TimeZoneError> offset_seconds(int64_t instant) const {
        return std::visit(
            [instant](const auto& zone) -> expected<int32_t, TimeZoneError> {
                using T = std::decay_t<decltype(zone)>;
                if constexpr (std::is_same_v<T, Unspecified>) {
                    return 0;
                } else if constexpr (std::is_same_v<T, FixedOffset>) {
                    return zone.seconds;
                } else {
                    return zone.rules->offset_at(instant);
                }
            },
            zone_);
    }

    bool operator==(const TimeZone&) const = default;

private:
    explicit TimeZone(Variant zone) noexcept : zone_(std::move(zone)) {}

    Variant zone_{Unspecified{}};
};

/**
 * Registry of named zones.
 *
 * Populate with add() before use; afterwards lookups only read the
 * registry, so a fully populated provider may be shared between threads.
 */
class TimeZoneProvider {
public:
    TimeZoneProvider() = default;

    /// Provider pre-populated with "UTC"
    static TimeZoneProvider with_utc() {
        TimeZoneProvider provider;
        provider.add(ZoneRules::constant("UTC", 0));
        return provider;
    }

    /// Register (or replace) a zone under its identifier
    void add(ZoneRules rules) {
        auto id = rules.id();
        zones_[std::move(id)] = std::make_shared<const ZoneRules>(std::move(rules));
    }

    bool contains(std::string_view id) const { return zones_.find(id) != zones_.end(); }

    std::size_t size() const noexcept { return zones_.size(); }

    expected<TimeZone, TimeZoneError> find(std::string_view id) const {
        auto it = zones_.find(id);
        if (it == zones_.end()) {
            return unexpected(TimeZoneError{TimeZoneError::Code::unknown_zone, std::string(id)});
        }
        return TimeZone::named(it->second);
    }

    expected<int32_t, TimeZoneError> offset_seconds(std::string_view id, int64_t instant) const {
        return find(id).and_then(
            [instant](const TimeZone& tz) { return tz.offset_seconds(instant); });
    }

private:
    std::map<std::string, std::shared_ptr<const ZoneRules>, std::less<>> zones_;
};

} // namespace tempo
