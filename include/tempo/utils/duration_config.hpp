#pragma once

#include "tempo/duration_literal.hpp"
#include "tempo/expected.hpp"
#include "tempo/interval.hpp"

#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tempo::utils {

/**
 * @brief Error from loading duration settings
 *
 * `line` is 1-based. For Code::invalid_literal, `literal` holds the
 * parser's error for the value on that line.
 */
struct ConfigError {
    enum class Code : uint8_t {
        malformed_line,  ///< Not of the form `name = literal`
        duplicate_key,   ///< Name already defined on an earlier line
        invalid_literal  ///< Value is not a valid duration literal
    };

    Code code;
    std::size_t line{0};
    std::string key{};
    std::optional<LiteralError> literal{};

    [[nodiscard]] const char* message() const noexcept {
        switch (code) {
            case Code::malformed_line:
                return "expected 'name = duration'";
            case Code::duplicate_key:
                return "duration setting defined twice";
            case Code::invalid_literal:
                return literal ? literal->message() : "invalid duration literal";
        }
        return "unknown configuration error";
    }
};

/**
 * @brief Named duration settings loaded from text
 *
 * Format: one `name = literal` per line, `#` starts a comment, blank lines
 * are skipped. Every value goes through parse_duration_literal() at load
 * time, so a bad literal fails the whole load with its line number.
 *
 * Example:
 * @code
 *   # retry policy
 *   timeout  = 1m30s
 *   backoff  = 2.5s
 *   max_age  = 1d12h
 * @endcode
 */
class DurationConfig {
public:
    DurationConfig() = default;

    static expected<DurationConfig, ConfigError> load(std::istream& in) {
        DurationConfig config;
        std::string text;
        std::size_t line_number = 0;

        while (std::getline(in, text)) {
            ++line_number;
            std::string_view line = text;
            if (auto comment = line.find('#'); comment != std::string_view::npos) {
                line = line.substr(0, comment);
            }
            line = trim(line);
            if (line.empty()) {
                continue;
            }

            const auto equals = line.find('=');
            if (equals == std::string_view::npos) {
                return unexpected(ConfigError{ConfigError::Code::malformed_line, line_number});
            }
            const std::string_view key = trim(line.substr(0, equals));
            const std::string_view value = trim(line.substr(equals + 1));
            if (key.empty() || value.empty()) {
                return unexpected(ConfigError{ConfigError::Code::malformed_line, line_number,
                                              std::string(key)});
            }
            if (config.contains(key)) {
                return unexpected(ConfigError{ConfigError::Code::duplicate_key, line_number,
                                              std::string(key)});
            }

            auto interval = parse_duration_literal(value);
            if (!interval) {
                return unexpected(ConfigError{ConfigError::Code::invalid_literal, line_number,
                                              std::string(key), interval.error()});
            }
            config.values_.emplace(std::string(key), *interval);
        }
        return config;
    }

    std::optional<Interval> get(std::string_view key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Interval get_or(std::string_view key, Interval fallback) const {
        return get(key).value_or(fallback);
    }

    bool contains(std::string_view key) const { return values_.find(key) != values_.end(); }

    std::size_t size() const noexcept { return values_.size(); }

private:
    std::map<std::string, Interval, std::less<>> values_;

    static std::string_view trim(std::string_view s) noexcept {
        constexpr std::string_view whitespace = " \t\r";
        const auto first = s.find_first_not_of(whitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = s.find_last_not_of(whitespace);
        return s.substr(first, last - first + 1);
    }
};

} // namespace tempo::utils
