#pragma once

/**
 * @file tempo.hpp
 * @brief Convenience header for the tempo timestamp library
 *
 * Primary types:
 * - Timestamp: absolute instant, seconds + nanoseconds since the Unix epoch
 * - Interval: signed duration with floor-encoded nanoseconds
 * - TimeZone / TimeZoneProvider: zone attachment and named-zone registry
 *
 * Text:
 * - format() / format_to() / to_string(): strftime-like rendering
 * - parse(): single pattern, pattern list, or free-form
 * - parse_duration_literal() / to_literal(): compact durations ("1d12h30m")
 */

#include "tempo/calendar.hpp"
#include "tempo/detail/parse_error.hpp"
#include "tempo/detail/parse_result.hpp"
#include "tempo/duration_literal.hpp"
#include "tempo/expected.hpp"
#include "tempo/format.hpp"
#include "tempo/interval.hpp"
#include "tempo/parse.hpp"
#include "tempo/precision.hpp"
#include "tempo/timestamp.hpp"
#include "tempo/timezone.hpp"
#include "tempo/utils/duration_config.hpp"
