#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cred {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr double kMillisPerDay = 24.0 * 60.0 * 60.0 * 1000.0;

/**
 * @brief Build a time point from Unix epoch milliseconds
 */
TimePoint from_epoch_millis(int64_t millis);

// Largest magnitude of epoch milliseconds a TimePoint can represent
int64_t max_epoch_millis();

/**
 * @brief Range-checked from_epoch_millis
 *
 * @return nullopt for NaN, infinities and values a TimePoint cannot hold
 */
std::optional<TimePoint> checked_from_epoch_millis(double millis);

/**
 * @brief Milliseconds since the Unix epoch
 */
int64_t to_epoch_millis(TimePoint tp);

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" with an optional
 * "Z" or "+HH:MM"/"-HH:MM" suffix. A space may replace the 'T'.
 * Times without an offset are read as UTC.
 *
 * @return nullopt if the text is not a recognizable timestamp
 */
std::optional<TimePoint> parse_iso8601(const std::string& text);

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC)
 */
std::string format_iso8601(TimePoint tp);

// Signed fractional days from `from` to `to`
double days_between(TimePoint from, TimePoint to);

} // namespace cred
