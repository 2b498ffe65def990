/**
 * @file PlaylistDate.hpp
 * @brief Calendar date a playlist is generated for.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace playoutplanner::domain {

/**
 * @struct PlaylistDate
 * @brief Proleptic Gregorian date ("YYYY-MM-DD").
 */
struct PlaylistDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief Parses "YYYY-MM-DD", rejecting impossible dates. */
    static std::optional<PlaylistDate> Parse(const std::string& text);

    /** @brief Current local calendar date. */
    static PlaylistDate Today();

    std::string toString() const;

    /** @brief Seconds since the Unix epoch at 00:00:00 UTC of this date. */
    std::int64_t midnightEpochSeconds() const;

    /** @brief The following calendar day. */
    PlaylistDate next() const;

    bool operator==(const PlaylistDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

} // namespace playoutplanner::domain
