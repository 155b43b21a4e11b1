#pragma once

#include "geo/GeoTypes.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace Atlas {

/**
 * @brief Most specific level of a location kept when naming output
 */
enum class LocationGranularity {
    City,
    County,
    State,
    Country
};

[[nodiscard]] const char* ToString(LocationGranularity granularity) noexcept;

/**
 * @brief Parse "city", "county", "state" or "country" (case-insensitive)
 */
[[nodiscard]] std::optional<LocationGranularity> ParseLocationGranularity(std::string_view name);

/**
 * @brief Replace fields finer than the granularity with fallback text
 *
 * Kept county and state fields that are missing are also filled with the
 * fallback. The country is never altered.
 */
[[nodiscard]] Geo::LocationData ApplyGranularity(const Geo::LocationData& location,
                                                 LocationGranularity granularity,
                                                 const std::string& fallback);

} // namespace Atlas
