#include "config/LocationGranularity.hpp"
#include <algorithm>
#include <cctype>

namespace Atlas {

const char* ToString(LocationGranularity granularity) noexcept {
    switch (granularity) {
        case LocationGranularity::City:    return "city";
        case LocationGranularity::County:  return "county";
        case LocationGranularity::State:   return "state";
        case LocationGranularity::Country: return "country";
    }
    return "city";
}

std::optional<LocationGranularity> ParseLocationGranularity(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "city") return LocationGranularity::City;
    if (lower == "county") return LocationGranularity::County;
    if (lower == "state") return LocationGranularity::State;
    if (lower == "country") return LocationGranularity::Country;
    return std::nullopt;
}

Geo::LocationData ApplyGranularity(const Geo::LocationData& location,
                                   LocationGranularity granularity,
                                   const std::string& fallback) {
    Geo::LocationData result = location;

    if (granularity != LocationGranularity::City) {
        result.district = fallback;
        result.city = fallback;
    }

    if (granularity <= LocationGranularity::County) {
        result.county = location.county.value_or(fallback);
    } else {
        result.county = fallback;
    }

    if (granularity <= LocationGranularity::State) {
        result.state = location.state.value_or(fallback);
    } else {
        result.state = fallback;
    }

    return result;
}

} // namespace Atlas
