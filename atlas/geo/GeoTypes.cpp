#include "geo/GeoTypes.hpp"
#include "geo/Geohash.hpp"
#include <cctype>
#include <cmath>

namespace Atlas {
namespace Geo {

const char* ToString(GeoError error) noexcept {
    switch (error) {
        case GeoError::InvalidArgument: return "InvalidArgument";
        case GeoError::IndexCorrupt:    return "IndexCorrupt";
        case GeoError::DataCorrupt:     return "DataCorrupt";
        case GeoError::IoError:         return "IoError";
        case GeoError::NotInitialized:  return "NotInitialized";
    }
    return "Unknown";
}

bool GeoCoordinate::IsValid() const {
    return std::isfinite(latitude) && std::isfinite(longitude) &&
           latitude >= -90.0 && latitude <= 90.0 &&
           longitude >= -180.0 && longitude <= 180.0;
}

// =============================================================================
// LocationEntry
// =============================================================================

double LocationEntry::DistanceKm(double lat, double lon) const {
    return Geohash::HaversineDistance(latitude, longitude, lat, lon);
}

size_t LocationEntry::EstimateMemoryBytes() const {
    auto optionalSize = [](const std::optional<std::string>& value) {
        return value ? value->size() : size_t{0};
    };

    return sizeof(LocationEntry) + country.size() +
           optionalSize(district) + optionalSize(city) +
           optionalSize(county) + optionalSize(state);
}

// =============================================================================
// CandidateFilter
// =============================================================================

bool CountryCodesEqual(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool CandidateFilter::Accepts(const LocationEntry& entry) const {
    if (minimumPopulation && entry.population < *minimumPopulation) {
        return false;
    }
    if (countryCode && !CountryCodesEqual(entry.country, *countryCode)) {
        return false;
    }
    return true;
}

// =============================================================================
// GeoCell
// =============================================================================

std::optional<NearestMatch> GeoCell::FindNearest(double latitude, double longitude,
                                                 double maxDistanceKm,
                                                 const CandidateFilter& filter) const {
    std::optional<NearestMatch> best;

    for (const auto& entry : entries) {
        if (!filter.Accepts(entry)) {
            continue;
        }

        double distance = entry.DistanceKm(latitude, longitude);
        if (distance > maxDistanceKm) {
            continue;
        }

        if (!best || distance < best->distanceKm) {
            best = NearestMatch{&entry, distance};
        }
    }

    return best;
}

// =============================================================================
// LocationData
// =============================================================================

LocationData LocationData::FromEntry(const LocationEntry& entry) {
    LocationData data;
    data.district = entry.district;
    data.city = entry.city;
    data.county = entry.county;
    data.state = entry.state;
    data.country = entry.country;
    data.population = entry.population;
    return data;
}

std::string LocationData::ToDisplayString() const {
    std::string result;
    auto append = [&result](const std::string& part) {
        if (part.empty()) return;
        if (!result.empty()) result += ", ";
        result += part;
    };

    if (district) append(*district);
    if (city) append(*city);
    if (county) append(*county);
    if (state) append(*state);
    append(country);
    return result;
}

} // namespace Geo
} // namespace Atlas
