#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Atlas {
namespace Geo {

// =============================================================================
// Errors
// =============================================================================

/**
 * @brief Failure categories reported by the geocoding engine
 */
enum class GeoError {
    InvalidArgument,   // Bad precision, malformed geohash, coordinate out of range
    IndexCorrupt,      // Index file structurally invalid
    DataCorrupt,       // Data or boundary file structurally invalid
    IoError,           // File missing, unreadable, or a read failed
    NotInitialized     // Service used before Initialize succeeded
};

[[nodiscard]] const char* ToString(GeoError error) noexcept;

// =============================================================================
// Coordinates and Bounds
// =============================================================================

/**
 * @brief Geographic coordinate (latitude, longitude) in degrees
 */
struct GeoCoordinate {
    double latitude = 0.0;   // -90 to 90
    double longitude = 0.0;  // -180 to 180

    GeoCoordinate() = default;
    GeoCoordinate(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool operator==(const GeoCoordinate& other) const = default;

    /**
     * @brief Check that both components are finite and in range
     */
    [[nodiscard]] bool IsValid() const;
};

/**
 * @brief Axis-aligned latitude/longitude rectangle
 */
struct GeoBounds {
    double minLatitude = 0.0;
    double maxLatitude = 0.0;
    double minLongitude = 0.0;
    double maxLongitude = 0.0;

    bool operator==(const GeoBounds& other) const = default;

    [[nodiscard]] GeoCoordinate Center() const {
        return {(minLatitude + maxLatitude) * 0.5, (minLongitude + maxLongitude) * 0.5};
    }

    [[nodiscard]] double Height() const { return maxLatitude - minLatitude; }
    [[nodiscard]] double Width() const { return maxLongitude - minLongitude; }

    /**
     * @brief Inclusive containment test
     */
    [[nodiscard]] bool Contains(double latitude, double longitude) const {
        return latitude >= minLatitude && latitude <= maxLatitude &&
               longitude >= minLongitude && longitude <= maxLongitude;
    }
};

// =============================================================================
// Locations
// =============================================================================

/**
 * @brief A single named place stored in the data file
 */
struct LocationEntry {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::string> district;
    std::optional<std::string> city;
    std::optional<std::string> county;
    std::optional<std::string> state;
    std::string country;          // ISO 3166-1 alpha-2 code
    uint32_t population = 0;

    bool operator==(const LocationEntry& other) const = default;

    /**
     * @brief Great-circle distance from this place to a point, in kilometers
     */
    [[nodiscard]] double DistanceKm(double lat, double lon) const;

    /**
     * @brief Structural estimate of the in-memory footprint of this entry
     */
    [[nodiscard]] size_t EstimateMemoryBytes() const;
};

/**
 * @brief Optional constraints applied while searching for the nearest place
 */
struct CandidateFilter {
    std::optional<uint32_t> minimumPopulation;
    std::optional<std::string> countryCode;   // Compared ASCII case-insensitively

    [[nodiscard]] bool Accepts(const LocationEntry& entry) const;
    [[nodiscard]] bool IsEmpty() const { return !minimumPopulation && !countryCode; }
};

/**
 * @brief Case-insensitive comparison of ISO country codes
 */
[[nodiscard]] bool CountryCodesEqual(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Nearest candidate found in a single cell
 */
struct NearestMatch {
    const LocationEntry* entry = nullptr;
    double distanceKm = 0.0;
};

/**
 * @brief Materialized contents of one geohash cell
 */
struct GeoCell {
    std::string geohash;
    GeoBounds bounds;                     // Always Geohash::DecodeBounds(geohash)
    std::vector<LocationEntry> entries;
    size_t estimatedMemoryBytes = 0;

    /**
     * @brief Linear scan for the closest entry within maxDistanceKm (inclusive)
     *
     * Entries rejected by the filter are skipped. Ties keep the earlier entry.
     */
    [[nodiscard]] std::optional<NearestMatch> FindNearest(double latitude, double longitude,
                                                          double maxDistanceKm,
                                                          const CandidateFilter& filter = {}) const;
};

/**
 * @brief Full answer of a nearest-place query
 */
struct GeoLookupResult {
    LocationEntry location;
    double distanceKm = 0.0;
    std::string cellGeohash;
    bool isFromNeighborCell = false;
};

/**
 * @brief Place description handed to callers of ReverseGeocode
 */
struct LocationData {
    std::optional<std::string> district;
    std::optional<std::string> city;
    std::optional<std::string> county;
    std::optional<std::string> state;
    std::string country;
    uint32_t population = 0;

    bool operator==(const LocationData& other) const = default;

    static LocationData FromEntry(const LocationEntry& entry);

    /**
     * @brief Human-readable "district, city, county, state, country" line
     */
    [[nodiscard]] std::string ToDisplayString() const;
};

// =============================================================================
// Utility Functions
// =============================================================================

constexpr double DegToRad(double deg) { return deg * 3.14159265358979323846 / 180.0; }

/**
 * @brief Earth's mean radius in kilometers
 */
constexpr double EARTH_RADIUS_KM = 6371.0;

/**
 * @brief Default distance bound for nearest-place queries
 */
constexpr double DEFAULT_MAX_DISTANCE_KM = 50.0;

} // namespace Geo
} // namespace Atlas
