#pragma once

#include "geo/boundaries/IBoundaryService.hpp"
#include "geo/boundaries/BoundaryFileFormat.hpp"
#include "config/GeocodingConfig.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Atlas {
namespace Geo {
namespace Boundaries {

/**
 * @brief Country lookup over polygons loaded from geo.geobounds
 *
 * Lookups are resolved, in order, from a cache of recent results, from
 * geohash cells known to lie inside a single country, from point-in-polygon
 * tests against the candidates of a border cell, and finally by testing
 * every country. A point in no country is reported as ocean.
 */
class BoundaryIndex : public IBoundaryService {
public:
    static constexpr size_t MAX_LOOKUP_CACHE_SIZE = 10000;

    explicit BoundaryIndex(GeocodingConfig config = {});

    /**
     * @brief Find and load the boundary file from the configured directories
     */
    std::expected<void, GeoError> Initialize() override;

    /**
     * @brief Load a specific boundary file
     */
    std::expected<void, GeoError> InitializeFromFile(const std::filesystem::path& path);

    /**
     * @brief Use already decoded boundary data
     */
    void InitializeFromData(BoundaryData data);

    [[nodiscard]] bool IsInitialized() const override { return m_initialized; }

    [[nodiscard]] CountryLookupResult GetCountry(double latitude, double longitude) const override;

    [[nodiscard]] bool IsPointInCountry(double latitude, double longitude,
                                        const std::string& countryCode) const override;

    [[nodiscard]] std::vector<std::string> GetCandidateCountries(double latitude,
                                                                 double longitude) const override;

    [[nodiscard]] size_t GetCountryCount() const { return m_countries.size(); }
    [[nodiscard]] size_t GetLookupCacheSize() const;
    [[nodiscard]] const CountryBoundary* FindCountry(const std::string& countryCode) const;

    [[nodiscard]] static std::optional<std::filesystem::path> FindBoundaryFile(const GeocodingConfig& config);

private:
    void CacheLookupResult(const std::string& key, const CountryLookupResult& result) const;

    GeocodingConfig m_config;
    std::atomic<bool> m_initialized{false};

    uint8_t m_cachePrecision = 4;
    std::vector<CountryBoundary> m_countries;
    std::unordered_map<std::string, size_t> m_countryLookup;   // Upper-case code -> m_countries index
    std::unordered_map<std::string, std::string> m_geohashCache;
    std::unordered_map<std::string, std::vector<std::string>> m_borderCells;

    mutable std::mutex m_lookupMutex;
    mutable std::unordered_map<std::string, CountryLookupResult> m_lookupCache;
};

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
