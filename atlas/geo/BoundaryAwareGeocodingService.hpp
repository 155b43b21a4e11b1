#pragma once

#include "geo/IReverseGeocodingService.hpp"
#include "geo/TieredGeocodingService.hpp"
#include "geo/boundaries/IBoundaryService.hpp"
#include <atomic>
#include <memory>

namespace Atlas {
namespace Geo {

/**
 * @brief Tiered geocoding corrected by country boundaries
 *
 * When the boundary service places the query point in a country, the
 * nearest place in that country wins over a nearer place across the
 * border. Without a country (open water, missing boundary data) or without
 * any qualifying place in the country, the plain nearest result is used.
 */
class BoundaryAwareGeocodingService : public IReverseGeocodingService {
public:
    /**
     * @brief Build a tiered service and a boundary index from one configuration
     */
    explicit BoundaryAwareGeocodingService(GeocodingConfig config);

    /**
     * @brief Decorate existing services
     * @param boundaries May be null to run distance-only
     */
    BoundaryAwareGeocodingService(std::shared_ptr<TieredGeocodingService> geocoder,
                                  std::shared_ptr<Boundaries::IBoundaryService> boundaries);

    /**
     * @brief Initialize the tiered service, then the boundary service
     *
     * A tiered failure is returned. A boundary failure only disables
     * filtering.
     */
    std::expected<void, GeoError> Initialize() override;

    [[nodiscard]] bool IsInitialized() const override { return m_initialized; }

    [[nodiscard]] bool IsBoundaryFilteringEnabled() const;

    std::expected<std::optional<LocationData>, GeoError> ReverseGeocode(double latitude,
                                                                        double longitude) override;

    /**
     * @brief Boundary-corrected nearest place with distance and source cell
     *
     * Counted as one query in the geocoder statistics, however many
     * searches it takes.
     */
    LookupOutcome Lookup(double latitude, double longitude);

    [[nodiscard]] TieredGeocodingService& GetGeocoder() { return *m_geocoder; }

    [[nodiscard]] size_t GetCountryMatchCount() const { return m_countryMatches; }
    [[nodiscard]] size_t GetFallbackCount() const { return m_fallbacks; }

private:
    LookupOutcome Resolve(double latitude, double longitude);

    std::shared_ptr<TieredGeocodingService> m_geocoder;
    std::shared_ptr<Boundaries::IBoundaryService> m_boundaries;

    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_boundaryFiltering{false};

    std::atomic<size_t> m_countryMatches{0};
    std::atomic<size_t> m_fallbacks{0};
};

} // namespace Geo
} // namespace Atlas
