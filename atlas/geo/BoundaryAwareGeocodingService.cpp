#include "geo/BoundaryAwareGeocodingService.hpp"
#include "geo/boundaries/BoundaryIndex.hpp"
#include "core/Logger.hpp"

namespace Atlas {
namespace Geo {

BoundaryAwareGeocodingService::BoundaryAwareGeocodingService(GeocodingConfig config)
    : m_geocoder(std::make_shared<TieredGeocodingService>(config)) {
    if (config.boundaryFiltering) {
        m_boundaries = std::make_shared<Boundaries::BoundaryIndex>(std::move(config));
    }
}

BoundaryAwareGeocodingService::BoundaryAwareGeocodingService(
    std::shared_ptr<TieredGeocodingService> geocoder,
    std::shared_ptr<Boundaries::IBoundaryService> boundaries)
    : m_geocoder(std::move(geocoder))
    , m_boundaries(std::move(boundaries)) {
}

std::expected<void, GeoError> BoundaryAwareGeocodingService::Initialize() {
    if (m_initialized) {
        return {};
    }
    if (!m_geocoder) {
        return std::unexpected(GeoError::NotInitialized);
    }

    if (auto result = m_geocoder->Initialize(); !result) {
        return result;
    }

    m_boundaryFiltering = false;
    if (m_boundaries) {
        auto result = m_boundaries->IsInitialized() ? std::expected<void, GeoError>{}
                                                    : m_boundaries->Initialize();
        if (result) {
            m_boundaryFiltering = true;
        } else {
            ATLAS_LOG_WARN("Boundary data not available ({}), using distance-only geocoding",
                           ToString(result.error()));
        }
    }

    if (m_boundaryFiltering) {
        ATLAS_LOG_INFO("Boundary-aware geocoding enabled");
    }

    m_initialized = true;
    return {};
}

bool BoundaryAwareGeocodingService::IsBoundaryFilteringEnabled() const {
    return m_boundaryFiltering && m_boundaries && m_boundaries->IsInitialized();
}

std::expected<std::optional<LocationData>, GeoError> BoundaryAwareGeocodingService::ReverseGeocode(
    double latitude, double longitude) {
    auto result = Lookup(latitude, longitude);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!*result) {
        return std::optional<LocationData>{};
    }
    return std::optional<LocationData>{LocationData::FromEntry((*result)->location)};
}

LookupOutcome BoundaryAwareGeocodingService::Lookup(double latitude, double longitude) {
    if (!m_initialized) {
        return std::unexpected(GeoError::NotInitialized);
    }

    LookupOutcome outcome = Resolve(latitude, longitude);
    m_geocoder->RecordOutcome(outcome);
    return outcome;
}

LookupOutcome BoundaryAwareGeocodingService::Resolve(double latitude, double longitude) {
    if (!GeoCoordinate(latitude, longitude).IsValid()) {
        return std::unexpected(GeoError::InvalidArgument);
    }

    const double maxDistanceKm = m_geocoder->GetConfig().maxDistanceKm;
    const CandidateFilter defaultFilter = m_geocoder->GetDefaultFilter();

    if (!IsBoundaryFilteringEnabled()) {
        return m_geocoder->Search(latitude, longitude, maxDistanceKm, defaultFilter);
    }

    const Boundaries::CountryLookupResult country = m_boundaries->GetCountry(latitude, longitude);
    if (!country.countryCode) {
        return m_geocoder->Search(latitude, longitude, maxDistanceKm, defaultFilter);
    }

    CandidateFilter countryFilter = defaultFilter;
    countryFilter.countryCode = *country.countryCode;

    auto inCountry = m_geocoder->Search(latitude, longitude, maxDistanceKm, countryFilter);
    if (!inCountry) {
        return inCountry;
    }
    if (*inCountry) {
        ++m_countryMatches;
        return inCountry;
    }

    ATLAS_LOG_DEBUG("No location found in country {} for ({:.5f}, {:.5f}), using nearest overall",
                    *country.countryCode, latitude, longitude);
    ++m_fallbacks;

    auto fallback = m_geocoder->Search(latitude, longitude, maxDistanceKm, defaultFilter);
    if (fallback && *fallback && country.isBorderArea &&
        !CountryCodesEqual((*fallback)->location.country, *country.countryCode)) {
        ATLAS_LOG_DEBUG("Border area: point in {} but nearest place {} is in {}",
                        *country.countryCode,
                        (*fallback)->location.city.value_or((*fallback)->location.district.value_or("?")),
                        (*fallback)->location.country);
    }
    return fallback;
}

} // namespace Geo
} // namespace Atlas
