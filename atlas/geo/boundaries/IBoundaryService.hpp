#pragma once

#include "geo/boundaries/BoundaryTypes.hpp"
#include "geo/GeoTypes.hpp"
#include <expected>
#include <string>
#include <vector>

namespace Atlas {
namespace Geo {
namespace Boundaries {

/**
 * @brief Answers which country contains a coordinate
 */
class IBoundaryService {
public:
    virtual ~IBoundaryService() = default;

    virtual std::expected<void, GeoError> Initialize() = 0;

    [[nodiscard]] virtual bool IsInitialized() const = 0;

    /**
     * @brief Country containing the point, or an empty code over water
     */
    [[nodiscard]] virtual CountryLookupResult GetCountry(double latitude, double longitude) const = 0;

    [[nodiscard]] virtual bool IsPointInCountry(double latitude, double longitude,
                                                const std::string& countryCode) const = 0;

    /**
     * @brief Countries that may contain the point
     */
    [[nodiscard]] virtual std::vector<std::string> GetCandidateCountries(double latitude,
                                                                         double longitude) const = 0;
};

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
