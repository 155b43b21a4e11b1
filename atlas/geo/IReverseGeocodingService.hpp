#pragma once

#include "geo/GeoTypes.hpp"
#include <expected>
#include <optional>

namespace Atlas {
namespace Geo {

/**
 * @brief Resolves GPS coordinates to place names
 *
 * Initialize must succeed before ReverseGeocode is called. An empty
 * optional means no place qualified; errors are reserved for invalid input
 * and I/O or data failures.
 */
class IReverseGeocodingService {
public:
    virtual ~IReverseGeocodingService() = default;

    virtual std::expected<void, GeoError> Initialize() = 0;

    virtual std::expected<std::optional<LocationData>, GeoError> ReverseGeocode(double latitude,
                                                                                double longitude) = 0;

    [[nodiscard]] virtual bool IsInitialized() const = 0;
};

} // namespace Geo
} // namespace Atlas
