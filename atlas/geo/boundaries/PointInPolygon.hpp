#pragma once

#include "geo/boundaries/BoundaryTypes.hpp"

namespace Atlas {
namespace Geo {
namespace Boundaries {

/**
 * @brief Ray-casting containment tests on latitude/longitude polygons
 *
 * Coordinates are treated as planar degrees. Bounding boxes reject points
 * before any edge is tested.
 */
namespace PointInPolygon {

/**
 * @brief Point inside a single ring (even-odd rule)
 */
[[nodiscard]] bool IsPointInRing(double latitude, double longitude, const PolygonRing& ring);

/**
 * @brief Point inside the exterior ring and outside every hole
 */
[[nodiscard]] bool IsPointInPolygon(double latitude, double longitude, const Polygon& polygon);

/**
 * @brief Point inside any polygon of the country
 */
[[nodiscard]] bool IsPointInCountry(double latitude, double longitude, const CountryBoundary& country);

/**
 * @brief Point within epsilon degrees of any edge of the ring
 */
[[nodiscard]] bool IsPointOnEdge(double latitude, double longitude, const PolygonRing& ring,
                                 double epsilon = 0.0001);

/**
 * @brief Wrap longitude into [-180, 180]
 */
[[nodiscard]] double NormalizeLongitude(double longitude);

/**
 * @brief Clamp latitude into [-90, 90]
 */
[[nodiscard]] double ClampLatitude(double latitude);

} // namespace PointInPolygon

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
