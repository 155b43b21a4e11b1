#include "geo/boundaries/PointInPolygon.hpp"
#include <glm/geometric.hpp>
#include <algorithm>
#include <cmath>

namespace Atlas {
namespace Geo {
namespace Boundaries {
namespace PointInPolygon {

namespace {

bool RayCast(double latitude, double longitude, const std::vector<glm::dvec2>& vertices) {
    if (vertices.size() < 3) return false;

    bool inside = false;
    size_t j = vertices.size() - 1;

    for (size_t i = 0; i < vertices.size(); ++i) {
        const glm::dvec2& a = vertices[i];
        const glm::dvec2& b = vertices[j];
        if (((a.y > latitude) != (b.y > latitude)) &&
            (longitude < (b.x - a.x) * (latitude - a.y) / (b.y - a.y) + a.x)) {
            inside = !inside;
        }
        j = i;
    }

    return inside;
}

double DistanceToSegment(const glm::dvec2& point, const glm::dvec2& a, const glm::dvec2& b) {
    const glm::dvec2 segment = b - a;
    const double lengthSq = glm::dot(segment, segment);
    if (lengthSq == 0.0) {
        return glm::distance(point, a);
    }

    const double t = std::clamp(glm::dot(point - a, segment) / lengthSq, 0.0, 1.0);
    return glm::distance(point, a + t * segment);
}

} // namespace

bool IsPointInRing(double latitude, double longitude, const PolygonRing& ring) {
    if (!ring.bounds.Contains(latitude, longitude)) return false;
    return RayCast(latitude, longitude, ring.vertices);
}

bool IsPointInPolygon(double latitude, double longitude, const Polygon& polygon) {
    if (!polygon.bounds.Contains(latitude, longitude)) return false;

    if (!RayCast(latitude, longitude, polygon.exterior.vertices)) return false;

    for (const auto& hole : polygon.holes) {
        if (IsPointInRing(latitude, longitude, hole)) {
            return false;
        }
    }
    return true;
}

bool IsPointInCountry(double latitude, double longitude, const CountryBoundary& country) {
    if (!country.bounds.Contains(latitude, longitude)) return false;

    for (const auto& polygon : country.polygons) {
        if (IsPointInPolygon(latitude, longitude, polygon)) {
            return true;
        }
    }
    return false;
}

bool IsPointOnEdge(double latitude, double longitude, const PolygonRing& ring, double epsilon) {
    const size_t n = ring.vertices.size();
    if (n == 0) return false;

    const glm::dvec2 point(longitude, latitude);
    size_t j = n - 1;
    for (size_t i = 0; i < n; ++i) {
        if (DistanceToSegment(point, ring.vertices[j], ring.vertices[i]) < epsilon) {
            return true;
        }
        j = i;
    }
    return false;
}

double NormalizeLongitude(double longitude) {
    if (longitude > 180.0 || longitude < -180.0) {
        longitude = std::fmod(longitude, 360.0);
        if (longitude > 180.0) {
            longitude -= 360.0;
        } else if (longitude < -180.0) {
            longitude += 360.0;
        }
    }
    return longitude;
}

double ClampLatitude(double latitude) {
    return std::clamp(latitude, -90.0, 90.0);
}

} // namespace PointInPolygon
} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
