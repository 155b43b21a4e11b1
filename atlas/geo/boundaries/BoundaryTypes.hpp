#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace Atlas {
namespace Geo {
namespace Boundaries {

/**
 * @brief Latitude/longitude bounding box; starts empty and grows with Expand
 */
struct BoundingBox {
    double minLatitude = 90.0;
    double maxLatitude = -90.0;
    double minLongitude = 180.0;
    double maxLongitude = -180.0;

    [[nodiscard]] bool IsEmpty() const {
        return minLatitude > maxLatitude || minLongitude > maxLongitude;
    }

    [[nodiscard]] bool Contains(double latitude, double longitude) const {
        return latitude >= minLatitude && latitude <= maxLatitude &&
               longitude >= minLongitude && longitude <= maxLongitude;
    }

    void Expand(double latitude, double longitude) {
        minLatitude = std::min(minLatitude, latitude);
        maxLatitude = std::max(maxLatitude, latitude);
        minLongitude = std::min(minLongitude, longitude);
        maxLongitude = std::max(maxLongitude, longitude);
    }

    void Expand(const BoundingBox& other) {
        if (other.IsEmpty()) return;
        Expand(other.minLatitude, other.minLongitude);
        Expand(other.maxLatitude, other.maxLongitude);
    }
};

/**
 * @brief Closed ring of vertices; x is longitude, y is latitude
 */
struct PolygonRing {
    std::vector<glm::dvec2> vertices;
    BoundingBox bounds;

    void ComputeBounds() {
        bounds = {};
        for (const auto& vertex : vertices) {
            bounds.Expand(vertex.y, vertex.x);
        }
    }
};

/**
 * @brief Exterior ring with optional holes
 */
struct Polygon {
    PolygonRing exterior;
    std::vector<PolygonRing> holes;
    BoundingBox bounds;   // Same as exterior.bounds

    void ComputeBounds() {
        exterior.ComputeBounds();
        for (auto& hole : holes) {
            hole.ComputeBounds();
        }
        bounds = exterior.bounds;
    }
};

/**
 * @brief Outline of one country as a set of polygons
 */
struct CountryBoundary {
    std::string countryCode;   // ISO 3166-1 alpha-2
    std::string name;
    std::vector<Polygon> polygons;
    BoundingBox bounds;

    void ComputeBounds() {
        bounds = {};
        for (auto& polygon : polygons) {
            polygon.ComputeBounds();
            bounds.Expand(polygon.bounds);
        }
    }
};

/**
 * @brief Answer of a country lookup
 */
struct CountryLookupResult {
    std::optional<std::string> countryCode;   // Empty over oceans or without data
    bool isOcean = false;
    bool isBorderArea = false;                // Point lies in a cell shared by several countries
    std::vector<std::string> candidates;      // Candidate countries of a border cell

    bool operator==(const CountryLookupResult& other) const = default;
};

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
