#pragma once

#include "geo/boundaries/BoundaryTypes.hpp"
#include "geo/GeoTypes.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace Atlas {
namespace Geo {
namespace Boundaries {

/**
 * @brief Decoded contents of a geo.geobounds file
 */
struct BoundaryData {
    uint8_t cachePrecision = 4;
    std::vector<CountryBoundary> countries;
    std::unordered_map<std::string, std::string> geohashCache;               // cell -> country code
    std::unordered_map<std::string, std::vector<std::string>> borderCells;   // cell -> candidates
};

/**
 * @brief Reader of geo.geobounds
 *
 * Header (24 bytes): u32 magic, u16 version, u8 cache_precision, u8 reserved,
 * u32 country_count, u32 geohash_cache_count, u32 border_cell_count,
 * u32 reserved. Vertices are stored as i32 micro-degrees (lat, lon).
 */
namespace BoundaryFileFormat {
    constexpr uint32_t MAGIC = 0x444E4247;      // "GBND"
    constexpr uint16_t VERSION = 1;
    constexpr size_t HEADER_SIZE = 24;
    constexpr double MICRO_DEGREES = 1e6;

    [[nodiscard]] std::expected<BoundaryData, GeoError> Read(const std::filesystem::path& path);

    [[nodiscard]] std::expected<BoundaryData, GeoError> Parse(std::span<const uint8_t> bytes);
}

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
