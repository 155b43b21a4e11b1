#pragma once

#include "geo/GeoTypes.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Atlas {
namespace Geo {

/**
 * @brief Geohash encoding and cell arithmetic
 *
 * A geohash is a base-32 string over "0123456789bcdefghjkmnpqrstuvwxyz".
 * Each character carries 5 bits of interleaved longitude/latitude
 * subdivision, starting with longitude.
 *
 * All functions are pure. Invalid input (precision out of range, empty or
 * malformed hashes, non-finite or out-of-range coordinates) throws
 * std::invalid_argument.
 */
namespace Geohash {

constexpr std::string_view ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int MIN_PRECISION = 1;
constexpr int MAX_PRECISION = 12;
constexpr int MAX_PACKED_PRECISION = 6;   // 6 * 5 bits fit in a uint32_t

/**
 * @brief Encode a coordinate to a geohash of the given length
 */
[[nodiscard]] std::string Encode(double latitude, double longitude, int precision);

/**
 * @brief Rectangle covered by a geohash cell
 */
[[nodiscard]] GeoBounds DecodeBounds(std::string_view hash);

/**
 * @brief Center of a geohash cell
 */
[[nodiscard]] GeoCoordinate DecodeCenter(std::string_view hash);

/**
 * @brief Pack a geohash of up to 6 characters into 5-bit groups
 *
 * The first character occupies the most significant group. The result is
 * right-aligned, so the precision must be carried separately.
 */
[[nodiscard]] uint32_t EncodeToUInt32(std::string_view hash);

/**
 * @brief Inverse of EncodeToUInt32 for a known precision
 */
[[nodiscard]] std::string DecodeFromUInt32(uint32_t code, int precision);

/**
 * @brief Adjacent cells at the same precision
 *
 * Order is N, NE, E, SE, S, SW, W, NW. Rows beyond a pole are skipped,
 * longitude wraps at the antimeridian and duplicates (including the cell
 * itself) are removed, so polar cells yield fewer than 8 results.
 */
[[nodiscard]] std::vector<std::string> GetNeighbors(std::string_view hash);

/**
 * @brief The cell itself followed by its neighbors
 */
[[nodiscard]] std::vector<std::string> GetCellAndNeighbors(std::string_view hash);

/**
 * @brief Proper prefixes of hash, coarsest first
 */
[[nodiscard]] std::vector<std::string> GetAncestors(std::string_view hash);

/**
 * @brief Great-circle distance in kilometers on a sphere of radius 6371 km
 */
[[nodiscard]] double HaversineDistance(double lat1, double lon1, double lat2, double lon2);

/**
 * @brief True when hash is 1-12 characters from the geohash alphabet
 */
[[nodiscard]] bool IsValid(std::string_view hash) noexcept;

} // namespace Geohash

} // namespace Geo
} // namespace Atlas
