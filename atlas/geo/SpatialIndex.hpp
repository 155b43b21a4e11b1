#pragma once

#include "geo/GeoIndexFormat.hpp"
#include "geo/GeoTypes.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Atlas {
namespace Geo {

/**
 * @brief In-memory map from geohash cell to its block in the data file
 *
 * Loaded once from geo.geoindex and immutable afterwards, so a loaded
 * index can be shared by concurrent queries without locking.
 */
class SpatialIndex {
public:
    SpatialIndex() = default;

    /**
     * @brief Load and validate an index file
     * @return The index, IoError if the file cannot be read, or IndexCorrupt
     */
    [[nodiscard]] static std::expected<SpatialIndex, GeoError> Load(const std::filesystem::path& path);

    /**
     * @brief Parse an index from an in-memory image of the file
     */
    [[nodiscard]] static std::expected<SpatialIndex, GeoError> Parse(std::span<const uint8_t> bytes);

    /**
     * @brief Look up a cell by geohash
     * @return nullptr when the cell has no indexed locations or the hash
     *         does not match the index precision
     */
    [[nodiscard]] const CellIndexEntry* TryGetCell(std::string_view geohash) const;

    [[nodiscard]] bool ContainsCell(std::string_view geohash) const {
        return TryGetCell(geohash) != nullptr;
    }

    /**
     * @brief The cell and its neighbors that are present in the index
     */
    [[nodiscard]] std::vector<std::pair<std::string, CellIndexEntry>> GetCellAndNeighbors(
        std::string_view geohash) const;

    /**
     * @brief All entries in file order
     */
    [[nodiscard]] const std::vector<CellIndexEntry>& GetAllCells() const { return m_entries; }

    [[nodiscard]] const GeoIndexHeader& GetHeader() const { return m_header; }
    [[nodiscard]] int GetPrecision() const { return m_header.precision; }
    [[nodiscard]] size_t GetCellCount() const { return m_entries.size(); }
    [[nodiscard]] uint64_t GetTotalLocationCount() const { return m_header.totalLocationCount; }
    [[nodiscard]] uint64_t GetDataFileSize() const { return m_header.dataFileSize; }
    [[nodiscard]] int64_t GetBuildTimestamp() const { return m_header.buildTimestamp; }
    [[nodiscard]] bool IsCompressed() const {
        return (m_header.flags & GeoIndexFormat::FLAG_COMPRESSED) != 0;
    }

    /**
     * @brief Approximate heap footprint of the loaded index
     */
    [[nodiscard]] size_t GetEstimatedMemoryBytes() const;

private:
    GeoIndexHeader m_header;
    std::vector<CellIndexEntry> m_entries;
    std::unordered_map<uint32_t, size_t> m_lookup;   // geohash code -> m_entries index
};

} // namespace Geo
} // namespace Atlas
