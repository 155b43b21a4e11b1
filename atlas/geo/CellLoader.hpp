#pragma once

#include "geo/GeoIndexFormat.hpp"
#include "geo/GeoTypes.hpp"
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace Atlas {
namespace Geo {

/**
 * @brief How cell blocks are stored in the data file
 */
enum class CellEncoding {
    Raw,    // Records back to back
    Zlib    // u32 uncompressed size followed by a zlib stream
};

/**
 * @brief Reads cell blocks from geo.geodata on demand
 *
 * Owns a read-only file descriptor and reads with pread, so concurrent
 * LoadCell calls never share a file cursor. Does no caching of its own.
 */
class CellLoader {
public:
    /**
     * @brief Open a data file and verify its header
     * @return IoError if the file cannot be opened, DataCorrupt on a bad header
     */
    [[nodiscard]] static std::expected<CellLoader, GeoError> Open(const std::filesystem::path& path,
                                                                  CellEncoding encoding = CellEncoding::Raw);

    CellLoader(CellLoader&& other) noexcept;
    CellLoader& operator=(CellLoader&& other) noexcept;
    CellLoader(const CellLoader&) = delete;
    CellLoader& operator=(const CellLoader&) = delete;
    ~CellLoader();

    /**
     * @brief Materialize the cell described by an index entry
     * @param entry Index record locating the cell block
     * @param geohash Geohash of the cell, used for its bounds
     */
    [[nodiscard]] std::expected<GeoCell, GeoError> LoadCell(const CellIndexEntry& entry,
                                                           std::string_view geohash) const;

    /**
     * @brief Decode exactly count records that fill block completely
     */
    [[nodiscard]] static std::expected<std::vector<LocationEntry>, GeoError> ParseRecords(
        std::span<const uint8_t> block, uint32_t count);

    [[nodiscard]] uint64_t GetFileSize() const { return m_fileSize; }
    [[nodiscard]] const std::filesystem::path& GetPath() const { return m_path; }
    [[nodiscard]] CellEncoding GetEncoding() const { return m_encoding; }

private:
    CellLoader(int fd, std::filesystem::path path, uint64_t fileSize, CellEncoding encoding);

    std::expected<std::vector<uint8_t>, GeoError> ReadBlock(uint64_t offset, uint32_t length) const;
    std::expected<std::vector<uint8_t>, GeoError> Inflate(std::span<const uint8_t> block) const;
    void Close();

    int m_fd = -1;
    std::filesystem::path m_path;
    uint64_t m_fileSize = 0;
    CellEncoding m_encoding = CellEncoding::Raw;
};

} // namespace Geo
} // namespace Atlas
