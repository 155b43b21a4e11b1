#include "geo/CellLoader.hpp"
#include "geo/Geohash.hpp"
#include "core/Logger.hpp"
#include <zlib.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace Atlas {
namespace Geo {

namespace {

bool PositionedRead(int fd, uint8_t* buffer, size_t length, uint64_t offset) {
    size_t done = 0;
    while (done < length) {
        ssize_t result = ::pread(fd, buffer + done, length - done,
                                 static_cast<off_t>(offset + done));
        if (result < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (result == 0) {
            return false;   // File shrank underneath us
        }
        done += static_cast<size_t>(result);
    }
    return true;
}

} // namespace

std::expected<CellLoader, GeoError> CellLoader::Open(const std::filesystem::path& path,
                                                     CellEncoding encoding) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        ATLAS_LOG_ERROR("CellLoader: Cannot open data file {}: {}", path.string(), std::strerror(errno));
        return std::unexpected(GeoError::IoError);
    }

    // Owns fd from here so every early return closes it
    CellLoader loader(fd, path, 0, encoding);

    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        ATLAS_LOG_ERROR("CellLoader: Cannot stat data file {}: {}", path.string(), std::strerror(errno));
        return std::unexpected(GeoError::IoError);
    }
    if (!S_ISREG(info.st_mode)) {
        ATLAS_LOG_ERROR("CellLoader: Not a regular file: {}", path.string());
        return std::unexpected(GeoError::IoError);
    }
    loader.m_fileSize = static_cast<uint64_t>(info.st_size);

    if (loader.m_fileSize < GeoDataFormat::HEADER_SIZE) {
        ATLAS_LOG_ERROR("CellLoader: Data file too small ({} bytes): {}", loader.m_fileSize, path.string());
        return std::unexpected(GeoError::DataCorrupt);
    }

    uint8_t headerBytes[GeoDataFormat::HEADER_SIZE];
    if (!PositionedRead(fd, headerBytes, sizeof(headerBytes), 0)) {
        ATLAS_LOG_ERROR("CellLoader: Cannot read header of {}", path.string());
        return std::unexpected(GeoError::IoError);
    }

    ByteReader reader(std::span<const uint8_t>(headerBytes, sizeof(headerBytes)));
    uint32_t magic = *reader.ReadU32();
    uint16_t version = *reader.ReadU16();

    if (magic != GeoDataFormat::MAGIC || version != GeoDataFormat::VERSION) {
        ATLAS_LOG_ERROR("CellLoader: Bad data file header (magic=0x{:08X}, version={}): {}",
                        magic, version, path.string());
        return std::unexpected(GeoError::DataCorrupt);
    }

    ATLAS_LOG_DEBUG("CellLoader: Opened {} ({} bytes, {})", path.string(), loader.m_fileSize,
                    encoding == CellEncoding::Zlib ? "zlib" : "raw");
    return loader;
}

CellLoader::CellLoader(int fd, std::filesystem::path path, uint64_t fileSize, CellEncoding encoding)
    : m_fd(fd)
    , m_path(std::move(path))
    , m_fileSize(fileSize)
    , m_encoding(encoding) {
}

CellLoader::CellLoader(CellLoader&& other) noexcept
    : m_fd(std::exchange(other.m_fd, -1))
    , m_path(std::move(other.m_path))
    , m_fileSize(other.m_fileSize)
    , m_encoding(other.m_encoding) {
}

CellLoader& CellLoader::operator=(CellLoader&& other) noexcept {
    if (this != &other) {
        Close();
        m_fd = std::exchange(other.m_fd, -1);
        m_path = std::move(other.m_path);
        m_fileSize = other.m_fileSize;
        m_encoding = other.m_encoding;
    }
    return *this;
}

CellLoader::~CellLoader() {
    Close();
}

void CellLoader::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

std::expected<GeoCell, GeoError> CellLoader::LoadCell(const CellIndexEntry& entry,
                                                     std::string_view geohash) const {
    if (!Geohash::IsValid(geohash)) {
        return std::unexpected(GeoError::InvalidArgument);
    }

    auto block = ReadBlock(entry.dataOffset, entry.dataLength);
    if (!block) {
        return std::unexpected(block.error());
    }

    if (m_encoding == CellEncoding::Zlib) {
        block = Inflate(*block);
        if (!block) {
            ATLAS_LOG_WARN("CellLoader: Cannot inflate cell {}", geohash);
            return std::unexpected(block.error());
        }
    }

    auto records = ParseRecords(*block, entry.locationCount);
    if (!records) {
        ATLAS_LOG_WARN("CellLoader: Malformed records in cell {} (offset={}, length={})",
                       geohash, entry.dataOffset, entry.dataLength);
        return std::unexpected(records.error());
    }

    GeoCell cell;
    cell.geohash = std::string(geohash);
    cell.bounds = Geohash::DecodeBounds(geohash);
    cell.entries = std::move(*records);
    cell.estimatedMemoryBytes = sizeof(GeoCell) + cell.geohash.size();
    for (const auto& location : cell.entries) {
        cell.estimatedMemoryBytes += location.EstimateMemoryBytes();
    }
    return cell;
}

std::expected<std::vector<uint8_t>, GeoError> CellLoader::ReadBlock(uint64_t offset,
                                                                   uint32_t length) const {
    if (m_fd < 0) {
        return std::unexpected(GeoError::NotInitialized);
    }
    if (offset < GeoDataFormat::HEADER_SIZE || offset > m_fileSize ||
        length > m_fileSize - offset) {
        ATLAS_LOG_WARN("CellLoader: Block [{}, +{}) outside data file of {} bytes",
                       offset, length, m_fileSize);
        return std::unexpected(GeoError::DataCorrupt);
    }

    std::vector<uint8_t> buffer(length);
    if (length > 0 && !PositionedRead(m_fd, buffer.data(), length, offset)) {
        ATLAS_LOG_WARN("CellLoader: Read of {} bytes at {} failed: {}",
                       length, offset, std::strerror(errno));
        return std::unexpected(GeoError::IoError);
    }
    return buffer;
}

std::expected<std::vector<uint8_t>, GeoError> CellLoader::Inflate(std::span<const uint8_t> block) const {
    ByteReader reader(block);
    auto uncompressedSize = reader.ReadU32();
    if (!uncompressedSize || *uncompressedSize > GeoDataFormat::MAX_BLOCK_SIZE) {
        return std::unexpected(GeoError::DataCorrupt);
    }

    std::vector<uint8_t> decompressed(*uncompressedSize);
    if (decompressed.empty()) {
        if (!reader.AtEnd()) {
            return std::unexpected(GeoError::DataCorrupt);
        }
        return decompressed;
    }

    const auto compressed = block.subspan(GeoDataFormat::COMPRESSED_PREFIX_SIZE);
    uLongf destLen = static_cast<uLongf>(decompressed.size());

    int result = uncompress(
        decompressed.data(),
        &destLen,
        compressed.data(),
        static_cast<uLong>(compressed.size()));

    if (result != Z_OK) {
        ATLAS_LOG_WARN("CellLoader: Decompression failed with code {}", result);
        return std::unexpected(GeoError::DataCorrupt);
    }
    if (destLen != decompressed.size()) {
        ATLAS_LOG_WARN("CellLoader: Decompressed {} bytes, expected {}", destLen, decompressed.size());
        return std::unexpected(GeoError::DataCorrupt);
    }
    return decompressed;
}

std::expected<std::vector<LocationEntry>, GeoError> CellLoader::ParseRecords(
    std::span<const uint8_t> block, uint32_t count) {
    // The smallest record has an empty country and no optional fields
    constexpr size_t MIN_RECORD_SIZE = GeoDataFormat::RECORD_FIXED_SIZE + 2;
    if (static_cast<uint64_t>(count) * MIN_RECORD_SIZE > block.size()) {
        return std::unexpected(GeoError::DataCorrupt);
    }

    ByteReader reader(block);
    std::vector<LocationEntry> entries;
    entries.reserve(count);

    auto readOptional = [&reader](uint8_t mask, uint8_t bit,
                                  std::optional<std::string>& out) -> bool {
        if ((mask & bit) == 0) {
            return true;
        }
        auto value = reader.ReadString16();
        if (!value) {
            return false;
        }
        out = std::move(*value);
        return true;
    };

    for (uint32_t i = 0; i < count; ++i) {
        LocationEntry entry;

        auto latitude = reader.ReadF64();
        auto longitude = reader.ReadF64();
        auto population = reader.ReadU32();
        auto mask = reader.ReadU8();
        if (!latitude || !longitude || !population || !mask) {
            return std::unexpected(GeoError::DataCorrupt);
        }
        if ((*mask & ~GeoDataFormat::FIELD_MASK_ALL) != 0) {
            return std::unexpected(GeoError::DataCorrupt);
        }

        entry.latitude = *latitude;
        entry.longitude = *longitude;
        entry.population = *population;
        if (!GeoCoordinate(entry.latitude, entry.longitude).IsValid()) {
            return std::unexpected(GeoError::DataCorrupt);
        }

        if (!readOptional(*mask, GeoDataFormat::FIELD_DISTRICT, entry.district) ||
            !readOptional(*mask, GeoDataFormat::FIELD_CITY, entry.city) ||
            !readOptional(*mask, GeoDataFormat::FIELD_COUNTY, entry.county) ||
            !readOptional(*mask, GeoDataFormat::FIELD_STATE, entry.state)) {
            return std::unexpected(GeoError::DataCorrupt);
        }

        auto country = reader.ReadString16();
        if (!country) {
            return std::unexpected(GeoError::DataCorrupt);
        }
        entry.country = std::move(*country);

        entries.push_back(std::move(entry));
    }

    if (!reader.AtEnd()) {
        return std::unexpected(GeoError::DataCorrupt);
    }
    return entries;
}

} // namespace Geo
} // namespace Atlas
