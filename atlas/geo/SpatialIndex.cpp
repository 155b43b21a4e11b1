#include "geo/SpatialIndex.hpp"
#include "geo/Geohash.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <fstream>
#include <iterator>

namespace Atlas {
namespace Geo {

std::expected<SpatialIndex, GeoError> SpatialIndex::Load(const std::filesystem::path& path) {
    auto startTime = std::chrono::steady_clock::now();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ATLAS_LOG_ERROR("SpatialIndex: Cannot open index file: {}", path.string());
        return std::unexpected(GeoError::IoError);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        ATLAS_LOG_ERROR("SpatialIndex: Read failed for index file: {}", path.string());
        return std::unexpected(GeoError::IoError);
    }

    auto index = Parse(bytes);
    if (!index) {
        ATLAS_LOG_ERROR("SpatialIndex: Rejected index file {}: {}", path.string(),
                        ToString(index.error()));
        return index;
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - startTime).count();
    ATLAS_LOG_INFO("SpatialIndex: Loaded {} (precision={}, cells={}, locations={}, data={} bytes, {:.1f}ms)",
                   path.string(), index->GetPrecision(), index->GetCellCount(),
                   index->GetTotalLocationCount(), index->GetDataFileSize(), elapsed);
    return index;
}

std::expected<SpatialIndex, GeoError> SpatialIndex::Parse(std::span<const uint8_t> bytes) {
    if (bytes.size() < GeoIndexFormat::HEADER_SIZE) {
        ATLAS_LOG_WARN("SpatialIndex: Truncated header ({} bytes)", bytes.size());
        return std::unexpected(GeoError::IndexCorrupt);
    }

    ByteReader reader(bytes);
    SpatialIndex index;
    GeoIndexHeader& header = index.m_header;

    // The size check above guarantees the header fields are readable
    header.magic = *reader.ReadU32();
    header.version = *reader.ReadU16();
    header.precision = *reader.ReadU8();
    header.flags = *reader.ReadU8();
    header.cellCount = *reader.ReadU32();
    header.totalLocationCount = *reader.ReadU32();
    header.buildTimestamp = *reader.ReadI64();
    header.dataFileSize = *reader.ReadU64();

    if (header.magic != GeoIndexFormat::MAGIC) {
        ATLAS_LOG_WARN("SpatialIndex: Bad magic 0x{:08X}", header.magic);
        return std::unexpected(GeoError::IndexCorrupt);
    }
    if (header.version != GeoIndexFormat::VERSION) {
        ATLAS_LOG_WARN("SpatialIndex: Unsupported version {}", header.version);
        return std::unexpected(GeoError::IndexCorrupt);
    }
    if (header.precision < Geohash::MIN_PRECISION ||
        header.precision > Geohash::MAX_PACKED_PRECISION) {
        ATLAS_LOG_WARN("SpatialIndex: Unsupported precision {}", header.precision);
        return std::unexpected(GeoError::IndexCorrupt);
    }

    const uint64_t expectedSize = GeoIndexFormat::HEADER_SIZE +
        static_cast<uint64_t>(header.cellCount) * GeoIndexFormat::ENTRY_SIZE;
    if (bytes.size() != expectedSize) {
        ATLAS_LOG_WARN("SpatialIndex: Header declares {} cells ({} bytes) but file has {} bytes",
                       header.cellCount, expectedSize, bytes.size());
        return std::unexpected(GeoError::IndexCorrupt);
    }

    const uint32_t codeLimit = 1u << (header.precision * 5);
    uint64_t locationSum = 0;

    index.m_entries.reserve(header.cellCount);
    index.m_lookup.reserve(header.cellCount);

    for (uint32_t i = 0; i < header.cellCount; ++i) {
        CellIndexEntry entry;
        entry.geohashCode = *reader.ReadU32();
        entry.locationCount = *reader.ReadU32();
        entry.dataOffset = *reader.ReadU64();
        entry.dataLength = *reader.ReadU32();

        if (entry.geohashCode >= codeLimit) {
            ATLAS_LOG_WARN("SpatialIndex: Cell code {} exceeds precision {}",
                           entry.geohashCode, header.precision);
            return std::unexpected(GeoError::IndexCorrupt);
        }

        auto [it, inserted] = index.m_lookup.emplace(entry.geohashCode, index.m_entries.size());
        if (!inserted) {
            ATLAS_LOG_WARN("SpatialIndex: Duplicate cell code {}", entry.geohashCode);
            return std::unexpected(GeoError::IndexCorrupt);
        }

        locationSum += entry.locationCount;
        index.m_entries.push_back(entry);
    }

    if (locationSum != header.totalLocationCount) {
        ATLAS_LOG_WARN("SpatialIndex: Location total {} does not match header {}",
                       locationSum, header.totalLocationCount);
        return std::unexpected(GeoError::IndexCorrupt);
    }

    return index;
}

const CellIndexEntry* SpatialIndex::TryGetCell(std::string_view geohash) const {
    if (geohash.size() != static_cast<size_t>(m_header.precision) || !Geohash::IsValid(geohash)) {
        return nullptr;
    }

    auto it = m_lookup.find(Geohash::EncodeToUInt32(geohash));
    if (it == m_lookup.end()) {
        return nullptr;
    }
    return &m_entries[it->second];
}

std::vector<std::pair<std::string, CellIndexEntry>> SpatialIndex::GetCellAndNeighbors(
    std::string_view geohash) const {
    std::vector<std::pair<std::string, CellIndexEntry>> cells;

    for (auto& cell : Geohash::GetCellAndNeighbors(geohash)) {
        if (const CellIndexEntry* entry = TryGetCell(cell)) {
            cells.emplace_back(std::move(cell), *entry);
        }
    }
    return cells;
}

size_t SpatialIndex::GetEstimatedMemoryBytes() const {
    // Entries plus roughly two words per hash node
    return sizeof(SpatialIndex) +
           m_entries.capacity() * sizeof(CellIndexEntry) +
           m_lookup.size() * (sizeof(std::pair<const uint32_t, size_t>) + 2 * sizeof(void*)) +
           m_lookup.bucket_count() * sizeof(void*);
}

} // namespace Geo
} // namespace Atlas
