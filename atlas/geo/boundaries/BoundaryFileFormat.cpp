#include "geo/boundaries/BoundaryFileFormat.hpp"
#include "geo/GeoIndexFormat.hpp"
#include "geo/Geohash.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace Atlas {
namespace Geo {
namespace Boundaries {
namespace BoundaryFileFormat {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Rejects counts that cannot fit in the remaining bytes before reserving
bool CountFits(const ByteReader& reader, uint64_t count, size_t minItemSize) {
    return count * minItemSize <= reader.Remaining();
}

bool ReadRing(ByteReader& reader, PolygonRing& ring) {
    auto vertexCount = reader.ReadU32();
    if (!vertexCount || !CountFits(reader, *vertexCount, 8)) return false;

    ring.vertices.reserve(*vertexCount);
    for (uint32_t i = 0; i < *vertexCount; ++i) {
        auto latMicro = reader.ReadI32();
        auto lonMicro = reader.ReadI32();
        if (!latMicro || !lonMicro) return false;

        const double latitude = *latMicro / MICRO_DEGREES;
        const double longitude = *lonMicro / MICRO_DEGREES;
        if (!GeoCoordinate(latitude, longitude).IsValid()) return false;

        ring.vertices.emplace_back(longitude, latitude);
    }
    return true;
}

bool ReadCountry(ByteReader& reader, CountryBoundary& country) {
    auto code = reader.ReadShortString();
    auto name = reader.ReadShortString();
    auto polygonCount = reader.ReadU32();
    if (!code || code->empty() || !name || !polygonCount) return false;
    if (!CountFits(reader, *polygonCount, 4)) return false;

    country.countryCode = *code;
    country.name = *name;
    country.polygons.resize(*polygonCount);

    for (auto& polygon : country.polygons) {
        auto ringCount = reader.ReadU32();
        if (!ringCount || *ringCount == 0 || !CountFits(reader, *ringCount, 4)) return false;

        if (!ReadRing(reader, polygon.exterior)) return false;

        polygon.holes.resize(*ringCount - 1);
        for (auto& hole : polygon.holes) {
            if (!ReadRing(reader, hole)) return false;
        }
    }

    country.ComputeBounds();
    return true;
}

} // namespace

std::expected<BoundaryData, GeoError> Read(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ATLAS_LOG_WARN("BoundaryFileFormat: Cannot open {}", path.string());
        return std::unexpected(GeoError::IoError);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(GeoError::IoError);
    }

    auto data = Parse(bytes);
    if (!data) {
        ATLAS_LOG_ERROR("BoundaryFileFormat: Failed to parse boundary file {}", path.string());
    }
    return data;
}

std::expected<BoundaryData, GeoError> Parse(std::span<const uint8_t> bytes) {
    if (bytes.size() < HEADER_SIZE) {
        return std::unexpected(GeoError::DataCorrupt);
    }

    ByteReader reader(bytes);
    const uint32_t magic = *reader.ReadU32();
    const uint16_t version = *reader.ReadU16();
    const uint8_t cachePrecision = *reader.ReadU8();
    (void)reader.ReadU8();
    const uint32_t countryCount = *reader.ReadU32();
    const uint32_t geohashCacheCount = *reader.ReadU32();
    const uint32_t borderCellCount = *reader.ReadU32();
    (void)reader.ReadU32();

    if (magic != MAGIC || version != VERSION) {
        ATLAS_LOG_WARN("BoundaryFileFormat: Bad header (magic=0x{:08X}, version={})", magic, version);
        return std::unexpected(GeoError::DataCorrupt);
    }
    if (cachePrecision < Geohash::MIN_PRECISION || cachePrecision > Geohash::MAX_PRECISION) {
        return std::unexpected(GeoError::DataCorrupt);
    }

    BoundaryData data;
    data.cachePrecision = cachePrecision;

    if (!CountFits(reader, countryCount, 6)) {
        return std::unexpected(GeoError::DataCorrupt);
    }
    data.countries.resize(countryCount);
    for (auto& country : data.countries) {
        if (!ReadCountry(reader, country)) {
            return std::unexpected(GeoError::DataCorrupt);
        }
    }

    auto readCountryIndex = [&](std::string& outCode) -> bool {
        auto index = reader.ReadU16();
        if (!index || *index >= data.countries.size()) return false;
        outCode = data.countries[*index].countryCode;
        return true;
    };

    for (uint32_t i = 0; i < geohashCacheCount; ++i) {
        auto hash = reader.ReadShortString();
        std::string code;
        if (!hash || !Geohash::IsValid(ToLower(*hash)) || !readCountryIndex(code)) {
            return std::unexpected(GeoError::DataCorrupt);
        }
        data.geohashCache[ToLower(*hash)] = std::move(code);
    }

    for (uint32_t i = 0; i < borderCellCount; ++i) {
        auto hash = reader.ReadShortString();
        auto candidateCount = reader.ReadU8();
        if (!hash || !Geohash::IsValid(ToLower(*hash)) || !candidateCount) {
            return std::unexpected(GeoError::DataCorrupt);
        }

        std::vector<std::string> candidates(*candidateCount);
        for (auto& code : candidates) {
            if (!readCountryIndex(code)) {
                return std::unexpected(GeoError::DataCorrupt);
            }
        }
        data.borderCells[ToLower(*hash)] = std::move(candidates);
    }

    if (!reader.AtEnd()) {
        ATLAS_LOG_WARN("BoundaryFileFormat: {} trailing bytes", reader.Remaining());
        return std::unexpected(GeoError::DataCorrupt);
    }
    return data;
}

} // namespace BoundaryFileFormat
} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
