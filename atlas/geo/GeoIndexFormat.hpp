#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>

namespace Atlas {
namespace Geo {

/**
 * @brief Layout constants of geo.geoindex
 *
 * Header (32 bytes, little-endian):
 *   u32 magic, u16 version, u8 precision, u8 flags, u32 cell_count,
 *   u32 total_location_count, i64 build_timestamp, u64 data_file_size
 * followed by cell_count records of
 *   u32 geohash_code, u32 location_count, u64 data_offset, u32 data_length
 */
namespace GeoIndexFormat {
    constexpr uint32_t MAGIC = 0x58444947;          // "GIDX"
    constexpr uint16_t VERSION = 1;
    constexpr size_t HEADER_SIZE = 32;
    constexpr size_t ENTRY_SIZE = 20;
    constexpr uint8_t FLAG_COMPRESSED = 0x01;
}

/**
 * @brief Layout constants of geo.geodata
 *
 * Header (8 bytes): u32 magic, u16 version, u16 reserved.
 * Record: f64 latitude, f64 longitude, u32 population, u8 field_mask,
 * optional strings (district, city, county, state) selected by the mask,
 * then country. Strings are u16 length + UTF-8 bytes.
 */
namespace GeoDataFormat {
    constexpr uint32_t MAGIC = 0x54414447;          // "GDAT"
    constexpr uint16_t VERSION = 1;
    constexpr size_t HEADER_SIZE = 8;
    constexpr size_t RECORD_FIXED_SIZE = 8 + 8 + 4 + 1;

    constexpr uint8_t FIELD_DISTRICT = 0x01;
    constexpr uint8_t FIELD_CITY = 0x02;
    constexpr uint8_t FIELD_COUNTY = 0x04;
    constexpr uint8_t FIELD_STATE = 0x08;
    constexpr uint8_t FIELD_MASK_ALL = 0x0F;

    constexpr size_t COMPRESSED_PREFIX_SIZE = 4;    // u32 uncompressed size
    constexpr uint32_t MAX_BLOCK_SIZE = 64u * 1024u * 1024u;
}

/**
 * @brief Index header as stored on disk
 */
struct GeoIndexHeader {
    uint32_t magic = GeoIndexFormat::MAGIC;
    uint16_t version = GeoIndexFormat::VERSION;
    uint8_t precision = 4;
    uint8_t flags = 0;
    uint32_t cellCount = 0;
    uint32_t totalLocationCount = 0;
    int64_t buildTimestamp = 0;
    uint64_t dataFileSize = 0;
};

/**
 * @brief One cell record of the index
 */
struct CellIndexEntry {
    uint32_t geohashCode = 0;
    uint32_t locationCount = 0;
    uint64_t dataOffset = 0;
    uint32_t dataLength = 0;

    bool operator==(const CellIndexEntry& other) const = default;
};

/**
 * @brief Bounds-checked little-endian reader over a byte span
 *
 * Every read returns std::nullopt instead of running past the end.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : m_data(data) {}

    [[nodiscard]] size_t Position() const { return m_position; }
    [[nodiscard]] size_t Remaining() const { return m_data.size() - m_position; }
    [[nodiscard]] bool AtEnd() const { return m_position == m_data.size(); }

    [[nodiscard]] std::optional<uint8_t> ReadU8() {
        if (Remaining() < 1) return std::nullopt;
        return m_data[m_position++];
    }

    [[nodiscard]] std::optional<uint16_t> ReadU16() { return ReadUnsigned<uint16_t>(); }
    [[nodiscard]] std::optional<uint32_t> ReadU32() { return ReadUnsigned<uint32_t>(); }
    [[nodiscard]] std::optional<uint64_t> ReadU64() { return ReadUnsigned<uint64_t>(); }

    [[nodiscard]] std::optional<int32_t> ReadI32() {
        auto value = ReadU32();
        if (!value) return std::nullopt;
        return std::bit_cast<int32_t>(*value);
    }

    [[nodiscard]] std::optional<int64_t> ReadI64() {
        auto value = ReadU64();
        if (!value) return std::nullopt;
        return std::bit_cast<int64_t>(*value);
    }

    [[nodiscard]] std::optional<double> ReadF64() {
        auto value = ReadU64();
        if (!value) return std::nullopt;
        return std::bit_cast<double>(*value);
    }

    /**
     * @brief Read a string of the given byte length
     */
    [[nodiscard]] std::optional<std::string> ReadString(size_t length) {
        if (Remaining() < length) return std::nullopt;
        std::string value(reinterpret_cast<const char*>(m_data.data() + m_position), length);
        m_position += length;
        return value;
    }

    /**
     * @brief Read a u8 length prefix followed by that many bytes
     */
    [[nodiscard]] std::optional<std::string> ReadShortString() {
        auto length = ReadU8();
        if (!length) return std::nullopt;
        return ReadString(*length);
    }

    /**
     * @brief Read a u16 length prefix followed by that many bytes
     */
    [[nodiscard]] std::optional<std::string> ReadString16() {
        auto length = ReadU16();
        if (!length) return std::nullopt;
        return ReadString(*length);
    }

private:
    template<typename T>
    std::optional<T> ReadUnsigned() {
        if (Remaining() < sizeof(T)) return std::nullopt;
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(static_cast<T>(m_data[m_position + i]) << (8 * i));
        }
        m_position += sizeof(T);
        return value;
    }

    std::span<const uint8_t> m_data;
    size_t m_position = 0;
};

} // namespace Geo
} // namespace Atlas
