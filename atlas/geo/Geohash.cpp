#include "geo/Geohash.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace Atlas {
namespace Geo {
namespace Geohash {

namespace {

constexpr int BITS_PER_CHAR = 5;

constexpr std::array<int8_t, 128> BuildDecodeTable() {
    std::array<int8_t, 128> table{};
    for (auto& value : table) {
        value = -1;
    }
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DECODE_TABLE = BuildDecodeTable();

int CharToValue(char c) {
    auto index = static_cast<unsigned char>(c);
    if (index >= DECODE_TABLE.size() || DECODE_TABLE[index] < 0) {
        throw std::invalid_argument(std::string("Invalid geohash character: '") + c + "'");
    }
    return DECODE_TABLE[index];
}

void ValidatePrecision(int precision, int maxPrecision) {
    if (precision < MIN_PRECISION || precision > maxPrecision) {
        throw std::invalid_argument("Geohash precision must be between 1 and " +
                                    std::to_string(maxPrecision) + ", got " +
                                    std::to_string(precision));
    }
}

void ValidateHash(std::string_view hash) {
    if (hash.empty()) {
        throw std::invalid_argument("Geohash must not be empty");
    }
    if (hash.size() > static_cast<size_t>(MAX_PRECISION)) {
        throw std::invalid_argument("Geohash longer than " + std::to_string(MAX_PRECISION) +
                                    " characters: " + std::string(hash));
    }
}

double WrapLongitude(double longitude) {
    if (longitude > 180.0) return longitude - 360.0;
    if (longitude < -180.0) return longitude + 360.0;
    return longitude;
}

} // namespace

std::string Encode(double latitude, double longitude, int precision) {
    ValidatePrecision(precision, MAX_PRECISION);
    if (!GeoCoordinate(latitude, longitude).IsValid()) {
        throw std::invalid_argument("Coordinate out of range: " + std::to_string(latitude) +
                                    ", " + std::to_string(longitude));
    }

    double latMin = -90.0, latMax = 90.0;
    double lonMin = -180.0, lonMax = 180.0;

    std::string hash;
    hash.reserve(static_cast<size_t>(precision));

    bool evenBit = true;
    int bit = 0;
    int value = 0;

    while (hash.size() < static_cast<size_t>(precision)) {
        if (evenBit) {
            double mid = (lonMin + lonMax) * 0.5;
            if (longitude >= mid) {
                value = (value << 1) | 1;
                lonMin = mid;
            } else {
                value <<= 1;
                lonMax = mid;
            }
        } else {
            double mid = (latMin + latMax) * 0.5;
            if (latitude >= mid) {
                value = (value << 1) | 1;
                latMin = mid;
            } else {
                value <<= 1;
                latMax = mid;
            }
        }
        evenBit = !evenBit;

        if (++bit == BITS_PER_CHAR) {
            hash += ALPHABET[static_cast<size_t>(value)];
            bit = 0;
            value = 0;
        }
    }

    return hash;
}

GeoBounds DecodeBounds(std::string_view hash) {
    ValidateHash(hash);

    GeoBounds bounds{-90.0, 90.0, -180.0, 180.0};
    bool evenBit = true;

    for (char c : hash) {
        int value = CharToValue(c);
        for (int shift = BITS_PER_CHAR - 1; shift >= 0; --shift) {
            bool bitSet = ((value >> shift) & 1) != 0;
            if (evenBit) {
                double mid = (bounds.minLongitude + bounds.maxLongitude) * 0.5;
                if (bitSet) bounds.minLongitude = mid; else bounds.maxLongitude = mid;
            } else {
                double mid = (bounds.minLatitude + bounds.maxLatitude) * 0.5;
                if (bitSet) bounds.minLatitude = mid; else bounds.maxLatitude = mid;
            }
            evenBit = !evenBit;
        }
    }

    return bounds;
}

GeoCoordinate DecodeCenter(std::string_view hash) {
    return DecodeBounds(hash).Center();
}

uint32_t EncodeToUInt32(std::string_view hash) {
    if (hash.empty() || hash.size() > static_cast<size_t>(MAX_PACKED_PRECISION)) {
        throw std::invalid_argument("Packed geohash requires 1-" +
                                    std::to_string(MAX_PACKED_PRECISION) +
                                    " characters: '" + std::string(hash) + "'");
    }

    uint32_t code = 0;
    for (char c : hash) {
        code = (code << BITS_PER_CHAR) | static_cast<uint32_t>(CharToValue(c));
    }
    return code;
}

std::string DecodeFromUInt32(uint32_t code, int precision) {
    ValidatePrecision(precision, MAX_PACKED_PRECISION);

    const int totalBits = precision * BITS_PER_CHAR;
    if ((code >> totalBits) != 0) {
        throw std::invalid_argument("Packed geohash " + std::to_string(code) +
                                    " does not fit precision " + std::to_string(precision));
    }

    std::string hash(static_cast<size_t>(precision), '0');
    for (int i = precision - 1; i >= 0; --i) {
        hash[static_cast<size_t>(i)] = ALPHABET[code & 0x1F];
        code >>= BITS_PER_CHAR;
    }
    return hash;
}

std::vector<std::string> GetNeighbors(std::string_view hash) {
    const GeoBounds bounds = DecodeBounds(hash);
    const GeoCoordinate center = bounds.Center();
    const double height = bounds.Height();
    const double width = bounds.Width();
    const int precision = static_cast<int>(hash.size());

    // N, NE, E, SE, S, SW, W, NW
    static constexpr std::array<std::array<int, 2>, 8> OFFSETS = {{
        {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}
    }};

    std::vector<std::string> neighbors;
    neighbors.reserve(OFFSETS.size());

    for (const auto& [dLat, dLon] : OFFSETS) {
        double latitude = center.latitude + dLat * height;
        if (latitude > 90.0 || latitude < -90.0) {
            continue;
        }
        double longitude = WrapLongitude(center.longitude + dLon * width);

        std::string neighbor = Encode(latitude, longitude, precision);
        if (neighbor == hash) {
            continue;
        }
        if (std::find(neighbors.begin(), neighbors.end(), neighbor) == neighbors.end()) {
            neighbors.push_back(std::move(neighbor));
        }
    }

    return neighbors;
}

std::vector<std::string> GetCellAndNeighbors(std::string_view hash) {
    std::vector<std::string> cells = GetNeighbors(hash);
    cells.insert(cells.begin(), std::string(hash));
    return cells;
}

std::vector<std::string> GetAncestors(std::string_view hash) {
    ValidateHash(hash);

    std::vector<std::string> ancestors;
    ancestors.reserve(hash.size() - 1);
    for (size_t length = 1; length < hash.size(); ++length) {
        ancestors.emplace_back(hash.substr(0, length));
    }
    return ancestors;
}

double HaversineDistance(double lat1, double lon1, double lat2, double lon2) {
    const double dLat = DegToRad(lat2 - lat1);
    const double dLon = DegToRad(lon2 - lon1);

    const double sinLat = std::sin(dLat * 0.5);
    const double sinLon = std::sin(dLon * 0.5);

    const double a = sinLat * sinLat +
                     std::cos(DegToRad(lat1)) * std::cos(DegToRad(lat2)) * sinLon * sinLon;
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(std::max(0.0, 1.0 - a)));

    return EARTH_RADIUS_KM * c;
}

bool IsValid(std::string_view hash) noexcept {
    if (hash.empty() || hash.size() > static_cast<size_t>(MAX_PRECISION)) {
        return false;
    }
    return std::all_of(hash.begin(), hash.end(), [](char c) {
        auto index = static_cast<unsigned char>(c);
        return index < DECODE_TABLE.size() && DECODE_TABLE[index] >= 0;
    });
}

} // namespace Geohash
} // namespace Geo
} // namespace Atlas
