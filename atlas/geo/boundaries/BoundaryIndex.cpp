#include "geo/boundaries/BoundaryIndex.hpp"
#include "geo/boundaries/PointInPolygon.hpp"
#include "geo/Geohash.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Atlas {
namespace Geo {
namespace Boundaries {

namespace {

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

BoundaryIndex::BoundaryIndex(GeocodingConfig config)
    : m_config(std::move(config)) {
}

std::optional<std::filesystem::path> BoundaryIndex::FindBoundaryFile(const GeocodingConfig& config) {
    for (const auto& directory : config.GetSearchDirectories()) {
        std::error_code ec;
        auto candidate = directory / config.boundaryFile;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::expected<void, GeoError> BoundaryIndex::Initialize() {
    if (m_initialized) {
        return {};
    }

    auto path = FindBoundaryFile(m_config);
    if (!path) {
        ATLAS_LOG_DEBUG("BoundaryIndex: No {} found in search directories", m_config.boundaryFile);
        return std::unexpected(GeoError::IoError);
    }
    return InitializeFromFile(*path);
}

std::expected<void, GeoError> BoundaryIndex::InitializeFromFile(const std::filesystem::path& path) {
    auto data = BoundaryFileFormat::Read(path);
    if (!data) {
        return std::unexpected(data.error());
    }

    InitializeFromData(std::move(*data));
    ATLAS_LOG_INFO("BoundaryIndex: Loaded {} ({} countries, {} cached cells, {} border cells)",
                   path.string(), m_countries.size(), m_geohashCache.size(), m_borderCells.size());
    return {};
}

void BoundaryIndex::InitializeFromData(BoundaryData data) {
    m_initialized = false;

    m_cachePrecision = data.cachePrecision;
    m_countries = std::move(data.countries);
    m_geohashCache = std::move(data.geohashCache);
    m_borderCells = std::move(data.borderCells);

    m_countryLookup.clear();
    for (size_t i = 0; i < m_countries.size(); ++i) {
        m_countries[i].ComputeBounds();
        m_countryLookup[ToUpper(m_countries[i].countryCode)] = i;
    }

    {
        std::lock_guard<std::mutex> lock(m_lookupMutex);
        m_lookupCache.clear();
    }

    m_initialized = true;
}

const CountryBoundary* BoundaryIndex::FindCountry(const std::string& countryCode) const {
    auto it = m_countryLookup.find(ToUpper(countryCode));
    return it != m_countryLookup.end() ? &m_countries[it->second] : nullptr;
}

CountryLookupResult BoundaryIndex::GetCountry(double latitude, double longitude) const {
    if (!m_initialized || !std::isfinite(latitude) || !std::isfinite(longitude)) {
        return {};
    }

    latitude = PointInPolygon::ClampLatitude(latitude);
    longitude = PointInPolygon::NormalizeLongitude(longitude);

    const std::string cacheKey = fmt::format("{:.4f},{:.4f}", latitude, longitude);
    {
        std::lock_guard<std::mutex> lock(m_lookupMutex);
        auto it = m_lookupCache.find(cacheKey);
        if (it != m_lookupCache.end()) {
            return it->second;
        }
    }

    const std::string geohash = Geohash::Encode(latitude, longitude, m_cachePrecision);

    // Cell entirely inside one country
    if (auto it = m_geohashCache.find(geohash); it != m_geohashCache.end()) {
        CountryLookupResult result;
        result.countryCode = it->second;
        CacheLookupResult(cacheKey, result);
        return result;
    }

    // Border cell: only its candidates need polygon tests
    if (auto it = m_borderCells.find(geohash); it != m_borderCells.end()) {
        for (const auto& code : it->second) {
            const CountryBoundary* country = FindCountry(code);
            if (country && PointInPolygon::IsPointInCountry(latitude, longitude, *country)) {
                CountryLookupResult result;
                result.countryCode = code;
                result.isBorderArea = true;
                result.candidates = it->second;
                CacheLookupResult(cacheKey, result);
                return result;
            }
        }
    }

    for (const auto& country : m_countries) {
        if (PointInPolygon::IsPointInCountry(latitude, longitude, country)) {
            CountryLookupResult result;
            result.countryCode = country.countryCode;
            CacheLookupResult(cacheKey, result);
            return result;
        }
    }

    CountryLookupResult ocean;
    ocean.isOcean = true;
    CacheLookupResult(cacheKey, ocean);
    return ocean;
}

bool BoundaryIndex::IsPointInCountry(double latitude, double longitude,
                                     const std::string& countryCode) const {
    if (!m_initialized) {
        return false;
    }

    const CountryBoundary* country = FindCountry(countryCode);
    if (country == nullptr) {
        return false;
    }

    return PointInPolygon::IsPointInCountry(PointInPolygon::ClampLatitude(latitude),
                                            PointInPolygon::NormalizeLongitude(longitude),
                                            *country);
}

std::vector<std::string> BoundaryIndex::GetCandidateCountries(double latitude, double longitude) const {
    if (!m_initialized || !std::isfinite(latitude) || !std::isfinite(longitude)) {
        return {};
    }

    latitude = PointInPolygon::ClampLatitude(latitude);
    longitude = PointInPolygon::NormalizeLongitude(longitude);

    const std::string geohash = Geohash::Encode(latitude, longitude, m_cachePrecision);

    if (auto it = m_borderCells.find(geohash); it != m_borderCells.end()) {
        return it->second;
    }
    if (auto it = m_geohashCache.find(geohash); it != m_geohashCache.end()) {
        return {it->second};
    }

    std::vector<std::string> candidates;
    for (const auto& country : m_countries) {
        if (country.bounds.Contains(latitude, longitude)) {
            candidates.push_back(country.countryCode);
        }
    }
    return candidates;
}

size_t BoundaryIndex::GetLookupCacheSize() const {
    std::lock_guard<std::mutex> lock(m_lookupMutex);
    return m_lookupCache.size();
}

void BoundaryIndex::CacheLookupResult(const std::string& key, const CountryLookupResult& result) const {
    std::lock_guard<std::mutex> lock(m_lookupMutex);
    if (m_lookupCache.size() >= MAX_LOOKUP_CACHE_SIZE) {
        m_lookupCache.clear();
    }
    m_lookupCache.emplace(key, result);
}

} // namespace Boundaries
} // namespace Geo
} // namespace Atlas
