#include "geo/TieredGeocodingService.hpp"
#include "geo/Geohash.hpp"
#include "core/Logger.hpp"
#include <cmath>

namespace Atlas {
namespace Geo {

TieredGeocodingService::TieredGeocodingService(GeocodingConfig config)
    : m_config(std::move(config)) {
}

TieredGeocodingService::~TieredGeocodingService() {
    Shutdown();
}

std::optional<std::filesystem::path> TieredGeocodingService::FindDataDirectory(
    const GeocodingConfig& config) {
    for (const auto& directory : config.GetSearchDirectories()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(directory / config.indexFile, ec) &&
            std::filesystem::is_regular_file(directory / config.dataFile, ec)) {
            return directory;
        }
    }
    return std::nullopt;
}

TieredGeocodingService::ServiceState::ServiceState(SpatialIndex loadedIndex, CellLoader openLoader,
                                                  size_t cacheMemoryBytes)
    : index(std::move(loadedIndex))
    , loader(std::move(openLoader))
    , cache(cacheMemoryBytes) {
}

std::expected<void, GeoError> TieredGeocodingService::Initialize() {
    std::lock_guard<std::mutex> lock(m_initMutex);
    if (m_initialized) {
        return {};
    }

    if (auto valid = m_config.Validate(); !valid) {
        ATLAS_LOG_ERROR("Geocoding: Invalid configuration ({})", ToString(valid.error()));
        return std::unexpected(GeoError::InvalidArgument);
    }

    auto directory = FindDataDirectory(m_config);
    if (!directory) {
        for (const auto& searched : m_config.GetSearchDirectories()) {
            ATLAS_LOG_ERROR("Geocoding: No {} / {} in {}", m_config.indexFile, m_config.dataFile,
                            searched.string());
        }
        return std::unexpected(GeoError::IoError);
    }

    auto index = SpatialIndex::Load(*directory / m_config.indexFile);
    if (!index) {
        return std::unexpected(index.error());
    }

    const CellEncoding encoding = index->IsCompressed() ? CellEncoding::Zlib : CellEncoding::Raw;
    auto loader = CellLoader::Open(*directory / m_config.dataFile, encoding);
    if (!loader) {
        return std::unexpected(loader.error());
    }

    if (loader->GetFileSize() != index->GetDataFileSize()) {
        ATLAS_LOG_ERROR("Geocoding: Data file is {} bytes but the index expects {}",
                        loader->GetFileSize(), index->GetDataFileSize());
        return std::unexpected(GeoError::DataCorrupt);
    }

    auto state = std::make_shared<ServiceState>(std::move(*index), std::move(*loader),
                                                m_config.GetCacheMemoryBytes());
    {
        std::lock_guard<std::mutex> stateLock(m_stateMutex);
        m_state = std::move(state);
    }
    m_dataDirectory = *directory;
    m_initialized = true;

    ATLAS_LOG_INFO("Geocoding: Ready (data={}, cache={} MB, maxDistance={} km)",
                   m_dataDirectory.string(), m_config.cacheMemoryMB, m_config.maxDistanceKm);
    return {};
}

void TieredGeocodingService::Shutdown() {
    std::lock_guard<std::mutex> lock(m_initMutex);
    if (!m_initialized) {
        return;
    }

    std::shared_ptr<ServiceState> released;
    {
        std::lock_guard<std::mutex> stateLock(m_stateMutex);
        released = std::move(m_state);
    }
    m_initialized = false;

    ATLAS_LOG_DEBUG("Geocoding: Shutting down. {}", released->cache.GetStatistics());
}

std::shared_ptr<TieredGeocodingService::ServiceState> TieredGeocodingService::AcquireState() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

const SpatialIndex* TieredGeocodingService::GetIndex() const {
    auto state = AcquireState();
    return state ? &state->index : nullptr;
}

CellCache* TieredGeocodingService::GetCache() {
    auto state = AcquireState();
    return state ? &state->cache : nullptr;
}

CandidateFilter TieredGeocodingService::GetDefaultFilter() const {
    CandidateFilter filter;
    filter.minimumPopulation = m_config.minimumPopulation;
    return filter;
}

std::expected<std::optional<LocationData>, GeoError> TieredGeocodingService::ReverseGeocode(
    double latitude, double longitude) {
    auto result = FindNearest(latitude, longitude, m_config.maxDistanceKm, GetDefaultFilter());
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!*result) {
        return std::optional<LocationData>{};
    }
    return std::optional<LocationData>{LocationData::FromEntry((*result)->location)};
}

LookupOutcome TieredGeocodingService::FindNearest(double latitude, double longitude,
                                                  double maxDistanceKm, const CandidateFilter& filter) {
    LookupOutcome outcome = Search(latitude, longitude, maxDistanceKm, filter);
    RecordOutcome(outcome);
    return outcome;
}

LookupOutcome TieredGeocodingService::Search(double latitude, double longitude,
                                             double maxDistanceKm, const CandidateFilter& filter) {
    std::shared_ptr<ServiceState> state = AcquireState();
    if (!state) {
        return std::unexpected(GeoError::NotInitialized);
    }

    if (!GeoCoordinate(latitude, longitude).IsValid() ||
        std::isnan(maxDistanceKm) || maxDistanceKm < 0.0) {
        return std::unexpected(GeoError::InvalidArgument);
    }

    const std::string hash = Geohash::Encode(latitude, longitude, state->index.GetPrecision());

    std::optional<GeoLookupResult> best;

    auto consider = [&](const GeoCell& cell, bool fromNeighbor) {
        auto match = cell.FindNearest(latitude, longitude, maxDistanceKm, filter);
        if (match && (!best || match->distanceKm < best->distanceKm)) {
            best = GeoLookupResult{*match->entry, match->distanceKm, cell.geohash, fromNeighbor};
        }
    };

    // Local cell
    auto local = GetOrLoadCell(*state, hash);
    if (!local) {
        return std::unexpected(local.error());
    }
    if (*local) {
        consider(**local, false);
    }

    // A nearer place may sit just across a cell edge, so neighbors are
    // always searched, even after a local match.
    for (const auto& [neighborHash, entry] : state->index.GetCellAndNeighbors(hash)) {
        if (neighborHash == hash) {
            continue;
        }

        auto neighbor = GetOrLoadCell(*state, neighborHash);
        if (!neighbor) {
            return std::unexpected(neighbor.error());
        }
        if (*neighbor) {
            consider(**neighbor, true);
        }
    }

    if (best) {
        ATLAS_LOG_TRACE("Geocoding: ({:.5f}, {:.5f}) -> {} {:.2f} km from cell {}{}",
                        latitude, longitude, best->location.city.value_or(best->location.country),
                        best->distanceKm, best->cellGeohash,
                        best->isFromNeighborCell ? " (neighbor)" : "");
    }
    return best;
}

void TieredGeocodingService::RecordOutcome(const LookupOutcome& outcome) {
    if (!outcome && outcome.error() == GeoError::NotInitialized) {
        return;
    }

    ++m_queryCount;
    if (!outcome) {
        ++m_failedCount;
    } else if (*outcome) {
        ++m_resolvedCount;
    } else {
        ++m_unresolvedCount;
    }
}

std::expected<std::shared_ptr<const GeoCell>, GeoError> TieredGeocodingService::GetOrLoadCell(
    ServiceState& state, const std::string& geohash) {
    std::shared_ptr<const GeoCell> cell;
    if (state.cache.TryGet(geohash, cell)) {
        return cell;
    }

    const CellIndexEntry* entry = state.index.TryGetCell(geohash);
    if (entry == nullptr) {
        return std::shared_ptr<const GeoCell>{};
    }

    auto loaded = state.loader.LoadCell(*entry, geohash);
    if (!loaded) {
        ATLAS_LOG_WARN("Geocoding: Failed to load cell {}: {}", geohash, ToString(loaded.error()));
        return std::unexpected(loaded.error());
    }

    cell = std::make_shared<const GeoCell>(std::move(*loaded));
    state.cache.Put(geohash, cell);
    ++m_cellsLoaded;
    return cell;
}

GeocodingStatistics TieredGeocodingService::GetStatistics() const {
    GeocodingStatistics stats;
    stats.queries = m_queryCount;
    stats.resolved = m_resolvedCount;
    stats.unresolved = m_unresolvedCount;
    stats.failed = m_failedCount;
    stats.cellsLoaded = m_cellsLoaded;

    if (auto state = AcquireState()) {
        stats.cacheHits = state->cache.GetHitCount();
        stats.cacheMisses = state->cache.GetMissCount();
        stats.cacheEvictions = state->cache.GetEvictionCount();
        stats.cachedCells = state->cache.GetCount();
        stats.cacheMemoryBytes = state->cache.GetCurrentMemoryBytes();
    }
    return stats;
}

} // namespace Geo
} // namespace Atlas
