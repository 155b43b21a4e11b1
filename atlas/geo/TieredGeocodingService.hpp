#pragma once

#include "geo/IReverseGeocodingService.hpp"
#include "geo/CellCache.hpp"
#include "geo/CellLoader.hpp"
#include "geo/SpatialIndex.hpp"
#include "config/GeocodingConfig.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace Atlas {
namespace Geo {

/**
 * @brief Query counters of a geocoding service
 */
struct GeocodingStatistics {
    size_t queries = 0;
    size_t resolved = 0;
    size_t unresolved = 0;        // No place within the distance bound
    size_t failed = 0;            // Query returned an error
    size_t cellsLoaded = 0;
    size_t cacheHits = 0;
    size_t cacheMisses = 0;
    size_t cacheEvictions = 0;
    size_t cachedCells = 0;
    size_t cacheMemoryBytes = 0;
};

/**
 * @brief Outcome of one nearest-place search
 */
using LookupOutcome = std::expected<std::optional<GeoLookupResult>, GeoError>;

/**
 * @brief Reverse geocoder over a geohash-partitioned index
 *
 * The index is held in memory, cells are read from the data file on demand
 * and kept in a shared LRU cache. Each query searches the cell containing
 * the point and its indexed neighbors, and returns the nearest place
 * within the distance bound.
 *
 * Thread-safe once initialized; the cache lock is held only around cache
 * lookups and inserts, never across disk reads or distance computation.
 * A query holds the index, data file and cache it started with, so Shutdown
 * may run while queries are in flight. The service object itself must
 * outlive every query.
 */
class TieredGeocodingService : public IReverseGeocodingService {
public:
    explicit TieredGeocodingService(GeocodingConfig config = {});
    ~TieredGeocodingService() override;

    TieredGeocodingService(const TieredGeocodingService&) = delete;
    TieredGeocodingService& operator=(const TieredGeocodingService&) = delete;

    /**
     * @brief Locate, load and validate the index and data files
     *
     * Idempotent. Fails with InvalidArgument on an invalid configuration,
     * IoError when the files cannot be found or read, IndexCorrupt /
     * DataCorrupt when they are malformed or do not belong together.
     */
    std::expected<void, GeoError> Initialize() override;

    /**
     * @brief Release the index, data file and cache
     *
     * Queries already running finish against the released state.
     */
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const override { return m_initialized; }

    /**
     * @brief Nearest place within the configured bound, as location fields
     */
    std::expected<std::optional<LocationData>, GeoError> ReverseGeocode(double latitude,
                                                                        double longitude) override;

    /**
     * @brief Nearest place within maxDistanceKm that passes the filter
     * @return The match with its distance and source cell, an empty
     *         optional when nothing qualifies, or an error
     */
    LookupOutcome FindNearest(double latitude, double longitude, double maxDistanceKm,
                              const CandidateFilter& filter);

    /**
     * @brief FindNearest without touching the query counters
     *
     * For callers that answer one query with several searches and count it
     * once through RecordOutcome.
     */
    LookupOutcome Search(double latitude, double longitude, double maxDistanceKm,
                         const CandidateFilter& filter);

    /**
     * @brief Count one finished query. NotInitialized outcomes are not counted.
     */
    void RecordOutcome(const LookupOutcome& outcome);

    /**
     * @brief Filter derived from the configuration (minimum population)
     */
    [[nodiscard]] CandidateFilter GetDefaultFilter() const;

    [[nodiscard]] const GeocodingConfig& GetConfig() const { return m_config; }

    // Valid until Shutdown
    [[nodiscard]] const SpatialIndex* GetIndex() const;
    [[nodiscard]] CellCache* GetCache();

    [[nodiscard]] const std::filesystem::path& GetDataDirectory() const { return m_dataDirectory; }

    [[nodiscard]] GeocodingStatistics GetStatistics() const;

    /**
     * @brief First search directory holding both the index and data file
     */
    [[nodiscard]] static std::optional<std::filesystem::path> FindDataDirectory(const GeocodingConfig& config);

private:
    /**
     * @brief Everything a query reads, released as a unit
     */
    struct ServiceState {
        ServiceState(SpatialIndex loadedIndex, CellLoader openLoader, size_t cacheMemoryBytes);

        SpatialIndex index;
        CellLoader loader;
        CellCache cache;
    };

    [[nodiscard]] std::shared_ptr<ServiceState> AcquireState() const;

    /**
     * @brief Cached cell, or load it from disk when indexed
     * @return nullptr when the cell has no indexed locations
     */
    std::expected<std::shared_ptr<const GeoCell>, GeoError> GetOrLoadCell(ServiceState& state,
                                                                         const std::string& geohash);

    GeocodingConfig m_config;

    std::mutex m_initMutex;
    std::atomic<bool> m_initialized{false};
    std::filesystem::path m_dataDirectory;

    mutable std::mutex m_stateMutex;
    std::shared_ptr<ServiceState> m_state;

    std::atomic<size_t> m_queryCount{0};
    std::atomic<size_t> m_resolvedCount{0};
    std::atomic<size_t> m_unresolvedCount{0};
    std::atomic<size_t> m_failedCount{0};
    std::atomic<size_t> m_cellsLoaded{0};
};

} // namespace Geo
} // namespace Atlas
