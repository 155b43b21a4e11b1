#pragma once

#include "geo/GeoTypes.hpp"
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Atlas {
namespace Geo {

/**
 * @brief Byte-budgeted LRU cache of materialized cells
 *
 * Cells are shared as std::shared_ptr<const GeoCell>, so a caller keeps a
 * valid cell even if it is evicted while in use. All bookkeeping is guarded
 * by one mutex; counters are atomics and can be read without locking.
 */
class CellCache {
public:
    static constexpr size_t DEFAULT_MAX_MEMORY_BYTES = 8 * 1024 * 1024;

    explicit CellCache(size_t maxMemoryBytes = DEFAULT_MAX_MEMORY_BYTES);

    CellCache(const CellCache&) = delete;
    CellCache& operator=(const CellCache&) = delete;

    // ==========================================================================
    // Cache Operations
    // ==========================================================================

    /**
     * @brief Insert or replace a cell and mark it most recently used
     *
     * Least recently used cells are evicted until the total fits the budget
     * or only the new cell remains. A cell larger than the whole budget is
     * still admitted.
     */
    void Put(const std::string& geohash, std::shared_ptr<const GeoCell> cell);

    /**
     * @brief Get a cached cell
     * @param geohash Cell to look up
     * @param outCell Receives the cell on a hit
     * @return true on a hit, which also marks the cell most recently used
     */
    bool TryGet(const std::string& geohash, std::shared_ptr<const GeoCell>& outCell);

    /**
     * @brief Check presence without touching recency or statistics
     */
    [[nodiscard]] bool Contains(const std::string& geohash) const;

    /**
     * @brief Remove one cell
     * @return true if the cell was cached
     */
    bool Remove(const std::string& geohash);

    /**
     * @brief Remove all cells and reset memory accounting
     */
    void Clear();

    // ==========================================================================
    // Statistics
    // ==========================================================================

    [[nodiscard]] size_t GetCount() const;
    [[nodiscard]] size_t GetCurrentMemoryBytes() const { return m_currentMemoryBytes; }
    [[nodiscard]] size_t GetMaxMemoryBytes() const { return m_maxMemoryBytes; }
    [[nodiscard]] size_t GetHitCount() const { return m_hitCount; }
    [[nodiscard]] size_t GetMissCount() const { return m_missCount; }
    [[nodiscard]] size_t GetEvictionCount() const { return m_evictionCount; }

    /**
     * @brief Get hit rate (0-1)
     */
    [[nodiscard]] double GetHitRate() const;

    /**
     * @brief Cached geohashes, most recently used first
     */
    [[nodiscard]] std::vector<std::string> GetCachedGeohashes() const;

    /**
     * @brief One-line summary of counts, memory and hit rate
     */
    [[nodiscard]] std::string GetStatistics() const;

    /**
     * @brief Reset hit, miss and eviction counters
     */
    void ResetStatistics();

private:
    struct Slot {
        std::shared_ptr<const GeoCell> cell;
        size_t memoryBytes = 0;
        std::list<std::string>::iterator lruPosition;
    };

    void EraseSlot(std::unordered_map<std::string, Slot>::iterator it);
    void EvictToBudget();

    const size_t m_maxMemoryBytes;
    mutable std::mutex m_mutex;

    std::list<std::string> m_lruList;  // Most recent at front
    std::unordered_map<std::string, Slot> m_slots;

    std::atomic<size_t> m_currentMemoryBytes{0};
    std::atomic<size_t> m_hitCount{0};
    std::atomic<size_t> m_missCount{0};
    std::atomic<size_t> m_evictionCount{0};
};

} // namespace Geo
} // namespace Atlas
