#include "geo/CellCache.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>

namespace Atlas {
namespace Geo {

CellCache::CellCache(size_t maxMemoryBytes)
    : m_maxMemoryBytes(maxMemoryBytes) {
}

void CellCache::Put(const std::string& geohash, std::shared_ptr<const GeoCell> cell) {
    if (!cell) {
        ATLAS_LOG_WARN("CellCache: Ignoring null cell for {}", geohash);
        return;
    }

    const size_t memoryBytes = cell->estimatedMemoryBytes;

    std::lock_guard<std::mutex> lock(m_mutex);

    // Replace an existing entry in place
    auto existing = m_slots.find(geohash);
    if (existing != m_slots.end()) {
        EraseSlot(existing);
    }

    m_lruList.push_front(geohash);
    Slot& slot = m_slots[geohash];
    slot.cell = std::move(cell);
    slot.memoryBytes = memoryBytes;
    slot.lruPosition = m_lruList.begin();
    m_currentMemoryBytes += memoryBytes;

    EvictToBudget();
}

bool CellCache::TryGet(const std::string& geohash, std::shared_ptr<const GeoCell>& outCell) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_slots.find(geohash);
    if (it == m_slots.end()) {
        ++m_missCount;
        return false;
    }

    m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruPosition);
    outCell = it->second.cell;
    ++m_hitCount;
    return true;
}

bool CellCache::Contains(const std::string& geohash) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.contains(geohash);
}

bool CellCache::Remove(const std::string& geohash) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_slots.find(geohash);
    if (it == m_slots.end()) {
        return false;
    }
    EraseSlot(it);
    return true;
}

void CellCache::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots.clear();
    m_lruList.clear();
    m_currentMemoryBytes = 0;
}

size_t CellCache::GetCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

double CellCache::GetHitRate() const {
    const size_t hits = m_hitCount;
    const size_t total = hits + m_missCount;
    return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
}

std::vector<std::string> CellCache::GetCachedGeohashes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_lruList.begin(), m_lruList.end()};
}

std::string CellCache::GetStatistics() const {
    constexpr double MB = 1024.0 * 1024.0;
    return fmt::format("Cells: {}, Memory: {:.2f}/{:.2f} MB, Hits: {}, Misses: {}, "
                       "Hit rate: {:.1f}%, Evictions: {}",
                       GetCount(),
                       static_cast<double>(GetCurrentMemoryBytes()) / MB,
                       static_cast<double>(m_maxMemoryBytes) / MB,
                       GetHitCount(), GetMissCount(), GetHitRate() * 100.0,
                       GetEvictionCount());
}

void CellCache::ResetStatistics() {
    m_hitCount = 0;
    m_missCount = 0;
    m_evictionCount = 0;
}

void CellCache::EraseSlot(std::unordered_map<std::string, Slot>::iterator it) {
    m_currentMemoryBytes -= it->second.memoryBytes;
    m_lruList.erase(it->second.lruPosition);
    m_slots.erase(it);
}

void CellCache::EvictToBudget() {
    while (m_currentMemoryBytes > m_maxMemoryBytes && m_slots.size() > 1) {
        const std::string& victim = m_lruList.back();
        auto it = m_slots.find(victim);
        ATLAS_LOG_TRACE("CellCache: Evicting {} ({} bytes)", victim, it->second.memoryBytes);
        EraseSlot(it);
        ++m_evictionCount;
    }
}

} // namespace Geo
} // namespace Atlas
