#include "lv/core/util/ChunkCache.hpp"

#include <algorithm>

#include "lv/core/util/Logging.hpp"

namespace lv {

ChunkCache::ChunkCache(std::size_t maxEntryBytes, std::size_t maxTotalBytes)
    : _maxEntryBytes(maxEntryBytes), _maxTotalBytes(maxTotalBytes)
{
}

auto ChunkCache::fetch(const std::string& key) const -> BufferPtr
{
    std::lock_guard<std::mutex> lock(_mapMutex);
    auto it = _map.find(key);
    if (it == _map.end()) {
        _misses.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    it->second.lastAccess = ++_generation;
    _hits.fetch_add(1, std::memory_order_relaxed);
    return it->second.chunk;
}

bool ChunkCache::store(const std::string& key, BufferPtr buffer)
{
    if (!buffer) return false;

    const std::size_t bytes = buffer->size();
    if (bytes > _maxEntryBytes) {
        _rejected.fetch_add(1, std::memory_order_relaxed);
        Logger()->info("chunk cache: not caching {} ({} bytes exceeds {} byte ceiling)",
                       key, bytes, _maxEntryBytes);
        return false;
    }

    std::lock_guard<std::mutex> lock(_mapMutex);
    auto [it, inserted] = _map.try_emplace(key, CacheEntry{buffer, bytes, ++_generation});
    if (!inserted) {
        // Concurrent misses on one key decompress independently; last writer wins
        _storedBytes.fetch_sub(it->second.bytes, std::memory_order_relaxed);
        it->second = CacheEntry{std::move(buffer), bytes, _generation};
    }
    _storedBytes.fetch_add(bytes, std::memory_order_relaxed);
    _stores.fetch_add(1, std::memory_order_relaxed);

    if (_maxTotalBytes > 0 && _storedBytes.load(std::memory_order_relaxed) > _maxTotalBytes) {
        evictIfNeeded(key);
    }
    return true;
}

void ChunkCache::clear()
{
    std::lock_guard<std::mutex> lock(_mapMutex);
    _map.clear();
    _storedBytes.store(0, std::memory_order_relaxed);
    _generation = 0;
}

std::size_t ChunkCache::size() const
{
    std::lock_guard<std::mutex> lock(_mapMutex);
    return _map.size();
}

[[gnu::cold]] void ChunkCache::evictIfNeeded(const std::string& keep)
{
    struct EvictCandidate {
        const std::string* key;
        std::size_t bytes;
        uint64_t lastAccess;
    };

    std::vector<EvictCandidate> candidates;
    candidates.reserve(_map.size());
    for (auto& [key, entry] : _map) {
        if (key != keep) {
            candidates.push_back({&key, entry.bytes, entry.lastAccess});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const EvictCandidate& a, const EvictCandidate& b) {
                  return a.lastAccess < b.lastAccess;
              });

    std::size_t currentBytes = _storedBytes.load(std::memory_order_relaxed);
    std::vector<std::string> toRemove;
    for (auto& c : candidates) {
        if (currentBytes <= _maxTotalBytes) break;
        toRemove.push_back(*c.key);
        currentBytes -= c.bytes;
    }

    for (auto& key : toRemove) {
        _map.erase(key);
    }
    _storedBytes.store(currentBytes, std::memory_order_relaxed);
    _evictions.fetch_add(toRemove.size(), std::memory_order_relaxed);
}

auto ChunkCache::stats() const -> Stats
{
    return {
        _hits.load(std::memory_order_relaxed),
        _misses.load(std::memory_order_relaxed),
        _stores.load(std::memory_order_relaxed),
        _rejected.load(std::memory_order_relaxed),
        _evictions.load(std::memory_order_relaxed)
    };
}

void ChunkCache::resetStats()
{
    _hits.store(0, std::memory_order_relaxed);
    _misses.store(0, std::memory_order_relaxed);
    _stores.store(0, std::memory_order_relaxed);
    _rejected.store(0, std::memory_order_relaxed);
    _evictions.store(0, std::memory_order_relaxed);
}

}  // namespace lv
