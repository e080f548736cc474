#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lv {

/**
 * @brief Shared store of decompressed chunk payloads keyed by chunk path
 *
 * A single mutex guards the key -> buffer map and is held only for lookup,
 * insert and eviction bookkeeping; decompression and file IO happen outside.
 * Buffers handed out are immutable shared snapshots.
 *
 * Buffers larger than maxEntryBytes are never stored. With maxTotalBytes == 0
 * (the default) entries are never evicted; otherwise the least recently used
 * entries are dropped after an insert until the total fits again.
 */
class ChunkCache
{
public:
    using Buffer = std::vector<uint8_t>;
    using BufferPtr = std::shared_ptr<const Buffer>;

    static constexpr std::size_t kDefaultMaxEntryBytes = 128ull * 1024 * 1024;

    explicit ChunkCache(std::size_t maxEntryBytes = kDefaultMaxEntryBytes,
                        std::size_t maxTotalBytes = 0);

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    /**
     * @brief Look up a buffer
     * @return Shared buffer, or nullptr on a miss
     */
    BufferPtr fetch(const std::string& key) const;

    /**
     * @brief Insert or replace a buffer
     * @return false (cache unchanged) if the buffer exceeds the entry ceiling
     */
    bool store(const std::string& key, BufferPtr buffer);

    void clear();

    std::size_t size() const;
    std::size_t storedBytes() const { return _storedBytes.load(std::memory_order_relaxed); }

    std::size_t maxEntryBytes() const { return _maxEntryBytes; }
    std::size_t maxTotalBytes() const { return _maxTotalBytes; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t stores;
        uint64_t rejected;
        uint64_t evictions;
    };
    Stats stats() const;
    void resetStats();

private:
    struct CacheEntry {
        BufferPtr chunk;
        std::size_t bytes;
        uint64_t lastAccess;
    };

    // Called with _mapMutex held
    void evictIfNeeded(const std::string& keep);

    const std::size_t _maxEntryBytes;
    const std::size_t _maxTotalBytes;

    mutable std::mutex _mapMutex;
    mutable std::unordered_map<std::string, CacheEntry> _map;
    mutable uint64_t _generation = 0;

    std::atomic<std::size_t> _storedBytes{0};
    mutable std::atomic<uint64_t> _hits{0};
    mutable std::atomic<uint64_t> _misses{0};
    std::atomic<uint64_t> _stores{0};
    std::atomic<uint64_t> _rejected{0};
    std::atomic<uint64_t> _evictions{0};
};

}  // namespace lv
