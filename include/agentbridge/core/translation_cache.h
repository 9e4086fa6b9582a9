#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

/**
 * @brief Statistics about cache performance.
 */
struct CacheStats {
    size_t hits{0};           ///< Number of cache hits
    size_t misses{0};         ///< Number of cache misses
    size_t evictions{0};      ///< Entries evicted at capacity
    size_t expirations{0};    ///< Entries purged after their TTL
    size_t invalidations{0};  ///< Entries dropped by invalidate()
    size_t insertions{0};     ///< Number of entries inserted
    size_t size{0};           ///< Entries currently held

    nlohmann::json toJson() const;
};

/**
 * @brief Configuration for translation caching behavior.
 */
struct CacheConfig {
    /**
     * @brief Maximum number of entries, split evenly across shards.
     */
    std::size_t max_entries{1000};

    /**
     * @brief Default time-to-live for cache entries.
     */
    std::chrono::seconds ttl{300};

    /**
     * @brief Number of independently locked shards.
     */
    std::size_t shard_count{8};

    /**
     * @brief Period of the background TTL sweep.
     */
    std::chrono::milliseconds sweep_interval{60000};

    /**
     * @brief Start the sweep thread on construction.
     */
    bool background_sweep{false};

    /**
     * @brief Whether to enable cache statistics tracking.
     */
    bool track_stats{true};
};

struct CacheKey {
    std::string agentId;
    std::string sourceFormat;
    std::string targetFormat;

    bool operator==(const CacheKey& other) const;
    bool operator<(const CacheKey& other) const;
};

struct CacheEntry {
    nlohmann::json value;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::seconds ttl;
    size_t hitCount{0};
};

/**
 * @brief Sharded TTL cache of translation responses
 *
 * Keys for one agent always land in the same shard, so invalidate() and
 * eviction lock a single shard. At capacity the entry with the fewest hits
 * is evicted (oldest first on ties). Expired entries are purged by
 * sweepExpired(), which the optional background thread calls periodically;
 * tests inject a clock and call it directly.
 */
class TranslationCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param clock Time source, steady_clock::now when empty
     * @throws CacheError if shard_count or max_entries is zero
     */
    explicit TranslationCache(const CacheConfig& config = CacheConfig{}, Clock clock = Clock{});
    ~TranslationCache();

    TranslationCache(const TranslationCache&) = delete;
    TranslationCache& operator=(const TranslationCache&) = delete;

    /**
     * @brief Look up a live entry and count the hit
     */
    std::optional<nlohmann::json> get(const CacheKey& key);

    /**
     * @brief Insert or replace an entry
     * @throws CacheError if the key has no agent id
     */
    void put(const CacheKey& key, nlohmann::json value,
             std::optional<std::chrono::seconds> ttl = std::nullopt);

    bool remove(const CacheKey& key);

    /**
     * @brief Drop every entry scoped to an agent
     * @return Number of entries removed
     */
    size_t invalidate(const std::string& agentId);

    /**
     * @brief Purge expired entries from every shard, one shard at a time
     * @return Number of entries purged
     */
    size_t sweepExpired();

    void clear();
    size_t size() const;
    CacheStats getStats() const;

    /**
     * @brief Stop the background sweep, if running. Idempotent.
     */
    void stop();

private:
    struct Shard {
        mutable std::mutex mutex;
        std::map<CacheKey, CacheEntry> entries;
    };

    Shard& shardFor(const std::string& agentId);
    const Shard& shardFor(const std::string& agentId) const;
    bool isExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const;
    void evictIfNeeded(Shard& shard);
    void sweepLoop();

    template <typename Update>
    void updateStats(Update update) {
        if (config_.track_stats) {
            std::lock_guard<std::mutex> lock(statsMutex_);
            update(stats_);
        }
    }

    CacheConfig config_;
    Clock clock_;
    size_t shardCapacity_;
    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::mutex statsMutex_;
    CacheStats stats_;

    std::mutex sweepMutex_;
    std::condition_variable sweepCv_;
    bool stopping_{false};
    std::thread sweeper_;
};

} // namespace core
} // namespace agentbridge
