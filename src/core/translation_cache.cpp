#include "agentbridge/core/translation_cache.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/utils/logging.hpp"
#include <iterator>
#include <tuple>

namespace agentbridge {
namespace core {

nlohmann::json CacheStats::toJson() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"evictions", evictions},
        {"expirations", expirations},
        {"invalidations", invalidations},
        {"insertions", insertions},
        {"size", size}
    };
}

bool CacheKey::operator==(const CacheKey& other) const {
    return std::tie(agentId, sourceFormat, targetFormat) ==
           std::tie(other.agentId, other.sourceFormat, other.targetFormat);
}

bool CacheKey::operator<(const CacheKey& other) const {
    return std::tie(agentId, sourceFormat, targetFormat) <
           std::tie(other.agentId, other.sourceFormat, other.targetFormat);
}

TranslationCache::TranslationCache(const CacheConfig& config, Clock clock)
    : config_(config),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (config_.shard_count == 0 || config_.max_entries == 0) {
        throw CacheError("Cache needs at least one shard and one entry");
    }
    shardCapacity_ = (config_.max_entries + config_.shard_count - 1) / config_.shard_count;
    for (size_t i = 0; i < config_.shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    if (config_.background_sweep) {
        sweeper_ = std::thread(&TranslationCache::sweepLoop, this);
    }
}

TranslationCache::~TranslationCache() {
    stop();
}

void TranslationCache::stop() {
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        stopping_ = true;
    }
    sweepCv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

std::optional<nlohmann::json> TranslationCache::get(const CacheKey& key) {
    Shard& shard = shardFor(key.agentId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        updateStats([](CacheStats& stats) { stats.misses++; });
        return std::nullopt;
    }

    if (isExpired(it->second, clock_())) {
        shard.entries.erase(it);
        updateStats([](CacheStats& stats) {
            stats.expirations++;
            stats.misses++;
        });
        return std::nullopt;
    }

    it->second.hitCount++;
    updateStats([](CacheStats& stats) { stats.hits++; });
    return it->second.value;
}

void TranslationCache::put(const CacheKey& key, nlohmann::json value, std::optional<std::chrono::seconds> ttl) {
    if (key.agentId.empty()) {
        throw CacheError("Cache key requires an agent id");
    }
    Shard& shard = shardFor(key.agentId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    shard.entries.erase(key);
    evictIfNeeded(shard);

    CacheEntry entry;
    entry.value = std::move(value);
    entry.timestamp = clock_();
    entry.ttl = ttl ? *ttl : config_.ttl;
    shard.entries.emplace(key, std::move(entry));

    updateStats([](CacheStats& stats) { stats.insertions++; });
}

bool TranslationCache::remove(const CacheKey& key) {
    Shard& shard = shardFor(key.agentId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.erase(key) > 0;
}

size_t TranslationCache::invalidate(const std::string& agentId) {
    Shard& shard = shardFor(agentId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    // Keys sort by agent id first, so the agent's entries are contiguous.
    auto first = shard.entries.lower_bound(CacheKey{agentId, "", ""});
    auto last = first;
    size_t removed = 0;
    while (last != shard.entries.end() && last->first.agentId == agentId) {
        ++last;
        ++removed;
    }
    shard.entries.erase(first, last);

    if (removed > 0) {
        updateStats([removed](CacheStats& stats) { stats.invalidations += removed; });
        XLOG_DEBUG("[cache] invalidated " << removed << " entries for " << agentId);
    }
    return removed;
}

size_t TranslationCache::sweepExpired() {
    size_t purged = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        auto now = clock_();
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (isExpired(it->second, now)) {
                it = shard->entries.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }
    }
    if (purged > 0) {
        updateStats([purged](CacheStats& stats) { stats.expirations += purged; });
        XLOG_DEBUG("[cache] sweep purged " << purged << " expired entries");
    }
    return purged;
}

void TranslationCache::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->entries.clear();
    }
}

size_t TranslationCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

CacheStats TranslationCache::getStats() const {
    CacheStats snapshot;
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        snapshot = stats_;
    }
    snapshot.size = size();
    return snapshot;
}

TranslationCache::Shard& TranslationCache::shardFor(const std::string& agentId) {
    return *shards_[std::hash<std::string>{}(agentId) % shards_.size()];
}

const TranslationCache::Shard& TranslationCache::shardFor(const std::string& agentId) const {
    return *shards_[std::hash<std::string>{}(agentId) % shards_.size()];
}

bool TranslationCache::isExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const {
    return now - entry.timestamp >= entry.ttl;
}

void TranslationCache::evictIfNeeded(Shard& shard) {
    // Assumes shard.mutex is already held
    while (shard.entries.size() >= shardCapacity_ && !shard.entries.empty()) {
        auto victim = shard.entries.begin();
        for (auto it = std::next(victim); it != shard.entries.end(); ++it) {
            const CacheEntry& candidate = it->second;
            const CacheEntry& current = victim->second;
            if (candidate.hitCount < current.hitCount ||
                (candidate.hitCount == current.hitCount && candidate.timestamp < current.timestamp)) {
                victim = it;
            }
        }
        XLOG_DEBUG("[cache] evicting " << victim->first.agentId << " " << victim->first.sourceFormat
                   << "->" << victim->first.targetFormat << " (" << victim->second.hitCount << " hits)");
        shard.entries.erase(victim);
        updateStats([](CacheStats& stats) { stats.evictions++; });
    }
}

void TranslationCache::sweepLoop() {
    std::unique_lock<std::mutex> lock(sweepMutex_);
    while (!stopping_) {
        if (sweepCv_.wait_for(lock, config_.sweep_interval, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        sweepExpired();
        lock.lock();
    }
}

} // namespace core
} // namespace agentbridge
