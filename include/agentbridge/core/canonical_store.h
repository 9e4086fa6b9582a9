#pragma once

#include "agentbridge/core/canonical_graph.h"
#include "agentbridge/utils/result.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

struct SnapshotMetadata {
    std::chrono::system_clock::time_point timestamp{};   ///< Set on commit when left empty
    std::string sourceFormat;
    double fidelity{1.0};
};

/**
 * @brief Immutable, versioned canonical graph of one agent
 */
struct AgentSnapshot {
    std::string agentId;
    uint64_t version{0};
    CanonicalGraph graph;
    SnapshotMetadata metadata;
    std::string checksum;        ///< SHA-256 of the serialized graph
};

struct SnapshotRef {
    std::string agentId;
    uint64_t version{0};
};

struct HistoryEntry {
    uint64_t version{0};
    std::chrono::system_clock::time_point timestamp;
    std::string sourceFormat;
    double fidelity{1.0};
    bool compacted{false};     ///< Body pruned by compact(), metadata kept
};

/**
 * @brief Filters for discoverAgents(); absent fields match everything
 */
struct DiscoveryCriteria {
    std::optional<std::string> capability;  ///< ab:capability or tool name
    std::optional<std::string> protocol;    ///< ab:protocol or source format
    std::optional<std::string> textQuery;   ///< Case-insensitive match on id, name, description, role, goal
};

struct AgentSummary {
    std::string agentId;
    std::string name;
    std::string description;
    uint64_t latestVersion{0};
    size_t versionCount{0};
    std::string sourceFormat;
    std::chrono::system_clock::time_point updated;
    std::vector<std::string> capabilities;

    nlohmann::json toJson() const;
};

/**
 * @brief Audit record of one translation attempt, success or failure
 */
struct TranslationActivity {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string agentId;
    std::string sourceFormat;
    std::string targetFormat;
    double fidelityScore{0.0};
    std::vector<std::string> lostFields;
    std::chrono::milliseconds duration{0};
    bool success{false};

    nlohmann::json toJson() const;
    static TranslationActivity fromJson(const nlohmann::json& json);

    /**
     * @brief Unique id of the form act_<ms>_<hex>
     */
    static std::string generateId();
};

/**
 * @brief Which superseded snapshot bodies compact() keeps
 *
 * A body is kept while it is among the newest keep_versions of its agent or
 * younger than max_age. The latest version is always kept.
 */
struct RetentionPolicy {
    size_t keep_versions{10};
    std::chrono::hours max_age{24 * 30};
};

struct StoreConfig {
    std::string storage_path;         ///< Empty keeps everything in memory
    bool enable_compression{true};    ///< zlib-compress persisted graph bodies
    RetentionPolicy retention;
};

struct StoreStats {
    size_t totalAgents{0};
    size_t totalSnapshots{0};
    size_t compactedSnapshots{0};
    size_t totalTriples{0};
    size_t activityRecords{0};
    std::optional<std::chrono::system_clock::time_point> oldest;
    std::optional<std::chrono::system_clock::time_point> newest;

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only, versioned storage of canonical graphs
 *
 * Versions of one agent are 1, 2, 3, ... with no gaps. Writers of the same
 * agent are serialized by a per-agent lock; writers of different agents
 * proceed in parallel. A snapshot becomes visible to readers only after it
 * is fully committed (and persisted, when a storage path is configured).
 */
class CanonicalStore {
public:
    /**
     * @brief Open a store, reloading persisted snapshots and activity
     * @throws StoreError if the storage directory cannot be created
     */
    explicit CanonicalStore(const StoreConfig& config = StoreConfig{});
    virtual ~CanonicalStore();

    CanonicalStore(const CanonicalStore&) = delete;
    CanonicalStore& operator=(const CanonicalStore&) = delete;

    /**
     * @brief Commit a new version of an agent
     *
     * @param expectedVersion If set, the current latest version the caller
     *        based its change on (0 for a new agent)
     * @throws StoreError VERSION_CONFLICT when expectedVersion is stale,
     *         INTEGRITY when the graph does not describe exactly one agent,
     *         PERSISTENCE when writing to disk fails
     */
    virtual SnapshotRef createAgentSnapshot(const std::string& agentId,
                                    const CanonicalGraph& graph,
                                    const SnapshotMetadata& metadata,
                                    std::optional<uint64_t> expectedVersion = std::nullopt);

    /**
     * @brief A committed snapshot, the latest when version is omitted
     * @return std::nullopt for unknown agents or versions and for compacted bodies
     */
    std::optional<AgentSnapshot> getAgentSnapshot(const std::string& agentId,
                                                  std::optional<uint64_t> version = std::nullopt) const;

    std::optional<uint64_t> latestVersion(const std::string& agentId) const;

    /**
     * @brief Version history in ascending order, compacted versions included
     */
    std::vector<HistoryEntry> getAgentHistory(const std::string& agentId) const;

    std::optional<AgentSummary> getAgentSummary(const std::string& agentId) const;

    std::vector<AgentSummary> discoverAgents(const DiscoveryCriteria& criteria) const;

    /**
     * @brief Agents ordered by id
     * @param limit 0 for no limit
     */
    std::vector<AgentSummary> listAgents(size_t limit = 0, size_t offset = 0) const;

    /**
     * @brief Remove an agent and all its versions; the activity log is kept
     * @return false if the agent is unknown
     */
    bool deleteAgent(const std::string& agentId);

    /**
     * @brief Append an activity record, assigning id and timestamp when empty
     */
    void recordTranslation(TranslationActivity activity);

    /**
     * @brief Activity records in append order, optionally for one agent
     */
    std::vector<TranslationActivity> getActivityLog(const std::optional<std::string>& agentId = std::nullopt) const;

    /**
     * @brief Prune snapshot bodies outside the retention policy
     * @return Number of bodies pruned
     */
    size_t compact();

    /**
     * @brief Recompute a snapshot's checksum against the stored one
     */
    Result<void> verifySnapshot(const std::string& agentId, uint64_t version) const;

    StoreStats getStats() const;

    const StoreConfig& config() const { return config_; }

private:
    struct StoredSnapshot {
        uint64_t version{0};
        std::shared_ptr<const CanonicalGraph> graph;   ///< Null once compacted
        SnapshotMetadata metadata;
        std::string checksum;
    };

    struct AgentRecord {
        std::mutex writeMutex;
        std::vector<StoredSnapshot> snapshots;   ///< Index i holds version i + 1
    };

    std::shared_ptr<AgentRecord> recordFor(const std::string& agentId, bool create);
    std::optional<AgentSummary> summarize(const std::string& agentId, const AgentRecord& record) const;
    bool matches(const DiscoveryCriteria& criteria, const std::string& agentId, const AgentRecord& record) const;
    bool shouldRetain(const StoredSnapshot& snapshot, size_t rankFromNewest,
                      std::chrono::system_clock::time_point now) const;

    // Persistence helpers, only used with a storage path
    std::string agentDirectory(const std::string& agentId) const;
    Result<void> persistSnapshot(const std::string& agentId, const StoredSnapshot& snapshot,
                                 const std::string& body) const;
    Result<void> persistMetadata(const std::string& agentId, const StoredSnapshot& snapshot, bool compacted) const;
    Result<std::string> readBody(const std::string& agentId, uint64_t version) const;
    Result<void> appendActivity(const TranslationActivity& activity) const;
    void loadFromDisk();

    StoreConfig config_;
    bool persistent_;

    // Guards agents_ and the snapshot vectors; writers additionally hold
    // their agent's writeMutex for the whole commit.
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<AgentRecord>> agents_;

    mutable std::mutex activityMutex_;
    std::vector<TranslationActivity> activity_;
};

} // namespace core
} // namespace agentbridge
