#include "agentbridge/core/canonical_store.h"
#include "agentbridge/core/errors.h"
#include "agentbridge/utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <openssl/evp.h>
#include <zlib.h>

namespace agentbridge {
namespace core {

namespace fs = std::filesystem;

namespace {
    const char* const ACTIVITY_FILE = "activity.jsonl";

    // Helper function to create a SHA-256 hash of a string
    std::string sha256(const std::string& data) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr) {
            throw StoreError(StoreErrorKind::INTEGRITY, "Cannot allocate digest context");
        }
        bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) {
            throw StoreError(StoreErrorKind::INTEGRITY, "SHA-256 digest failed");
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hashLen; i++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

    std::vector<uint8_t> compressData(const std::string& input) {
        std::vector<uint8_t> output(compressBound(input.size()));
        uLongf destLen = output.size();
        int result = compress2(output.data(), &destLen,
                               reinterpret_cast<const Bytef*>(input.data()), input.size(), Z_BEST_SPEED);
        if (result != Z_OK) {
            throw StoreError(StoreErrorKind::PERSISTENCE, "Compression failed");
        }
        output.resize(destLen);
        return output;
    }

    std::string decompressData(const std::vector<uint8_t>& input, size_t originalSize) {
        std::string output(originalSize, '\0');
        uLongf destLen = output.size();
        int result = uncompress(reinterpret_cast<Bytef*>(&output[0]), &destLen, input.data(), input.size());
        if (result != Z_OK || destLen != originalSize) {
            throw StoreError(StoreErrorKind::INTEGRITY, "Decompression failed");
        }
        return output;
    }

    int64_t toMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point fromMillis(int64_t ms) {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
    }

    // Agent ids may contain characters that are not safe in file names.
    std::string encodePathComponent(const std::string& text) {
        std::ostringstream out;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
                out << c;
            } else {
                out << '%' << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::nouppercase;
            }
        }
        return out.str();
    }

    std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    // Write to a temporary file and rename, so readers never see half a file.
    Result<void> writeFileAtomically(const fs::path& path, const void* data, size_t size) {
        fs::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Result<void>::failure("Cannot open " + tmp.string() + " for writing");
            }
            file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
            if (!file) {
                return Result<void>::failure("Write to " + tmp.string() + " failed");
            }
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            return Result<void>::failure("Cannot rename " + tmp.string() + ": " + ec.message());
        }
        return Result<void>();
    }

    Result<std::vector<uint8_t>> readFile(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::vector<uint8_t>>::failure("Cannot open " + path.string());
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return data;
    }
}

// --- Records ---

nlohmann::json AgentSummary::toJson() const {
    return {
        {"agentId", agentId},
        {"name", name},
        {"description", description},
        {"latestVersion", latestVersion},
        {"versionCount", versionCount},
        {"sourceFormat", sourceFormat},
        {"updated", toMillis(updated)},
        {"capabilities", capabilities}
    };
}

nlohmann::json TranslationActivity::toJson() const {
    return {
        {"id", id},
        {"timestamp", toMillis(timestamp)},
        {"agentId", agentId},
        {"sourceFormat", sourceFormat},
        {"targetFormat", targetFormat},
        {"fidelityScore", fidelityScore},
        {"lostFields", lostFields},
        {"duration_ms", duration.count()},
        {"success", success}
    };
}

TranslationActivity TranslationActivity::fromJson(const nlohmann::json& json) {
    TranslationActivity activity;
    activity.id = json.at("id").get<std::string>();
    activity.timestamp = fromMillis(json.at("timestamp").get<int64_t>());
    activity.agentId = json.value("agentId", "");
    activity.sourceFormat = json.at("sourceFormat").get<std::string>();
    activity.targetFormat = json.at("targetFormat").get<std::string>();
    activity.fidelityScore = json.value("fidelityScore", 0.0);
    activity.lostFields = json.value("lostFields", std::vector<std::string>{});
    activity.duration = std::chrono::milliseconds(json.value("duration_ms", int64_t{0}));
    activity.success = json.value("success", false);
    return activity;
}

std::string TranslationActivity::generateId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::stringstream ss;
    ss << "act_" << toMillis(std::chrono::system_clock::now()) << "_"
       << std::hex << (rng() & 0xffffffffULL);
    return ss.str();
}

nlohmann::json StoreStats::toJson() const {
    nlohmann::json json = {
        {"totalAgents", totalAgents},
        {"totalSnapshots", totalSnapshots},
        {"compactedSnapshots", compactedSnapshots},
        {"totalTriples", totalTriples},
        {"activityRecords", activityRecords},
        {"oldest", nullptr},
        {"newest", nullptr}
    };
    if (oldest) {
        json["oldest"] = toMillis(*oldest);
    }
    if (newest) {
        json["newest"] = toMillis(*newest);
    }
    return json;
}

// --- CanonicalStore ---

CanonicalStore::CanonicalStore(const StoreConfig& config)
    : config_(config), persistent_(!config.storage_path.empty()) {
    if (config_.retention.keep_versions == 0) {
        config_.retention.keep_versions = 1;
    }
    if (persistent_) {
        std::error_code ec;
        fs::create_directories(config_.storage_path, ec);
        if (ec) {
            throw StoreError(StoreErrorKind::PERSISTENCE,
                             "Cannot create storage directory " + config_.storage_path + ": " + ec.message());
        }
        loadFromDisk();
    }
}

CanonicalStore::~CanonicalStore() = default;

std::shared_ptr<CanonicalStore::AgentRecord> CanonicalStore::recordFor(const std::string& agentId, bool create) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agentId);
    if (it != agents_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto record = std::make_shared<AgentRecord>();
    agents_[agentId] = record;
    return record;
}

SnapshotRef CanonicalStore::createAgentSnapshot(const std::string& agentId,
                                                const CanonicalGraph& graph,
                                                const SnapshotMetadata& metadata,
                                                std::optional<uint64_t> expectedVersion) {
    if (agentId.empty()) {
        throw std::invalid_argument("Agent id must not be empty");
    }
    if (!graph.hasSingleAgent()) {
        throw StoreError(StoreErrorKind::INTEGRITY,
                         "Graph for " + agentId + " must contain exactly one Agent node");
    }

    std::shared_ptr<AgentRecord> record;
    std::unique_lock<std::mutex> writer;
    uint64_t current = 0;
    for (;;) {
        record = recordFor(agentId, true);
        writer = std::unique_lock<std::mutex>(record->writeMutex);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(agentId);
        if (it != agents_.end() && it->second == record) {
            current = record->snapshots.size();
            break;
        }
        // deleteAgent() dropped the record while we waited for its writer lock
    }
    if (expectedVersion && *expectedVersion != current) {
        throw StoreError(StoreErrorKind::VERSION_CONFLICT,
                         "Version conflict for " + agentId + ": expected " +
                         std::to_string(*expectedVersion) + ", latest is " + std::to_string(current));
    }

    StoredSnapshot snapshot;
    snapshot.version = current + 1;
    snapshot.graph = std::make_shared<const CanonicalGraph>(graph);
    snapshot.metadata = metadata;
    if (snapshot.metadata.timestamp == std::chrono::system_clock::time_point{}) {
        snapshot.metadata.timestamp = std::chrono::system_clock::now();
    }
    std::string body = graph.toJson().dump();
    snapshot.checksum = sha256(body);

    if (persistent_) {
        auto persisted = persistSnapshot(agentId, snapshot, body);
        if (!persisted) {
            XLOG_ERROR("[store] failed to persist " << agentId << " v" << snapshot.version
                       << ": " << persisted.error());
            throw StoreError(StoreErrorKind::PERSISTENCE, persisted.error());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->snapshots.push_back(std::move(snapshot));
    }

    XLOG_INFO("[store] committed " << agentId << " v" << current + 1);
    return SnapshotRef{agentId, current + 1};
}

std::optional<AgentSnapshot> CanonicalStore::getAgentSnapshot(const std::string& agentId,
                                                              std::optional<uint64_t> version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agentId);
    if (it == agents_.end() || it->second->snapshots.empty()) {
        return std::nullopt;
    }
    const auto& snapshots = it->second->snapshots;
    uint64_t wanted = version ? *version : snapshots.size();
    if (wanted == 0 || wanted > snapshots.size()) {
        return std::nullopt;
    }
    const StoredSnapshot& stored = snapshots[wanted - 1];
    if (!stored.graph) {
        return std::nullopt;
    }
    return AgentSnapshot{agentId, stored.version, *stored.graph, stored.metadata, stored.checksum};
}

std::optional<uint64_t> CanonicalStore::latestVersion(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agentId);
    if (it == agents_.end() || it->second->snapshots.empty()) {
        return std::nullopt;
    }
    return it->second->snapshots.size();
}

std::vector<HistoryEntry> CanonicalStore::getAgentHistory(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryEntry> history;
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return history;
    }
    for (const auto& snapshot : it->second->snapshots) {
        history.push_back({snapshot.version, snapshot.metadata.timestamp, snapshot.metadata.sourceFormat,
                           snapshot.metadata.fidelity, snapshot.graph == nullptr});
    }
    return history;
}

std::optional<AgentSummary> CanonicalStore::summarize(const std::string& agentId, const AgentRecord& record) const {
    // Assumes mutex_ is already held
    if (record.snapshots.empty()) {
        return std::nullopt;
    }
    const StoredSnapshot& latest = record.snapshots.back();
    AgentSummary summary;
    summary.agentId = agentId;
    summary.latestVersion = latest.version;
    summary.versionCount = record.snapshots.size();
    summary.sourceFormat = latest.metadata.sourceFormat;
    summary.updated = latest.metadata.timestamp;
    if (latest.graph) {
        const std::string node = agentIdentifier(agentId);
        if (auto name = latest.graph->firstObject(node, vocab::NAME)) {
            summary.name = name->value;
        }
        if (auto description = latest.graph->firstObject(node, vocab::DESCRIPTION)) {
            summary.description = description->value;
        }
        for (const auto& capability : latest.graph->objectsOf(node, vocab::CAPABILITY)) {
            summary.capabilities.push_back(capability.value);
        }
    }
    return summary;
}

bool CanonicalStore::matches(const DiscoveryCriteria& criteria, const std::string& agentId,
                             const AgentRecord& record) const {
    // Assumes mutex_ is already held
    if (record.snapshots.empty() || !record.snapshots.back().graph) {
        return false;
    }
    const StoredSnapshot& latest = record.snapshots.back();
    const CanonicalGraph& graph = *latest.graph;
    const std::string node = agentIdentifier(agentId);

    auto hasLiteral = [&graph](const std::string& subject, const char* predicate, const std::string& value) {
        for (const auto& object : graph.objectsOf(subject, predicate)) {
            if (object.isLiteral() && object.value == value) {
                return true;
            }
        }
        return false;
    };

    if (criteria.capability) {
        bool found = hasLiteral(node, vocab::CAPABILITY, *criteria.capability);
        for (const auto& tool : graph.objectsOf(node, vocab::HAS_TOOL)) {
            found = found || hasLiteral(tool.value, vocab::TOOL_NAME, *criteria.capability);
        }
        if (!found) {
            return false;
        }
    }
    if (criteria.protocol && latest.metadata.sourceFormat != *criteria.protocol &&
        !hasLiteral(node, vocab::PROTOCOL, *criteria.protocol)) {
        return false;
    }
    if (criteria.textQuery) {
        const std::string query = lowercase(*criteria.textQuery);
        bool found = lowercase(agentId).find(query) != std::string::npos;
        for (const char* predicate : {vocab::NAME, vocab::DESCRIPTION, vocab::ROLE, vocab::GOAL}) {
            for (const auto& object : graph.objectsOf(node, predicate)) {
                found = found || lowercase(object.value).find(query) != std::string::npos;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

std::optional<AgentSummary> CanonicalStore::getAgentSummary(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return summarize(agentId, *it->second);
}

std::vector<AgentSummary> CanonicalStore::discoverAgents(const DiscoveryCriteria& criteria) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentSummary> result;
    for (const auto& [agentId, record] : agents_) {
        if (matches(criteria, agentId, *record)) {
            if (auto summary = summarize(agentId, *record)) {
                result.push_back(std::move(*summary));
            }
        }
    }
    return result;
}

std::vector<AgentSummary> CanonicalStore::listAgents(size_t limit, size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentSummary> result;
    size_t index = 0;
    for (const auto& [agentId, record] : agents_) {
        auto summary = summarize(agentId, *record);
        if (!summary) {
            continue;
        }
        if (index++ < offset) {
            continue;
        }
        if (limit != 0 && result.size() >= limit) {
            break;
        }
        result.push_back(std::move(*summary));
    }
    return result;
}

bool CanonicalStore::deleteAgent(const std::string& agentId) {
    std::shared_ptr<AgentRecord> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(agentId);
        if (it == agents_.end()) {
            return false;
        }
        record = it->second;
    }

    std::lock_guard<std::mutex> writer(record->writeMutex);
    {
        // Another deleteAgent() got here first
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(agentId);
        if (it == agents_.end() || it->second != record) {
            return false;
        }
    }
    if (persistent_) {
        std::error_code ec;
        fs::remove_all(agentDirectory(agentId), ec);
        if (ec) {
            throw StoreError(StoreErrorKind::PERSISTENCE,
                             "Cannot delete storage of " + agentId + ": " + ec.message());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_.erase(agentId);
        record->snapshots.clear();
    }
    XLOG_INFO("[store] deleted " << agentId);
    return true;
}

void CanonicalStore::recordTranslation(TranslationActivity activity) {
    if (activity.id.empty()) {
        activity.id = TranslationActivity::generateId();
    }
    if (activity.timestamp == std::chrono::system_clock::time_point{}) {
        activity.timestamp = std::chrono::system_clock::now();
    }

    std::lock_guard<std::mutex> lock(activityMutex_);
    if (persistent_) {
        auto appended = appendActivity(activity);
        if (!appended) {
            // The in-memory log stays authoritative for this process.
            XLOG_ERROR("[store] failed to persist activity " << activity.id << ": " << appended.error());
        }
    }
    activity_.push_back(std::move(activity));
}

std::vector<TranslationActivity> CanonicalStore::getActivityLog(const std::optional<std::string>& agentId) const {
    std::lock_guard<std::mutex> lock(activityMutex_);
    if (!agentId) {
        return activity_;
    }
    std::vector<TranslationActivity> filtered;
    std::copy_if(activity_.begin(), activity_.end(), std::back_inserter(filtered),
                 [&agentId](const TranslationActivity& activity) { return activity.agentId == *agentId; });
    return filtered;
}

bool CanonicalStore::shouldRetain(const StoredSnapshot& snapshot, size_t rankFromNewest,
                                  std::chrono::system_clock::time_point now) const {
    // Keep the newest versions
    if (rankFromNewest < config_.retention.keep_versions) {
        return true;
    }
    // Keep if within retention period
    return now - snapshot.metadata.timestamp < config_.retention.max_age;
}

size_t CanonicalStore::compact() {
    std::vector<std::pair<std::string, std::shared_ptr<AgentRecord>>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.assign(agents_.begin(), agents_.end());
    }

    auto now = std::chrono::system_clock::now();
    size_t pruned = 0;
    for (auto& [agentId, record] : records) {
        std::lock_guard<std::mutex> writer(record->writeMutex);
        std::vector<uint64_t> victims;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto& snapshots = record->snapshots;
            for (size_t i = 0; i < snapshots.size(); ++i) {
                size_t rank = snapshots.size() - 1 - i;
                if (snapshots[i].graph && !shouldRetain(snapshots[i], rank, now)) {
                    victims.push_back(snapshots[i].version);
                }
            }
        }

        for (uint64_t version : victims) {
            if (persistent_) {
                StoredSnapshot meta;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    meta = record->snapshots[version - 1];
                }
                auto written = persistMetadata(agentId, meta, true);
                if (!written) {
                    throw StoreError(StoreErrorKind::PERSISTENCE, written.error());
                }
                std::error_code ec;
                fs::remove(fs::path(agentDirectory(agentId)) / (std::to_string(version) + ".body"), ec);
            }
            std::lock_guard<std::mutex> lock(mutex_);
            record->snapshots[version - 1].graph.reset();
            ++pruned;
        }
    }

    if (pruned > 0) {
        XLOG_INFO("[store] compaction pruned " << pruned << " snapshot bodies");
    }
    return pruned;
}

Result<void> CanonicalStore::verifySnapshot(const std::string& agentId, uint64_t version) const {
    StoredSnapshot stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(agentId);
        if (it == agents_.end() || version == 0 || version > it->second->snapshots.size()) {
            return Result<void>::failure("Unknown snapshot " + agentId + " v" + std::to_string(version));
        }
        stored = it->second->snapshots[version - 1];
    }
    if (!stored.graph) {
        return Result<void>::failure("Snapshot " + agentId + " v" + std::to_string(version) + " was compacted");
    }

    std::string body;
    if (persistent_) {
        auto read = readBody(agentId, version);
        if (!read) {
            return Result<void>::failure(read.error());
        }
        body = read.value();
    } else {
        body = stored.graph->toJson().dump();
    }
    if (sha256(body) != stored.checksum) {
        return Result<void>::failure("Checksum mismatch for " + agentId + " v" + std::to_string(version));
    }
    return Result<void>();
}

StoreStats CanonicalStore::getStats() const {
    StoreStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [agentId, record] : agents_) {
            if (record->snapshots.empty()) {
                continue;
            }
            stats.totalAgents++;
            for (const auto& snapshot : record->snapshots) {
                stats.totalSnapshots++;
                if (snapshot.graph) {
                    stats.totalTriples += snapshot.graph->size();
                } else {
                    stats.compactedSnapshots++;
                }
                const auto& ts = snapshot.metadata.timestamp;
                if (!stats.oldest || ts < *stats.oldest) {
                    stats.oldest = ts;
                }
                if (!stats.newest || ts > *stats.newest) {
                    stats.newest = ts;
                }
            }
        }
    }
    std::lock_guard<std::mutex> lock(activityMutex_);
    stats.activityRecords = activity_.size();
    return stats;
}

// --- Persistence ---

std::string CanonicalStore::agentDirectory(const std::string& agentId) const {
    return (fs::path(config_.storage_path) / encodePathComponent(agentId)).string();
}

Result<void> CanonicalStore::persistMetadata(const std::string& agentId, const StoredSnapshot& snapshot,
                                             bool compacted) const {
    nlohmann::json j = {
        {"agentId", agentId},
        {"version", snapshot.version},
        {"timestamp", toMillis(snapshot.metadata.timestamp)},
        {"sourceFormat", snapshot.metadata.sourceFormat},
        {"fidelity", snapshot.metadata.fidelity},
        {"checksum", snapshot.checksum},
        {"compressed", config_.enable_compression},
        {"compacted", compacted}
    };
    if (snapshot.graph && !compacted) {
        j["bodySize"] = snapshot.graph->toJson().dump().size();
    }
    const std::string text = j.dump(4);
    fs::path path = fs::path(agentDirectory(agentId)) / (std::to_string(snapshot.version) + ".json");
    return writeFileAtomically(path, text.data(), text.size());
}

Result<void> CanonicalStore::persistSnapshot(const std::string& agentId, const StoredSnapshot& snapshot,
                                             const std::string& body) const {
    std::error_code ec;
    fs::create_directories(agentDirectory(agentId), ec);
    if (ec) {
        return Result<void>::failure("Cannot create " + agentDirectory(agentId) + ": " + ec.message());
    }

    // Body first: metadata on disk always points at a complete body.
    fs::path bodyPath = fs::path(agentDirectory(agentId)) / (std::to_string(snapshot.version) + ".body");
    Result<void> written = Result<void>();
    if (config_.enable_compression) {
        auto compressed = compressData(body);
        written = writeFileAtomically(bodyPath, compressed.data(), compressed.size());
    } else {
        written = writeFileAtomically(bodyPath, body.data(), body.size());
    }
    if (!written) {
        return written;
    }
    return persistMetadata(agentId, snapshot, false);
}

Result<std::string> CanonicalStore::readBody(const std::string& agentId, uint64_t version) const {
    fs::path dir(agentDirectory(agentId));
    auto metaBytes = readFile(dir / (std::to_string(version) + ".json"));
    if (!metaBytes) {
        return Result<std::string>::failure(metaBytes.error());
    }
    auto bodyBytes = readFile(dir / (std::to_string(version) + ".body"));
    if (!bodyBytes) {
        return Result<std::string>::failure(bodyBytes.error());
    }

    try {
        auto meta = nlohmann::json::parse(metaBytes.value().begin(), metaBytes.value().end());
        if (meta.value("compressed", false)) {
            return decompressData(bodyBytes.value(), meta.at("bodySize").get<size_t>());
        }
        return std::string(bodyBytes.value().begin(), bodyBytes.value().end());
    } catch (const nlohmann::json::exception& e) {
        return Result<std::string>::failure("Malformed metadata for " + agentId + " v" +
                                            std::to_string(version) + ": " + e.what());
    } catch (const StoreError& e) {
        return Result<std::string>::failure(e.what());
    }
}

Result<void> CanonicalStore::appendActivity(const TranslationActivity& activity) const {
    // Assumes activityMutex_ is already held
    fs::path path = fs::path(config_.storage_path) / ACTIVITY_FILE;
    std::ofstream file(path, std::ios::app);
    if (!file) {
        return Result<void>::failure("Cannot open " + path.string());
    }
    file << activity.toJson().dump() << '\n';
    if (!file) {
        return Result<void>::failure("Write to " + path.string() + " failed");
    }
    return Result<void>();
}

void CanonicalStore::loadFromDisk() {
    size_t loaded = 0;
    for (const auto& dirEntry : fs::directory_iterator(config_.storage_path)) {
        if (!dirEntry.is_directory()) {
            continue;
        }
        std::map<uint64_t, std::pair<std::string, StoredSnapshot>> versions;
        for (const auto& file : fs::directory_iterator(dirEntry.path())) {
            if (file.path().extension() != ".json") {
                continue;
            }
            auto bytes = readFile(file.path());
            if (!bytes) {
                XLOG_ERROR("[store] " << bytes.error());
                continue;
            }
            try {
                auto meta = nlohmann::json::parse(bytes.value().begin(), bytes.value().end());
                StoredSnapshot snapshot;
                std::string agentId = meta.at("agentId").get<std::string>();
                snapshot.version = meta.at("version").get<uint64_t>();
                snapshot.metadata.timestamp = fromMillis(meta.at("timestamp").get<int64_t>());
                snapshot.metadata.sourceFormat = meta.value("sourceFormat", "");
                snapshot.metadata.fidelity = meta.value("fidelity", 1.0);
                snapshot.checksum = meta.at("checksum").get<std::string>();
                if (!meta.value("compacted", false)) {
                    auto body = readBody(agentId, snapshot.version);
                    if (!body) {
                        XLOG_ERROR("[store] " << body.error());
                        continue;
                    }
                    if (sha256(body.value()) != snapshot.checksum) {
                        XLOG_ERROR("[store] checksum mismatch for " << agentId << " v" << snapshot.version
                                   << ", snapshot skipped");
                        continue;
                    }
                    snapshot.graph = std::make_shared<const CanonicalGraph>(
                        CanonicalGraph::fromJson(nlohmann::json::parse(body.value())));
                }
                versions[snapshot.version] = {agentId, std::move(snapshot)};
            } catch (const nlohmann::json::exception& e) {
                XLOG_ERROR("[store] cannot load " << file.path().string() << ": " << e.what());
            } catch (const TransformError& e) {
                XLOG_ERROR("[store] cannot load " << file.path().string() << ": " << e.what());
            }
        }

        // Versions must run 1..N; a gap means a damaged directory.
        if (versions.empty()) {
            continue;
        }
        auto record = std::make_shared<AgentRecord>();
        std::string agentId = versions.begin()->second.first;
        uint64_t expected = 1;
        for (auto& [version, entry] : versions) {
            if (version != expected) {
                XLOG_ERROR("[store] version gap for " << agentId << " at v" << expected
                           << ", later versions ignored");
                break;
            }
            record->snapshots.push_back(std::move(entry.second));
            ++expected;
        }
        loaded += record->snapshots.size();
        agents_[agentId] = record;
    }

    fs::path activityPath = fs::path(config_.storage_path) / ACTIVITY_FILE;
    std::ifstream activityFile(activityPath);
    std::string line;
    while (activityFile && std::getline(activityFile, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            activity_.push_back(TranslationActivity::fromJson(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            XLOG_WARN("[store] skipping malformed activity record: " << e.what());
        }
    }

    XLOG_INFO("[store] loaded " << loaded << " snapshots of " << agents_.size() << " agents and "
              << activity_.size() << " activity records from " << config_.storage_path);
}

} // namespace core
} // namespace agentbridge
