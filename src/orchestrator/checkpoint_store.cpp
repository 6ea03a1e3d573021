// EN: Checkpoint Store implementation. Envelopes are JSON documents whose payload is the
//     (optionally deflated) checkpoint JSON, base64-encoded, with a CRC-32 over the stored bytes.
// FR: Implémentation du magasin de checkpoints. Les enveloppes sont des documents JSON dont le
//     contenu est le JSON du checkpoint (éventuellement compressé) en base64, avec un CRC-32
//     calculé sur les octets stockés.

#include "orchestrator/checkpoint_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>

namespace CKW::Orchestrator {

using nlohmann::json;
using Workflow::SessionDelta;
using Workflow::SessionSnapshot;
using Workflow::WorkflowSession;

namespace {

constexpr const char* kSequenceKey = "sequence";
constexpr const char* kChecksumAlgorithm = "crc32";
constexpr std::size_t kMaxParentChain = 4096;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<TimePoint> readTimestamp(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return TimeUtils::fromRfc3339(it->get<std::string>());
    }
    if (it->is_number_integer()) {
        return TimeUtils::fromUnixMicros(it->get<std::int64_t>());
    }
    return std::nullopt;
}

std::string readString(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::string metadataValue(const std::map<std::string, std::string>& metadata, const char* key) {
    auto it = metadata.find(key);
    return it == metadata.end() ? std::string() : it->second;
}

// EN: "{session}_{checkpoint}" split at the last underscore; generated checkpoint ids contain none.
// FR: "{session}_{checkpoint}" coupé au dernier tiret bas ; les ids générés n'en contiennent pas.
std::pair<std::string, std::string> splitRecordKey(const std::string& key) {
    const auto pos = key.rfind('_');
    if (pos == std::string::npos) {
        return {std::string(), key};
    }
    return {key.substr(0, pos), key.substr(pos + 1)};
}

// EN: Metadata readable without decompressing the payload.
// FR: Métadonnées lisibles sans décompresser le contenu.
struct RecordSummary {
    std::string session_id;
    std::string checkpoint_id;
    std::string stage_name;
    TimePoint timestamp{};
    std::string parent_checkpoint_id;
    bool incremental = false;
    bool compressed = false;
};

std::optional<RecordSummary> summarizeRecord(const std::string& key, const std::string& raw) {
    RecordSummary summary;
    const auto [key_session, key_checkpoint] = splitRecordKey(key);

    std::optional<CheckpointEnvelope> envelope;
    try {
        envelope = CheckpointEnvelope::parse(raw);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }

    if (envelope) {
        summary.session_id = metadataValue(envelope->metadata, EnvelopeKeys::SESSION_ID);
        summary.checkpoint_id = metadataValue(envelope->metadata, EnvelopeKeys::CHECKPOINT_ID);
        summary.stage_name = metadataValue(envelope->metadata, EnvelopeKeys::STAGE_NAME);
        summary.timestamp = envelope->created_at;
        summary.incremental = metadataValue(envelope->metadata, EnvelopeKeys::INCREMENTAL) == "true";
        summary.parent_checkpoint_id = metadataValue(envelope->metadata, EnvelopeKeys::PARENT_CHECKPOINT);
        summary.compressed = envelope->compressed;
    } else {
        json doc = json::parse(raw, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return std::nullopt;
        }
        summary.session_id = readString(doc, "session_id");
        if (summary.session_id.empty() && doc.contains("session_state") && doc["session_state"].is_object()) {
            summary.session_id = readString(doc["session_state"], "id");
        }
        summary.checkpoint_id = readString(doc, "id");
        summary.stage_name = readString(doc, "stage_name");
        summary.timestamp = readTimestamp(doc, "timestamp").value_or(TimePoint{});
    }

    if (summary.session_id.empty()) {
        summary.session_id = key_session;
    }
    if (summary.checkpoint_id.empty()) {
        summary.checkpoint_id = key_checkpoint;
    }
    return summary;
}

void sortNewestFirst(std::vector<WorkflowCheckpoint>& checkpoints) {
    std::sort(checkpoints.begin(), checkpoints.end(),
              [](const WorkflowCheckpoint& a, const WorkflowCheckpoint& b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp > b.timestamp;
                  }
                  return a.sequence > b.sequence;
              });
}

std::uint64_t nextSequence(Storage::WriteTransaction& txn) {
    std::uint64_t current = 0;
    if (auto stored = txn.get(CheckpointStore::kMetaBucket, kSequenceKey)) {
        try {
            current = std::stoull(*stored);
        } catch (const std::exception&) {
            LOG_WARN("checkpoint_store", "Ignoring unreadable checkpoint sequence counter");
        }
    }
    ++current;
    txn.put(CheckpointStore::kMetaBucket, kSequenceKey, std::to_string(current));
    return current;
}

// EN: Translate storage and serialization failures into CheckpointError with context.
// FR: Traduit les échecs de stockage et de sérialisation en CheckpointError contextualisée.
template <typename Fn>
auto withCheckpointContext(const std::string& operation, const std::string& session_id,
                           const std::string& checkpoint_id, const std::string& stage_name, Fn&& fn)
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const CheckpointError&) {
        throw;
    } catch (const Storage::StorageError& e) {
        throw CheckpointError(operation + " failed: " + std::string(e.what()),
                              session_id, checkpoint_id, stage_name);
    } catch (const json::exception& e) {
        throw CheckpointError(operation + " failed during serialization: " + std::string(e.what()),
                              session_id, checkpoint_id, stage_name);
    }
}

} // namespace

// ---------------------------------------------------------------------------------------------
// EN: Enum helpers
// FR: Utilitaires d'énumération
// ---------------------------------------------------------------------------------------------

std::string compressionModeToString(CompressionMode mode) {
    return mode == CompressionMode::ZLIB ? "zlib" : "none";
}

std::optional<CompressionMode> parseCompressionMode(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "zlib" || lower == "deflate" || lower == "1") return CompressionMode::ZLIB;
    if (lower == "none" || lower == "off" || lower == "0") return CompressionMode::NONE;
    return std::nullopt;
}

std::string integrityPolicyToString(IntegrityPolicy policy) {
    return policy == IntegrityPolicy::STRICT ? "strict" : "best_effort";
}

std::optional<IntegrityPolicy> parseIntegrityPolicy(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "strict") return IntegrityPolicy::STRICT;
    if (lower == "best_effort" || lower == "best-effort" || lower == "soft") return IntegrityPolicy::BEST_EFFORT;
    return std::nullopt;
}

// ---------------------------------------------------------------------------------------------
// EN: Checkpoint JSON
// FR: JSON des checkpoints
// ---------------------------------------------------------------------------------------------

void to_json(json& j, const WorkflowCheckpoint& checkpoint) {
    j = json{
        {"id", checkpoint.id},
        {"session_id", checkpoint.session_id},
        {"stage_name", checkpoint.stage_name},
        {"timestamp", TimeUtils::toRfc3339(checkpoint.timestamp)},
        {"sequence", checkpoint.sequence},
        {"session_state", Workflow::SessionStateCodec::toJson(checkpoint.session_state)},
        {"stage_results", checkpoint.stage_results},
        {"message", checkpoint.message}
    };
    if (checkpoint.workflow_spec) {
        j["workflow_spec"] = *checkpoint.workflow_spec;
    }
    if (checkpoint.parent_checkpoint_id) {
        j["parent_checkpoint_id"] = *checkpoint.parent_checkpoint_id;
    }
}

void from_json(const json& j, WorkflowCheckpoint& checkpoint) {
    checkpoint.id = readString(j, "id");
    checkpoint.session_id = readString(j, "session_id");
    checkpoint.stage_name = readString(j, "stage_name");
    checkpoint.timestamp = readTimestamp(j, "timestamp").value_or(TimePoint{});
    checkpoint.sequence = (j.contains("sequence") && j["sequence"].is_number_unsigned())
        ? j["sequence"].get<std::uint64_t>() : 0;
    checkpoint.message = readString(j, "message");

    if (j.contains("workflow_spec") && j["workflow_spec"].is_object()) {
        checkpoint.workflow_spec = j["workflow_spec"].get<Workflow::WorkflowSpecRef>();
    }
    checkpoint.session_state = j.contains("session_state")
        ? Workflow::SessionStateCodec::fromJson(j["session_state"])
        : Workflow::SessionState{SessionSnapshot{}};

    checkpoint.stage_results.clear();
    if (j.contains("stage_results") && j["stage_results"].is_object()) {
        for (auto it = j["stage_results"].begin(); it != j["stage_results"].end(); ++it) {
            checkpoint.stage_results[it.key()] = it.value();
        }
    }
    if (j.contains("parent_checkpoint_id") && j["parent_checkpoint_id"].is_string()) {
        checkpoint.parent_checkpoint_id = j["parent_checkpoint_id"].get<std::string>();
    }
    if (checkpoint.session_id.empty()) {
        if (const auto* snapshot = std::get_if<SessionSnapshot>(&checkpoint.session_state)) {
            checkpoint.session_id = snapshot->session_id;
        }
    }
}

// ---------------------------------------------------------------------------------------------
// EN: Envelope
// FR: Enveloppe
// ---------------------------------------------------------------------------------------------

std::string CheckpointEnvelope::serialize() const {
    json j{
        {"version", version},
        {"compressed", compressed},
        {"checksum", checksum},
        {"data_size", data_size},
        {"created_at", TimeUtils::toRfc3339(created_at)},
        {"metadata", metadata},
        {"data", CheckpointUtils::encodeBase64(data)}
    };
    return j.dump();
}

std::optional<CheckpointEnvelope> CheckpointEnvelope::parse(const std::string& raw) {
    json j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    auto version_it = j.find("version");
    if (version_it == j.end() || !version_it->is_number_integer() || version_it->get<int>() < 1) {
        return std::nullopt;
    }

    CheckpointEnvelope envelope;
    envelope.version = version_it->get<int>();
    envelope.compressed = j.value("compressed", false);
    envelope.checksum = readString(j, "checksum");
    if (j.contains("data_size") && j["data_size"].is_number_unsigned()) {
        envelope.data_size = j["data_size"].get<std::size_t>();
    }
    envelope.created_at = readTimestamp(j, "created_at").value_or(TimePoint{});

    if (j.contains("metadata") && j["metadata"].is_object()) {
        for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
            if (it.value().is_string()) {
                envelope.metadata[it.key()] = it.value().get<std::string>();
            }
        }
    }

    auto data_it = j.find("data");
    if (data_it == j.end() || !data_it->is_string()) {
        throw std::invalid_argument("checkpoint envelope has no data field");
    }
    envelope.data = CheckpointUtils::decodeBase64(data_it->get<std::string>());
    return envelope;
}

// ---------------------------------------------------------------------------------------------
// EN: CheckpointStore
// FR: CheckpointStore
// ---------------------------------------------------------------------------------------------

CheckpointStore::CheckpointStore(std::shared_ptr<Storage::KeyValueStore> store,
                                 const CheckpointStoreConfig& config, Clock clock)
    : store_(std::move(store)), config_(config), clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("CheckpointStore requires a key-value store");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

CheckpointStoreConfig CheckpointStore::getConfig() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void CheckpointStore::setIntegrityPolicy(IntegrityPolicy policy) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.integrity_policy = policy;
}

TimePoint CheckpointStore::now() const {
    return TimeUtils::truncateToMicros(clock_());
}

WorkflowCheckpoint CheckpointStore::buildCheckpoint(const WorkflowSession& session,
                                                    const std::string& stage_name,
                                                    const std::string& message,
                                                    const std::optional<Workflow::WorkflowSpecRef>& spec) const {
    WorkflowCheckpoint checkpoint;
    checkpoint.id = CheckpointUtils::generateCheckpointId();
    checkpoint.session_id = session.id;
    checkpoint.stage_name = stage_name;
    checkpoint.timestamp = now();
    checkpoint.workflow_spec = spec ? spec : session.workflow_spec;
    checkpoint.message = message;
    return checkpoint;
}

WorkflowCheckpoint CheckpointStore::createCheckpoint(const WorkflowSession& session,
                                                     const std::string& stage_name,
                                                     const std::string& message,
                                                     const std::optional<Workflow::WorkflowSpecRef>& spec) {
    if (session.id.empty()) {
        throw CheckpointError("Cannot checkpoint a session without an id", "", "", stage_name);
    }

    WorkflowCheckpoint checkpoint = buildCheckpoint(session, stage_name, message, spec);
    checkpoint.session_state = SessionSnapshot::fromSession(session);
    checkpoint.stage_results = session.stage_results;

    withCheckpointContext("Create checkpoint", session.id, checkpoint.id, stage_name, [&] {
        store_->update([&](Storage::WriteTransaction& txn) {
            persist(txn, checkpoint, session.workflow_name);
        });
    });

    LOG_INFO_META("checkpoint_store", "Created checkpoint", (std::unordered_map<std::string, std::string>{
        {"session_id", session.id}, {"checkpoint_id", checkpoint.id}, {"stage", stage_name}}));
    return checkpoint;
}

// EN: Lookup of the parent, delta computation and write happen in one transaction.
// FR: Recherche du parent, calcul du delta et écriture se font dans une seule transaction.
WorkflowCheckpoint CheckpointStore::createIncrementalCheckpoint(const WorkflowSession& session,
                                                                const std::string& stage_name,
                                                                const std::string& message,
                                                                const std::optional<Workflow::WorkflowSpecRef>& spec) {
    if (session.id.empty()) {
        throw CheckpointError("Cannot checkpoint a session without an id", "", "", stage_name);
    }

    WorkflowCheckpoint checkpoint = buildCheckpoint(session, stage_name, message, spec);
    bool incremental = false;

    withCheckpointContext("Create incremental checkpoint", session.id, checkpoint.id, stage_name, [&] {
        store_->update([&](Storage::WriteTransaction& txn) {
            auto existing = collectSessionCheckpoints(txn, session.id);
            if (existing.empty()) {
                checkpoint.session_state = SessionSnapshot::fromSession(session);
                checkpoint.stage_results = session.stage_results;
            } else {
                sortNewestFirst(existing);
                const WorkflowCheckpoint& latest = existing.front();
                MaterializedState previous = materialize(txn, latest);

                SessionDelta delta = Workflow::SessionStateCodec::computeDelta(session, previous.snapshot);
                checkpoint.stage_results.clear();
                for (const auto& [stage, result] : session.stage_results) {
                    auto it = previous.stage_results.find(stage);
                    if (it == previous.stage_results.end() || it->second != result) {
                        checkpoint.stage_results[stage] = result;
                    }
                }
                for (const auto& [stage, result] : previous.stage_results) {
                    if (session.stage_results.count(stage) == 0) {
                        delta.removed_stage_results.push_back(stage);
                    }
                }
                checkpoint.session_state = std::move(delta);
                checkpoint.parent_checkpoint_id = latest.id;
                incremental = true;
            }
            persist(txn, checkpoint, session.workflow_name);
        });
    });

    if (incremental) {
        LOG_INFO_META("checkpoint_store", "Created incremental checkpoint", (std::unordered_map<std::string, std::string>{
            {"session_id", session.id}, {"checkpoint_id", checkpoint.id},
            {"parent_checkpoint", *checkpoint.parent_checkpoint_id},
            {"changed_results", std::to_string(checkpoint.stage_results.size())}}));
    } else {
        LOG_INFO("checkpoint_store", "No previous checkpoint for session " + session.id + ", created full checkpoint");
    }
    return checkpoint;
}

void CheckpointStore::persist(Storage::WriteTransaction& txn, WorkflowCheckpoint& checkpoint,
                              const std::string& workflow_name) const {
    checkpoint.sequence = nextSequence(txn);
    const std::string key = CheckpointUtils::makeRecordKey(checkpoint.session_id, checkpoint.id);
    txn.put(kCheckpointBucket, key, encodeEnvelope(checkpoint, workflow_name));
    txn.put(kIndexBucket, checkpoint.id, key);
}

std::string CheckpointStore::encodeEnvelope(const WorkflowCheckpoint& checkpoint,
                                            const std::string& workflow_name) const {
    const CheckpointStoreConfig config = getConfig();
    const std::string payload = json(checkpoint).dump();

    CheckpointEnvelope envelope;
    envelope.data_size = payload.size();
    envelope.created_at = checkpoint.timestamp;
    envelope.data = payload;

    if (config.compression == CompressionMode::ZLIB) {
        std::string deflated = CheckpointUtils::compress(payload, config.compression_level);
        // EN: Keep the compressed form only when it is strictly smaller.
        // FR: Conserve la forme compressée seulement si elle est strictement plus petite.
        if (deflated.size() < payload.size()) {
            envelope.data = std::move(deflated);
            envelope.compressed = true;
        }
    }
    if (config.enable_integrity_checks) {
        envelope.checksum = CheckpointUtils::checksum(envelope.data);
        envelope.metadata[EnvelopeKeys::CHECKSUM_ALGORITHM] = kChecksumAlgorithm;
    }

    envelope.metadata[EnvelopeKeys::SESSION_ID] = checkpoint.session_id;
    envelope.metadata[EnvelopeKeys::CHECKPOINT_ID] = checkpoint.id;
    envelope.metadata[EnvelopeKeys::STAGE_NAME] = checkpoint.stage_name;
    envelope.metadata[EnvelopeKeys::WORKFLOW_NAME] = workflow_name;
    envelope.metadata[EnvelopeKeys::COMPRESSION_MODE] =
        compressionModeToString(envelope.compressed ? CompressionMode::ZLIB : CompressionMode::NONE);
    envelope.metadata[EnvelopeKeys::SEQUENCE] = std::to_string(checkpoint.sequence);
    if (checkpoint.parent_checkpoint_id) {
        envelope.metadata[EnvelopeKeys::INCREMENTAL] = "true";
        envelope.metadata[EnvelopeKeys::PARENT_CHECKPOINT] = *checkpoint.parent_checkpoint_id;
    }
    return envelope.serialize();
}

WorkflowCheckpoint CheckpointStore::decodeRecord(const std::string& key, const std::string& raw) const {
    const auto key_parts = splitRecordKey(key);
    const std::string& key_session = key_parts.first;
    const std::string& key_checkpoint = key_parts.second;
    const CheckpointStoreConfig config = getConfig();

    std::optional<CheckpointEnvelope> envelope;
    try {
        envelope = CheckpointEnvelope::parse(raw);
    } catch (const std::invalid_argument& e) {
        throw CheckpointError("Corrupted checkpoint envelope: " + std::string(e.what()), key_session, key_checkpoint);
    }

    std::string payload;
    if (envelope) {
        const std::string stage = metadataValue(envelope->metadata, EnvelopeKeys::STAGE_NAME);
        auto integrityFailure = [&](const std::string& detail) {
            if (config.integrity_policy == IntegrityPolicy::STRICT) {
                throw CheckpointIntegrityError("Checkpoint integrity check failed: " + detail,
                                               key_session, key_checkpoint, stage);
            }
            LOG_WARN_META("checkpoint_store", "Checkpoint integrity check failed, continuing (best effort)",
                          (std::unordered_map<std::string, std::string>{
                              {"session_id", key_session}, {"checkpoint_id", key_checkpoint},
                              {"stage", stage}, {"detail", detail}}));
        };

        if (config.enable_integrity_checks && !envelope->checksum.empty()) {
            std::string algorithm = metadataValue(envelope->metadata, EnvelopeKeys::CHECKSUM_ALGORITHM);
            if (algorithm.empty() && envelope->checksum.size() == 8) {
                algorithm = kChecksumAlgorithm;
            }
            if (algorithm == kChecksumAlgorithm) {
                const std::string actual = CheckpointUtils::checksum(envelope->data);
                if (actual != envelope->checksum) {
                    integrityFailure("checksum mismatch (expected " + envelope->checksum + ", got " + actual + ")");
                }
            } else {
                LOG_DEBUG("checkpoint_store", "Skipping verification of unsupported checksum for " + key);
            }
        }

        if (envelope->compressed) {
            try {
                payload = CheckpointUtils::decompress(envelope->data);
            } catch (const std::runtime_error& e) {
                throw CheckpointError("Failed to decompress checkpoint: " + std::string(e.what()),
                                      key_session, key_checkpoint, stage);
            }
        } else {
            payload = envelope->data;
        }
        if (payload.size() != envelope->data_size) {
            integrityFailure("payload size " + std::to_string(payload.size()) +
                             " differs from recorded " + std::to_string(envelope->data_size));
        }
    } else {
        // EN: Pre-envelope records hold the checkpoint JSON directly.
        // FR: Les enregistrements antérieurs aux enveloppes contiennent directement le JSON.
        payload = raw;
    }

    json document = json::parse(payload, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw CheckpointError("Checkpoint payload is not a JSON object", key_session, key_checkpoint);
    }

    WorkflowCheckpoint checkpoint = document.get<WorkflowCheckpoint>();
    if (envelope) {
        const std::string meta_session = metadataValue(envelope->metadata, EnvelopeKeys::SESSION_ID);
        if (!meta_session.empty()) {
            checkpoint.session_id = meta_session;
        }
        const std::string parent = metadataValue(envelope->metadata, EnvelopeKeys::PARENT_CHECKPOINT);
        if (!parent.empty() && !checkpoint.parent_checkpoint_id) {
            checkpoint.parent_checkpoint_id = parent;
        }
        if (checkpoint.timestamp == TimePoint{}) {
            checkpoint.timestamp = envelope->created_at;
        }
    }
    if (checkpoint.session_id.empty()) {
        checkpoint.session_id = key_session;
    }
    if (checkpoint.id.empty()) {
        checkpoint.id = key_checkpoint;
    }
    return checkpoint;
}

// EN: Records written before the index existed are found by scanning for the key suffix.
// FR: Les enregistrements antérieurs à l'index sont retrouvés par suffixe de clé.
std::optional<std::string> CheckpointStore::findKeyById(const Storage::ReadTransaction& txn,
                                                        const std::string& checkpoint_id) const {
    if (checkpoint_id.empty()) {
        return std::nullopt;
    }
    if (auto key = txn.get(kIndexBucket, checkpoint_id)) {
        return key;
    }
    std::optional<std::string> found;
    const std::string suffix = "_" + checkpoint_id;
    txn.scanPrefix(kCheckpointBucket, "", [&](const std::string& key, const std::string&) {
        if (key.size() > suffix.size() &&
            key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
            found = key;
            return false;
        }
        return true;
    });
    return found;
}

// EN: The prefix scan may also see sessions whose id extends this one ("abc" vs "abc_def");
//     the session recorded in each checkpoint decides membership.
// FR: Le parcours par préfixe peut voir des sessions dont l'id prolonge celui-ci ("abc" vs
//     "abc_def") ; la session enregistrée dans chaque checkpoint décide de l'appartenance.
std::vector<WorkflowCheckpoint> CheckpointStore::collectSessionCheckpoints(const Storage::ReadTransaction& txn,
                                                                           const std::string& session_id) const {
    std::vector<std::pair<std::string, std::string>> records;
    txn.scanPrefix(kCheckpointBucket, session_id + "_", [&](const std::string& key, const std::string& value) {
        records.emplace_back(key, value);
        return true;
    });

    std::vector<WorkflowCheckpoint> checkpoints;
    checkpoints.reserve(records.size());
    for (const auto& [key, raw] : records) {
        try {
            WorkflowCheckpoint checkpoint = decodeRecord(key, raw);
            if (checkpoint.session_id == session_id) {
                checkpoints.push_back(std::move(checkpoint));
            }
        } catch (const CheckpointIntegrityError&) {
            throw;
        } catch (const CheckpointError& e) {
            LOG_WARN_META("checkpoint_store", "Skipping unreadable checkpoint", (std::unordered_map<std::string, std::string>{
                {"session_id", session_id}, {"key", key}, {"error", e.what()}}));
        }
    }
    return checkpoints;
}

CheckpointStore::MaterializedState CheckpointStore::materialize(const Storage::ReadTransaction& txn,
                                                                const WorkflowCheckpoint& checkpoint) const {
    // EN: Walk back to the nearest full snapshot, then replay deltas oldest first.
    // FR: Remonte jusqu'au snapshot complet le plus proche, puis rejoue les deltas du plus ancien au plus récent.
    std::vector<WorkflowCheckpoint> chain{checkpoint};
    std::set<std::string> visited{checkpoint.id};
    const bool strict = getConfig().integrity_policy == IntegrityPolicy::STRICT;

    // EN: STRICT refuses a chain that does not end on a full snapshot; BEST_EFFORT replays what it has.
    // FR: STRICT refuse une chaîne qui ne se termine pas sur un snapshot complet ; BEST_EFFORT rejoue ce qu'il a.
    auto brokenChain = [&](const WorkflowCheckpoint& current, const std::string& reason, const std::string& parent_id) {
        if (strict) {
            throw CheckpointIntegrityError(reason + " (parent " + parent_id + ")", current.session_id, current.id,
                                           current.stage_name);
        }
        LOG_WARN_META("checkpoint_store", reason + ", restoring from delta only",
                      (std::unordered_map<std::string, std::string>{
                          {"session_id", current.session_id}, {"checkpoint_id", current.id},
                          {"parent_checkpoint", parent_id}}));
    };

    while (chain.back().isIncremental()) {
        const WorkflowCheckpoint& current = chain.back();
        if (!current.parent_checkpoint_id) {
            brokenChain(current, "Incremental checkpoint has no parent", "none");
            break;
        }
        const std::string parent_id = *current.parent_checkpoint_id;
        if (chain.size() >= kMaxParentChain) {
            brokenChain(current, "Checkpoint parent chain exceeds " + std::to_string(kMaxParentChain) + " links",
                        parent_id);
            break;
        }
        if (!visited.insert(parent_id).second) {
            throw CheckpointError("Checkpoint parent chain contains a loop at " + parent_id,
                                  current.session_id, current.id, current.stage_name);
        }
        auto parent_key = findKeyById(txn, parent_id);
        std::optional<std::string> raw = parent_key ? txn.get(kCheckpointBucket, *parent_key) : std::nullopt;
        if (!raw) {
            brokenChain(current, "Parent checkpoint missing", parent_id);
            break;
        }
        chain.push_back(decodeRecord(*parent_key, *raw));
    }

    MaterializedState state;
    state.snapshot.session_id = checkpoint.session_id;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (const auto* snapshot = std::get_if<SessionSnapshot>(&it->session_state)) {
            state.snapshot = *snapshot;
            state.stage_results = it->stage_results;
        } else {
            const auto& delta = std::get<SessionDelta>(it->session_state);
            Workflow::SessionStateCodec::applyDelta(state.snapshot, delta);
            for (const auto& stage : delta.removed_stage_results) {
                state.stage_results.erase(stage);
            }
            for (const auto& [stage, result] : it->stage_results) {
                state.stage_results[stage] = result;
            }
        }
    }
    if (state.snapshot.session_id.empty()) {
        state.snapshot.session_id = checkpoint.session_id;
    }
    return state;
}

WorkflowSession CheckpointStore::restoreFromCheckpoint(const std::string& session_id,
                                                       const std::string& checkpoint_id) {
    WorkflowCheckpoint checkpoint;
    MaterializedState state;

    withCheckpointContext("Restore checkpoint", session_id, checkpoint_id, "", [&] {
        store_->view([&](const Storage::ReadTransaction& txn) {
            const std::string key = CheckpointUtils::makeRecordKey(session_id, checkpoint_id);
            auto raw = txn.get(kCheckpointBucket, key);
            if (!raw) {
                throw CheckpointNotFoundError("Checkpoint not found", session_id, checkpoint_id);
            }
            checkpoint = decodeRecord(key, *raw);
            state = materialize(txn, checkpoint);
        });
    });

    WorkflowSession session;
    state.snapshot.applyTo(session);
    if (session.id.empty()) {
        session.id = session_id;
    }
    session.stage_results = std::move(state.stage_results);
    session.workflow_spec = checkpoint.workflow_spec;
    session.checkpoints = {Workflow::CheckpointRef{checkpoint.id, checkpoint.stage_name,
                                                   checkpoint.timestamp, checkpoint.isIncremental()}};

    LOG_INFO_META("checkpoint_store", "Restored session from checkpoint", (std::unordered_map<std::string, std::string>{
        {"session_id", session_id}, {"checkpoint_id", checkpoint_id}, {"stage", checkpoint.stage_name}}));
    return session;
}

std::vector<WorkflowCheckpoint> CheckpointStore::listCheckpoints(const std::string& session_id) {
    std::vector<WorkflowCheckpoint> checkpoints;
    withCheckpointContext("List checkpoints", session_id, "", "", [&] {
        store_->view([&](const Storage::ReadTransaction& txn) {
            checkpoints = collectSessionCheckpoints(txn, session_id);
        });
    });
    sortNewestFirst(checkpoints);
    return checkpoints;
}

void CheckpointStore::deleteCheckpoint(const std::string& checkpoint_id) {
    withCheckpointContext("Delete checkpoint", "", checkpoint_id, "", [&] {
        store_->update([&](Storage::WriteTransaction& txn) {
            auto key = findKeyById(txn, checkpoint_id);
            if (!key || !txn.remove(kCheckpointBucket, *key)) {
                throw CheckpointNotFoundError("Checkpoint not found", "", checkpoint_id);
            }
            txn.remove(kIndexBucket, checkpoint_id);
        });
    });
    LOG_INFO("checkpoint_store", "Deleted checkpoint " + checkpoint_id);
}

std::size_t CheckpointStore::deleteSessionCheckpoints(const std::string& session_id) {
    std::size_t deleted = 0;
    withCheckpointContext("Delete session checkpoints", session_id, "", "", [&] {
        store_->update([&](Storage::WriteTransaction& txn) {
            std::vector<RecordSummary> targets;
            std::vector<std::string> keys;
            txn.scanPrefix(kCheckpointBucket, session_id + "_", [&](const std::string& key, const std::string& raw) {
                auto summary = summarizeRecord(key, raw);
                if (!summary || summary->session_id == session_id) {
                    keys.push_back(key);
                    targets.push_back(summary.value_or(RecordSummary{session_id, splitRecordKey(key).second}));
                }
                return true;
            });
            for (std::size_t i = 0; i < keys.size(); ++i) {
                if (txn.remove(kCheckpointBucket, keys[i])) {
                    ++deleted;
                }
                txn.remove(kIndexBucket, targets[i].checkpoint_id);
            }
        });
    });
    LOG_INFO("checkpoint_store", "Deleted " + std::to_string(deleted) + " checkpoints for session " + session_id);
    return deleted;
}

// EN: Two phases: a read transaction selects expired records, a write transaction removes them.
//     A record that cannot be removed is logged and skipped.
// FR: Deux phases : une transaction de lecture sélectionne les enregistrements expirés, une
//     transaction d'écriture les supprime. Un enregistrement non supprimable est journalisé et ignoré.
std::size_t CheckpointStore::cleanupExpiredCheckpoints(std::chrono::milliseconds max_age) {
    const TimePoint cutoff = now() - max_age;
    std::vector<std::pair<std::string, RecordSummary>> expired;

    withCheckpointContext("Scan expired checkpoints", "", "", "", [&] {
        store_->view([&](const Storage::ReadTransaction& txn) {
            txn.scanPrefix(kCheckpointBucket, "", [&](const std::string& key, const std::string& raw) {
                auto summary = summarizeRecord(key, raw);
                if (!summary) {
                    LOG_WARN("checkpoint_store", "Cannot read checkpoint record " + key + " during cleanup");
                    return true;
                }
                if (summary->timestamp < cutoff) {
                    expired.emplace_back(key, *summary);
                }
                return true;
            });
        });
    });

    if (expired.empty()) {
        return 0;
    }

    std::set<std::string> expired_ids;
    for (const auto& [key, summary] : expired) {
        expired_ids.insert(summary.checkpoint_id);
    }

    std::size_t deleted = 0;
    std::size_t rebased = 0;
    withCheckpointContext("Delete expired checkpoints", "", "", "", [&] {
        store_->update([&](Storage::WriteTransaction& txn) {
            rebased = rebaseOrphanedChildren(txn, expired_ids);
            for (const auto& [key, summary] : expired) {
                try {
                    if (txn.remove(kCheckpointBucket, key)) {
                        ++deleted;
                    }
                    txn.remove(kIndexBucket, summary.checkpoint_id);
                } catch (const Storage::StorageError& e) {
                    LOG_WARN_META("checkpoint_store", "Failed to delete expired checkpoint",
                                  (std::unordered_map<std::string, std::string>{
                                      {"session_id", summary.session_id},
                                      {"checkpoint_id", summary.checkpoint_id},
                                      {"error", e.what()}}));
                }
            }
        });
    });

    LOG_INFO_META("checkpoint_store", "Cleaned up expired checkpoints", (std::unordered_map<std::string, std::string>{
        {"deleted", std::to_string(deleted)}, {"rebased", std::to_string(rebased)}}));
    return deleted;
}

// EN: Children are materialized while every parent is still readable, then written back in place
//     with their original sequence so listing order does not change.
// FR: Les enfants sont matérialisés tant que tous les parents sont lisibles, puis réécrits en place
//     avec leur séquence d'origine pour ne pas changer l'ordre de listage.
std::size_t CheckpointStore::rebaseOrphanedChildren(Storage::WriteTransaction& txn,
                                                    const std::set<std::string>& expired_ids) const {
    std::vector<std::pair<std::string, std::string>> orphans;
    txn.scanPrefix(kCheckpointBucket, "", [&](const std::string& key, const std::string& raw) {
        auto summary = summarizeRecord(key, raw);
        if (summary && summary->incremental && expired_ids.count(summary->checkpoint_id) == 0 &&
            expired_ids.count(summary->parent_checkpoint_id) > 0) {
            orphans.emplace_back(key, raw);
        }
        return true;
    });

    std::vector<std::pair<std::string, WorkflowCheckpoint>> rebased;
    for (const auto& [key, raw] : orphans) {
        try {
            WorkflowCheckpoint child = decodeRecord(key, raw);
            MaterializedState state = materialize(txn, child);
            child.session_state = state.snapshot;
            child.stage_results = std::move(state.stage_results);
            child.parent_checkpoint_id.reset();
            rebased.emplace_back(key, std::move(child));
        } catch (const CheckpointError& e) {
            LOG_WARN_META("checkpoint_store", "Cannot rebase checkpoint onto a full snapshot",
                          (std::unordered_map<std::string, std::string>{{"key", key}, {"error", e.what()}}));
        }
    }

    for (const auto& [key, child] : rebased) {
        const auto& snapshot = std::get<SessionSnapshot>(child.session_state);
        txn.put(kCheckpointBucket, key, encodeEnvelope(child, snapshot.workflow_name));
        LOG_INFO_META("checkpoint_store", "Rebased incremental checkpoint onto a full snapshot",
                      (std::unordered_map<std::string, std::string>{
                          {"session_id", child.session_id}, {"checkpoint_id", child.id}}));
    }
    return rebased.size();
}

std::optional<WorkflowCheckpoint> CheckpointStore::findLatestCheckpoint(const std::string& session_id) {
    auto checkpoints = listCheckpoints(session_id);
    if (checkpoints.empty()) {
        return std::nullopt;
    }
    return checkpoints.front();
}

WorkflowCheckpoint CheckpointStore::getLatestCheckpoint(const std::string& session_id) {
    auto latest = findLatestCheckpoint(session_id);
    if (!latest) {
        throw CheckpointNotFoundError("No checkpoints found for session " + session_id, session_id);
    }
    return *latest;
}

CheckpointMetrics CheckpointStore::getCheckpointMetrics() {
    CheckpointMetrics metrics;
    withCheckpointContext("Compute checkpoint metrics", "", "", "", [&] {
        store_->view([&](const Storage::ReadTransaction& txn) {
            txn.scanPrefix(kCheckpointBucket, "", [&](const std::string& key, const std::string& raw) {
                auto summary = summarizeRecord(key, raw);
                if (!summary) {
                    return true;
                }
                metrics.total_checkpoints++;
                metrics.total_stored_bytes += raw.size();
                metrics.session_counts[summary->session_id]++;
                if (!summary->stage_name.empty()) {
                    metrics.stage_counts[summary->stage_name]++;
                }
                if (summary->incremental) {
                    metrics.incremental_checkpoints++;
                }
                if (summary->compressed) {
                    metrics.compressed_checkpoints++;
                }
                if (!metrics.last_checkpoint || summary->timestamp > *metrics.last_checkpoint) {
                    metrics.last_checkpoint = summary->timestamp;
                }
                return true;
            });
        });
    });
    return metrics;
}

std::optional<CheckpointEnvelope> CheckpointStore::readEnvelope(const std::string& session_id,
                                                                const std::string& checkpoint_id) {
    std::optional<std::string> raw;
    withCheckpointContext("Read checkpoint envelope", session_id, checkpoint_id, "", [&] {
        store_->view([&](const Storage::ReadTransaction& txn) {
            raw = txn.get(kCheckpointBucket, CheckpointUtils::makeRecordKey(session_id, checkpoint_id));
        });
    });
    if (!raw) {
        return std::nullopt;
    }
    try {
        return CheckpointEnvelope::parse(*raw);
    } catch (const std::invalid_argument& e) {
        throw CheckpointError("Corrupted checkpoint envelope: " + std::string(e.what()), session_id, checkpoint_id);
    }
}

// ---------------------------------------------------------------------------------------------
// EN: CheckpointUtils
// FR: CheckpointUtils
// ---------------------------------------------------------------------------------------------

namespace CheckpointUtils {

std::string compress(const std::string& data, int level) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, level) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[32768];
    std::string compressed;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
        zs.avail_out = sizeof(outbuffer);

        ret = deflate(&zs, Z_FINISH);

        if (compressed.size() < zs.total_out) {
            compressed.append(outbuffer, zs.total_out - compressed.size());
        }
    } while (ret == Z_OK);

    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Failed to compress data");
    }
    return compressed;
}

std::string decompress(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // EN: 15 + 32 enables automatic zlib/gzip header detection.
    // FR: 15 + 32 active la détection automatique des en-têtes zlib/gzip.
    if (inflateInit2(&zs, 15 + 32) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[32768];
    std::string decompressed;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(outbuffer);
        zs.avail_out = sizeof(outbuffer);

        ret = inflate(&zs, Z_NO_FLUSH);

        if (decompressed.size() < zs.total_out) {
            decompressed.append(outbuffer, zs.total_out - decompressed.size());
        }
    } while (ret == Z_OK);

    inflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("Failed to decompress data (zlib code " + std::to_string(ret) + ")");
    }
    return decompressed;
}

std::string checksum(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << static_cast<std::uint32_t>(crc);
    return ss.str();
}

namespace base64 = boost::beast::detail::base64;

std::string encodeBase64(const std::string& data) {
    std::string out(base64::encoded_size(data.size()), '\0');
    out.resize(base64::encode(out.data(), data.data(), data.size()));
    return out;
}

// EN: Beast stops at the first '=' or foreign character; whatever follows must be valid padding.
// FR: Beast s'arrête au premier '=' ou caractère étranger ; la suite doit être un remplissage valide.
std::string decodeBase64(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }
    std::string out(base64::decoded_size(text.size()), '\0');
    const auto [written, consumed] = base64::decode(out.data(), text.data(), text.size());
    const std::size_t padding = text.size() - consumed;
    if (padding > 2 || text.find_first_not_of('=', consumed) != std::string::npos) {
        throw std::invalid_argument("invalid base64 character or padding at offset " + std::to_string(consumed));
    }
    out.resize(written);
    return out;
}

// EN: Random version-4 UUID; contains no underscore so record keys split unambiguously.
// FR: UUID version 4 aléatoire ; sans tiret bas pour un découpage de clé non ambigu.
std::string generateCheckpointId() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 15);

    std::ostringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        if (i == 12) {
            ss << 4;
        } else if (i == 16) {
            ss << ((dis(gen) & 0x3) | 0x8);
        } else {
            ss << dis(gen);
        }
    }
    return ss.str();
}

std::string makeRecordKey(const std::string& session_id, const std::string& checkpoint_id) {
    return session_id + "_" + checkpoint_id;
}

} // namespace CheckpointUtils
} // namespace CKW::Orchestrator
