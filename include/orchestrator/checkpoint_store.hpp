// EN: Checkpoint Store for CK-Workflow - durable session snapshots with compression and integrity envelopes
// FR: Magasin de checkpoints pour CK-Workflow - snapshots durables avec compression et enveloppes d'intégrité

#pragma once

#include "storage/key_value_store.hpp"
#include "workflow/session_snapshot.hpp"
#include "workflow/workflow_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: Payload compression applied before storage.
// FR: Compression du contenu appliquée avant stockage.
enum class CompressionMode {
    NONE = 0,   // EN: Store payload as-is / FR: Stocke le contenu tel quel
    ZLIB = 1    // EN: Deflate when it shrinks the payload / FR: Deflate si le contenu rétrécit
};

// EN: What restore does when the stored checksum does not match the stored bytes.
// FR: Comportement de la restauration quand la somme de contrôle ne correspond pas.
enum class IntegrityPolicy {
    STRICT,      // EN: Fail with CheckpointIntegrityError / FR: Échoue avec CheckpointIntegrityError
    BEST_EFFORT  // EN: Log a warning and keep decoding / FR: Journalise un avertissement et continue
};

std::string compressionModeToString(CompressionMode mode);
std::optional<CompressionMode> parseCompressionMode(const std::string& text);
std::string integrityPolicyToString(IntegrityPolicy policy);
std::optional<IntegrityPolicy> parseIntegrityPolicy(const std::string& text);

// EN: Checkpoint store configuration.
// FR: Configuration du magasin de checkpoints.
struct CheckpointStoreConfig {
    CompressionMode compression = CompressionMode::ZLIB;
    int compression_level = -1;                               // EN: zlib level, -1 = default / FR: niveau zlib, -1 = défaut
    bool enable_integrity_checks = true;
    IntegrityPolicy integrity_policy = IntegrityPolicy::BEST_EFFORT;
};

// EN: Base error for checkpoint operations, with the identifiers needed for diagnostics.
// FR: Erreur de base des opérations de checkpoint, avec les identifiants utiles au diagnostic.
class CheckpointError : public std::runtime_error {
public:
    CheckpointError(const std::string& message, std::string session_id = "",
                    std::string checkpoint_id = "", std::string stage_name = "")
        : std::runtime_error(message),
          session_id_(std::move(session_id)),
          checkpoint_id_(std::move(checkpoint_id)),
          stage_name_(std::move(stage_name)) {}

    const std::string& sessionId() const { return session_id_; }
    const std::string& checkpointId() const { return checkpoint_id_; }
    const std::string& stageName() const { return stage_name_; }

private:
    std::string session_id_;
    std::string checkpoint_id_;
    std::string stage_name_;
};

class CheckpointNotFoundError : public CheckpointError {
public:
    using CheckpointError::CheckpointError;
};

class CheckpointIntegrityError : public CheckpointError {
public:
    using CheckpointError::CheckpointError;
};

// EN: Immutable point-in-time snapshot of a session. Incremental checkpoints carry a SessionDelta
//     and only the stage results that changed since their parent.
// FR: Snapshot immuable d'une session. Les checkpoints incrémentaux portent un SessionDelta et
//     uniquement les résultats d'étape modifiés depuis leur parent.
struct WorkflowCheckpoint {
    std::string id;
    std::string session_id;
    std::string stage_name;
    TimePoint timestamp{};
    std::uint64_t sequence = 0;
    std::optional<Workflow::WorkflowSpecRef> workflow_spec;
    Workflow::SessionState session_state;
    std::map<std::string, nlohmann::json> stage_results;
    std::string message;
    std::optional<std::string> parent_checkpoint_id;

    bool isIncremental() const { return std::holds_alternative<Workflow::SessionDelta>(session_state); }
};

void to_json(nlohmann::json& j, const WorkflowCheckpoint& checkpoint);
// EN: Lenient: also reads the unwrapped legacy record layout.
// FR: Tolérant : lit aussi l'ancien format non enveloppé.
void from_json(const nlohmann::json& j, WorkflowCheckpoint& checkpoint);

// EN: Durable wire format wrapping checkpoint bytes.
// FR: Format durable enveloppant les octets d'un checkpoint.
struct CheckpointEnvelope {
    static constexpr int kCurrentVersion = 1;

    int version = kCurrentVersion;
    bool compressed = false;
    std::string checksum;
    std::size_t data_size = 0;                     // EN: Uncompressed payload size / FR: Taille décompressée
    TimePoint created_at{};
    std::map<std::string, std::string> metadata;
    std::string data;                              // EN: Stored (possibly compressed) bytes / FR: Octets stockés

    std::string serialize() const;

    // EN: nullopt when `raw` is not a versioned envelope (legacy record); throws std::invalid_argument
    //     when it claims a version but the remaining fields are unusable. `version` is read first.
    // FR: nullopt si `raw` n'est pas une enveloppe versionnée (ancien format) ; lève
    //     std::invalid_argument si la version est présente mais les autres champs inutilisables.
    static std::optional<CheckpointEnvelope> parse(const std::string& raw);
};

// EN: Aggregated view over every stored checkpoint.
// FR: Vue agrégée sur tous les checkpoints stockés.
struct CheckpointMetrics {
    std::size_t total_checkpoints = 0;
    std::size_t incremental_checkpoints = 0;
    std::size_t compressed_checkpoints = 0;
    std::uint64_t total_stored_bytes = 0;
    std::map<std::string, std::size_t> session_counts;
    std::map<std::string, std::size_t> stage_counts;
    std::optional<TimePoint> last_checkpoint;
};

// EN: Envelope metadata keys.
// FR: Clés de métadonnées de l'enveloppe.
namespace EnvelopeKeys {
constexpr const char* SESSION_ID = "session_id";
constexpr const char* CHECKPOINT_ID = "checkpoint_id";
constexpr const char* STAGE_NAME = "stage_name";
constexpr const char* WORKFLOW_NAME = "workflow_name";
constexpr const char* COMPRESSION_MODE = "compression_mode";
constexpr const char* CHECKSUM_ALGORITHM = "checksum_algorithm";
constexpr const char* INCREMENTAL = "incremental";
constexpr const char* PARENT_CHECKPOINT = "parent_checkpoint";
constexpr const char* SEQUENCE = "sequence";
} // namespace EnvelopeKeys

// EN: Durable checkpoint persistence on top of a transactional key-value store.
//     Records live under "{session_id}_{checkpoint_id}"; a secondary index maps checkpoint ids to
//     record keys. Each create, delete and cleanup runs in a single store transaction.
// FR: Persistance durable des checkpoints sur un stockage clé-valeur transactionnel.
//     Les enregistrements sont sous "{session_id}_{checkpoint_id}" ; un index secondaire associe
//     les ids de checkpoint aux clés. Chaque création, suppression et nettoyage est une transaction.
class CheckpointStore {
public:
    using Clock = std::function<TimePoint()>;

    static constexpr const char* kCheckpointBucket = "workflow_checkpoints";
    static constexpr const char* kIndexBucket = "checkpoint_index";
    static constexpr const char* kMetaBucket = "checkpoint_meta";

    explicit CheckpointStore(std::shared_ptr<Storage::KeyValueStore> store,
                             const CheckpointStoreConfig& config = CheckpointStoreConfig{},
                             Clock clock = nullptr);

    // EN: Full snapshot of session state and stage results.
    // FR: Snapshot complet de l'état de session et des résultats d'étape.
    WorkflowCheckpoint createCheckpoint(const Workflow::WorkflowSession& session,
                                        const std::string& stage_name,
                                        const std::string& message,
                                        const std::optional<Workflow::WorkflowSpecRef>& spec = std::nullopt);

    // EN: Delta against the newest checkpoint of the session; full snapshot when there is none.
    // FR: Delta par rapport au checkpoint le plus récent ; snapshot complet s'il n'y en a pas.
    WorkflowCheckpoint createIncrementalCheckpoint(const Workflow::WorkflowSession& session,
                                                   const std::string& stage_name,
                                                   const std::string& message,
                                                   const std::optional<Workflow::WorkflowSpecRef>& spec = std::nullopt);

    // EN: Rebuild a session; incremental checkpoints are materialized through their parent chain.
    // FR: Reconstruit une session ; les incrémentaux sont matérialisés via leur chaîne de parents.
    Workflow::WorkflowSession restoreFromCheckpoint(const std::string& session_id,
                                                    const std::string& checkpoint_id);

    // EN: Newest first (timestamp, then sequence).
    // FR: Du plus récent au plus ancien (horodatage, puis séquence).
    std::vector<WorkflowCheckpoint> listCheckpoints(const std::string& session_id);

    void deleteCheckpoint(const std::string& checkpoint_id);
    std::size_t deleteSessionCheckpoints(const std::string& session_id);

    // EN: Removes checkpoints strictly older than now - max_age; individual delete failures are logged.
    // FR: Supprime les checkpoints strictement plus vieux que now - max_age ; les échecs sont journalisés.
    std::size_t cleanupExpiredCheckpoints(std::chrono::milliseconds max_age);

    WorkflowCheckpoint getLatestCheckpoint(const std::string& session_id);
    std::optional<WorkflowCheckpoint> findLatestCheckpoint(const std::string& session_id);

    CheckpointMetrics getCheckpointMetrics();

    std::optional<CheckpointEnvelope> readEnvelope(const std::string& session_id,
                                                   const std::string& checkpoint_id);

    CheckpointStoreConfig getConfig() const;
    void setIntegrityPolicy(IntegrityPolicy policy);

private:
    struct MaterializedState {
        Workflow::SessionSnapshot snapshot;
        std::map<std::string, nlohmann::json> stage_results;
    };

    WorkflowCheckpoint buildCheckpoint(const Workflow::WorkflowSession& session,
                                       const std::string& stage_name,
                                       const std::string& message,
                                       const std::optional<Workflow::WorkflowSpecRef>& spec) const;
    void persist(Storage::WriteTransaction& txn, WorkflowCheckpoint& checkpoint,
                 const std::string& workflow_name) const;
    std::string encodeEnvelope(const WorkflowCheckpoint& checkpoint, const std::string& workflow_name) const;
    WorkflowCheckpoint decodeRecord(const std::string& key, const std::string& raw) const;
    std::optional<std::string> findKeyById(const Storage::ReadTransaction& txn,
                                           const std::string& checkpoint_id) const;
    std::vector<WorkflowCheckpoint> collectSessionCheckpoints(const Storage::ReadTransaction& txn,
                                                              const std::string& session_id) const;
    MaterializedState materialize(const Storage::ReadTransaction& txn,
                                  const WorkflowCheckpoint& checkpoint) const;
    // EN: Rewrites surviving incremental checkpoints whose parent is about to be deleted as full snapshots.
    // FR: Réécrit en snapshots complets les checkpoints incrémentaux dont le parent va être supprimé.
    std::size_t rebaseOrphanedChildren(Storage::WriteTransaction& txn,
                                       const std::set<std::string>& expired_ids) const;
    TimePoint now() const;

    std::shared_ptr<Storage::KeyValueStore> store_;
    CheckpointStoreConfig config_;
    Clock clock_;
    mutable std::mutex config_mutex_;
};

// EN: Encoding helpers shared by the checkpoint store.
// FR: Utilitaires d'encodage partagés par le magasin de checkpoints.
namespace CheckpointUtils {

std::string compress(const std::string& data, int level = -1);

// EN: Accepts zlib and gzip streams.
// FR: Accepte les flux zlib et gzip.
std::string decompress(const std::string& data);

// EN: zlib CRC-32 as 8 lower-case hex digits.
// FR: CRC-32 zlib en 8 chiffres hexadécimaux minuscules.
std::string checksum(const std::string& data);

std::string encodeBase64(const std::string& data);
// EN: Throws std::invalid_argument on malformed input.
// FR: Lève std::invalid_argument sur une entrée invalide.
std::string decodeBase64(const std::string& text);

std::string generateCheckpointId();
std::string makeRecordKey(const std::string& session_id, const std::string& checkpoint_id);

} // namespace CheckpointUtils
} // namespace CKW::Orchestrator
