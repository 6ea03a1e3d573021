#pragma once

#include "workflow/workflow_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace CKW::Workflow {

// EN: Current schema version of persisted session state.
//     Version history and migration:
//       1 - untagged open mapping (no "schema_version" key). Read leniently: every field is
//           optional, mistyped fields fall back to defaults, a missing status reads as pending,
//           and a mapping holding "new_completed_stages" without "id" reads as a delta.
//       2 - tagged document {"schema_version": 2, "kind": "full" | "delta", ...}.
//     Writers always emit the current version.
// FR: Version de schéma courante de l'état de session persisté.
//     Historique et migration :
//       1 - mapping ouvert non tagué (pas de clé "schema_version"). Lu de façon tolérante : chaque
//           champ est optionnel, les champs mal typés prennent leur défaut, un statut absent vaut
//           pending, et un mapping avec "new_completed_stages" sans "id" est lu comme un delta.
//       2 - document tagué {"schema_version": 2, "kind": "full" | "delta", ...}.
//     L'écriture utilise toujours la version courante.
constexpr int kSessionSchemaVersion = 2;

// EN: Full copy of the session fields captured by a checkpoint (stage results are stored beside it).
// FR: Copie complète des champs de session capturés par un checkpoint (résultats stockés à côté).
struct SessionSnapshot {
    std::string session_id;
    std::string workflow_id;
    std::string workflow_name;
    WorkflowStatus status = WorkflowStatus::PENDING;
    std::string current_stage;
    std::vector<std::string> completed_stages;
    std::vector<std::string> failed_stages;
    std::vector<std::string> skipped_stages;
    std::map<std::string, nlohmann::json> shared_context;
    std::map<std::string, std::string> resource_bindings;
    TimePoint created_at{};
    TimePoint last_activity{};

    static SessionSnapshot fromSession(const WorkflowSession& session);
    void applyTo(WorkflowSession& session) const;
};

// EN: Changes since a parent snapshot. Unset optionals mean "unchanged".
// FR: Changements depuis un snapshot parent. Les optionnels vides signifient "inchangé".
struct SessionDelta {
    std::string session_id;
    std::optional<WorkflowStatus> status;
    std::optional<std::string> current_stage;
    std::vector<std::string> new_completed_stages;
    std::vector<std::string> reopened_stages;
    std::vector<std::string> new_failed_stages;
    std::vector<std::string> cleared_failed_stages;
    std::vector<std::string> new_skipped_stages;
    std::vector<std::string> unskipped_stages;
    std::map<std::string, nlohmann::json> context_updates;
    std::vector<std::string> removed_context_keys;
    std::map<std::string, std::string> binding_updates;
    std::vector<std::string> removed_bindings;
    // EN: Stage results dropped since the parent; filled by the checkpoint store.
    // FR: Résultats d'étape supprimés depuis le parent ; renseigné par le store.
    std::vector<std::string> removed_stage_results;
    TimePoint last_activity{};
};

using SessionState = std::variant<SessionSnapshot, SessionDelta>;

namespace SessionStateCodec {

nlohmann::json toJson(const SessionState& state);

// EN: Decode any supported schema version. Never throws on missing or mistyped fields.
// FR: Décode toute version de schéma supportée. Ne lève jamais sur champ absent ou mal typé.
SessionState fromJson(const nlohmann::json& document);

// EN: Version 1 when the tag is absent or not an integer.
// FR: Version 1 si le tag est absent ou non entier.
int detectSchemaVersion(const nlohmann::json& document);

// EN: Fields of `current` that differ from `previous`; last_activity is always carried.
// FR: Champs de `current` différents de `previous` ; last_activity est toujours porté.
SessionDelta computeDelta(const WorkflowSession& current, const SessionSnapshot& previous);

void applyDelta(SessionSnapshot& base, const SessionDelta& delta);

} // namespace SessionStateCodec
} // namespace CKW::Workflow
