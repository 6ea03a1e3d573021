// EN: Versioned session state encoding with lenient decoding of older documents.
// FR: Encodage versionné de l'état de session avec décodage tolérant des anciens documents.

#include "workflow/session_snapshot.hpp"

#include <algorithm>
#include <set>

namespace CKW::Workflow {

namespace {

using nlohmann::json;

std::string readString(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::vector<std::string> readStringList(const json& j, const char* key) {
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

std::map<std::string, json> readJsonMap(const json& j, const char* key) {
    std::map<std::string, json> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return values;
    }
    for (auto item = it->begin(); item != it->end(); ++item) {
        values[item.key()] = item.value();
    }
    return values;
}

// EN: Non-string binding values are kept in their JSON text form.
// FR: Les valeurs de binding non textuelles sont conservées sous forme JSON.
std::map<std::string, std::string> readStringMap(const json& j, const char* key) {
    std::map<std::string, std::string> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return values;
    }
    for (auto item = it->begin(); item != it->end(); ++item) {
        values[item.key()] = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
    }
    return values;
}

std::optional<TimePoint> readTime(const json& j, const char* key) {
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

std::vector<std::string> difference(const std::vector<std::string>& current,
                                    const std::vector<std::string>& previous) {
    std::set<std::string> known(previous.begin(), previous.end());
    std::vector<std::string> added;
    for (const auto& value : current) {
        if (known.count(value) == 0) {
            added.push_back(value);
        }
    }
    return added;
}

void appendUnique(std::vector<std::string>& target, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (std::find(target.begin(), target.end(), value) == target.end()) {
            target.push_back(value);
        }
    }
}

void removeAll(std::vector<std::string>& target, const std::vector<std::string>& values) {
    target.erase(std::remove_if(target.begin(), target.end(), [&values](const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }), target.end());
}

json snapshotToJson(const SessionSnapshot& snapshot) {
    return json{
        {"schema_version", kSessionSchemaVersion},
        {"kind", "full"},
        {"session_id", snapshot.session_id},
        {"workflow_id", snapshot.workflow_id},
        {"workflow_name", snapshot.workflow_name},
        {"status", workflowStatusToString(snapshot.status)},
        {"current_stage", snapshot.current_stage},
        {"completed_stages", snapshot.completed_stages},
        {"failed_stages", snapshot.failed_stages},
        {"skipped_stages", snapshot.skipped_stages},
        {"shared_context", snapshot.shared_context},
        {"resource_bindings", snapshot.resource_bindings},
        {"created_at", TimeUtils::toRfc3339(snapshot.created_at)},
        {"last_activity", TimeUtils::toRfc3339(snapshot.last_activity)}
    };
}

json deltaToJson(const SessionDelta& delta) {
    json j{
        {"schema_version", kSessionSchemaVersion},
        {"kind", "delta"},
        {"session_id", delta.session_id},
        {"new_completed_stages", delta.new_completed_stages},
        {"last_activity", TimeUtils::toRfc3339(delta.last_activity)}
    };
    if (delta.status) {
        j["status"] = workflowStatusToString(*delta.status);
    }
    if (delta.current_stage) {
        j["current_stage"] = *delta.current_stage;
    }
    if (!delta.reopened_stages.empty()) {
        j["reopened_stages"] = delta.reopened_stages;
    }
    if (!delta.new_failed_stages.empty()) {
        j["new_failed_stages"] = delta.new_failed_stages;
    }
    if (!delta.cleared_failed_stages.empty()) {
        j["cleared_failed_stages"] = delta.cleared_failed_stages;
    }
    if (!delta.new_skipped_stages.empty()) {
        j["new_skipped_stages"] = delta.new_skipped_stages;
    }
    if (!delta.context_updates.empty()) {
        j["context_updates"] = delta.context_updates;
    }
    if (!delta.binding_updates.empty()) {
        j["binding_updates"] = delta.binding_updates;
    }
    if (!delta.unskipped_stages.empty()) {
        j["unskipped_stages"] = delta.unskipped_stages;
    }
    if (!delta.removed_context_keys.empty()) {
        j["removed_context_keys"] = delta.removed_context_keys;
    }
    if (!delta.removed_bindings.empty()) {
        j["removed_bindings"] = delta.removed_bindings;
    }
    if (!delta.removed_stage_results.empty()) {
        j["removed_stage_results"] = delta.removed_stage_results;
    }
    return j;
}

// EN: Version 1 full documents use "id" and "start_time"; version 2 uses "session_id" and "created_at".
// FR: Les documents complets v1 utilisent "id" et "start_time" ; la v2 "session_id" et "created_at".
SessionSnapshot snapshotFromJson(const json& j, int version) {
    SessionSnapshot snapshot;
    snapshot.session_id = readString(j, version >= 2 ? "session_id" : "id");
    snapshot.workflow_id = readString(j, "workflow_id");
    snapshot.workflow_name = readString(j, "workflow_name");
    snapshot.status = parseWorkflowStatus(readString(j, "status")).value_or(WorkflowStatus::PENDING);
    snapshot.current_stage = readString(j, "current_stage");
    snapshot.completed_stages = readStringList(j, "completed_stages");
    snapshot.failed_stages = readStringList(j, "failed_stages");
    snapshot.skipped_stages = readStringList(j, "skipped_stages");
    snapshot.shared_context = readJsonMap(j, "shared_context");
    snapshot.resource_bindings = readStringMap(j, "resource_bindings");
    snapshot.created_at = readTime(j, version >= 2 ? "created_at" : "start_time").value_or(TimePoint{});
    snapshot.last_activity = readTime(j, "last_activity").value_or(snapshot.created_at);
    return snapshot;
}

SessionDelta deltaFromJson(const json& j) {
    SessionDelta delta;
    delta.session_id = readString(j, "session_id");
    if (j.contains("status")) {
        delta.status = parseWorkflowStatus(readString(j, "status")).value_or(WorkflowStatus::PENDING);
    }
    if (j.contains("current_stage") && j["current_stage"].is_string()) {
        delta.current_stage = j["current_stage"].get<std::string>();
    }
    delta.new_completed_stages = readStringList(j, "new_completed_stages");
    delta.reopened_stages = readStringList(j, "reopened_stages");
    delta.new_failed_stages = readStringList(j, "new_failed_stages");
    delta.cleared_failed_stages = readStringList(j, "cleared_failed_stages");
    delta.new_skipped_stages = readStringList(j, "new_skipped_stages");
    delta.context_updates = readJsonMap(j, "context_updates");
    delta.binding_updates = readStringMap(j, "binding_updates");
    delta.unskipped_stages = readStringList(j, "unskipped_stages");
    delta.removed_context_keys = readStringList(j, "removed_context_keys");
    delta.removed_bindings = readStringList(j, "removed_bindings");
    delta.removed_stage_results = readStringList(j, "removed_stage_results");
    delta.last_activity = readTime(j, "last_activity").value_or(TimePoint{});
    return delta;
}

} // namespace

SessionSnapshot SessionSnapshot::fromSession(const WorkflowSession& session) {
    SessionSnapshot snapshot;
    snapshot.session_id = session.id;
    snapshot.workflow_id = session.workflow_id;
    snapshot.workflow_name = session.workflow_name;
    snapshot.status = session.status;
    snapshot.current_stage = session.current_stage;
    snapshot.completed_stages = session.completed_stages;
    snapshot.failed_stages = session.failed_stages;
    snapshot.skipped_stages = session.skipped_stages;
    snapshot.shared_context = session.shared_context;
    snapshot.resource_bindings = session.resource_bindings;
    snapshot.created_at = TimeUtils::truncateToMicros(session.created_at);
    snapshot.last_activity = TimeUtils::truncateToMicros(session.last_activity);
    return snapshot;
}

void SessionSnapshot::applyTo(WorkflowSession& session) const {
    session.id = session_id;
    session.workflow_id = workflow_id;
    session.workflow_name = workflow_name;
    session.status = status;
    session.current_stage = current_stage;
    session.completed_stages = completed_stages;
    session.failed_stages = failed_stages;
    session.skipped_stages = skipped_stages;
    session.shared_context = shared_context;
    session.resource_bindings = resource_bindings;
    session.created_at = created_at;
    session.last_activity = last_activity;
}

namespace SessionStateCodec {

json toJson(const SessionState& state) {
    if (const auto* snapshot = std::get_if<SessionSnapshot>(&state)) {
        return snapshotToJson(*snapshot);
    }
    return deltaToJson(std::get<SessionDelta>(state));
}

int detectSchemaVersion(const json& document) {
    if (!document.is_object()) {
        return 1;
    }
    auto it = document.find("schema_version");
    if (it == document.end() || !it->is_number_integer()) {
        return 1;
    }
    return it->get<int>();
}

SessionState fromJson(const json& document) {
    if (!document.is_object()) {
        return SessionSnapshot{};
    }
    const int version = detectSchemaVersion(document);
    if (version >= 2) {
        if (readString(document, "kind") == "delta") {
            return deltaFromJson(document);
        }
        return snapshotFromJson(document, version);
    }
    // EN: Version 1: incremental documents only carried the changed fields.
    // FR: Version 1 : les documents incrémentaux ne portaient que les champs modifiés.
    if (document.contains("new_completed_stages") && !document.contains("id")) {
        return deltaFromJson(document);
    }
    return snapshotFromJson(document, 1);
}

SessionDelta computeDelta(const WorkflowSession& current, const SessionSnapshot& previous) {
    SessionDelta delta;
    delta.session_id = current.id;
    if (current.status != previous.status) {
        delta.status = current.status;
    }
    if (current.current_stage != previous.current_stage) {
        delta.current_stage = current.current_stage;
    }
    delta.new_completed_stages = difference(current.completed_stages, previous.completed_stages);
    delta.reopened_stages = difference(previous.completed_stages, current.completed_stages);
    delta.new_failed_stages = difference(current.failed_stages, previous.failed_stages);
    delta.cleared_failed_stages = difference(previous.failed_stages, current.failed_stages);
    delta.new_skipped_stages = difference(current.skipped_stages, previous.skipped_stages);
    delta.unskipped_stages = difference(previous.skipped_stages, current.skipped_stages);
    for (const auto& [key, value] : current.shared_context) {
        auto it = previous.shared_context.find(key);
        if (it == previous.shared_context.end() || it->second != value) {
            delta.context_updates[key] = value;
        }
    }
    for (const auto& [key, value] : previous.shared_context) {
        if (current.shared_context.count(key) == 0) {
            delta.removed_context_keys.push_back(key);
        }
    }
    for (const auto& [key, value] : current.resource_bindings) {
        auto it = previous.resource_bindings.find(key);
        if (it == previous.resource_bindings.end() || it->second != value) {
            delta.binding_updates[key] = value;
        }
    }
    for (const auto& [key, value] : previous.resource_bindings) {
        if (current.resource_bindings.count(key) == 0) {
            delta.removed_bindings.push_back(key);
        }
    }
    delta.last_activity = TimeUtils::truncateToMicros(current.last_activity);
    return delta;
}

void applyDelta(SessionSnapshot& base, const SessionDelta& delta) {
    if (base.session_id.empty()) {
        base.session_id = delta.session_id;
    }
    if (delta.status) {
        base.status = *delta.status;
    }
    if (delta.current_stage) {
        base.current_stage = *delta.current_stage;
    }
    removeAll(base.completed_stages, delta.reopened_stages);
    appendUnique(base.completed_stages, delta.new_completed_stages);
    removeAll(base.failed_stages, delta.cleared_failed_stages);
    appendUnique(base.failed_stages, delta.new_failed_stages);
    removeAll(base.skipped_stages, delta.unskipped_stages);
    appendUnique(base.skipped_stages, delta.new_skipped_stages);
    for (const auto& key : delta.removed_context_keys) {
        base.shared_context.erase(key);
    }
    for (const auto& [key, value] : delta.context_updates) {
        base.shared_context[key] = value;
    }
    for (const auto& key : delta.removed_bindings) {
        base.resource_bindings.erase(key);
    }
    for (const auto& [key, value] : delta.binding_updates) {
        base.resource_bindings[key] = value;
    }
    base.last_activity = delta.last_activity;
}

} // namespace SessionStateCodec
} // namespace CKW::Workflow
