// EN: Engine configuration for CK-Workflow - typed view over the YAML configuration file
// FR: Configuration du moteur pour CK-Workflow - vue typée du fichier de configuration YAML

#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/checkpoint_store.hpp"
#include "orchestrator/coordination_engine.hpp"
#include "orchestrator/escalation_router.hpp"
#include "orchestrator/failure_handler.hpp"
#include "orchestrator/resume_system.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

struct CheckpointSettings {
    std::string database_path = "ckw_checkpoints.db";
    CheckpointStoreConfig store;
    std::chrono::hours cleanup_max_age{24 * 7};
};

struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    std::string output_file;
    bool console = true;
};

// EN: Escalation rule declared in configuration, registered on top of the router defaults.
// FR: Règle d'escalade déclarée en configuration, ajoutée aux règles par défaut du routeur.
struct ConfiguredEscalationRule {
    std::string source_tool;
    ErrorRoutingRule rule;
};

struct EngineConfig {
    CheckpointSettings checkpoint;
    CoordinationConfig coordination;
    ResumeConfig resume;
    LoggingSettings logging;
    std::map<std::string, RetryPolicy> retry_policies;
    std::vector<ConfiguredEscalationRule> escalation_rules;

    FailureHandlerConfig failureHandlerConfig() const;

    // EN: Register configured retry policies and escalation rules on `router`.
    // FR: Enregistre les politiques de retry et règles d'escalade configurées sur `router`.
    void applyTo(EscalationRouter& router) const;

    // EN: Configure the process-wide Logger.
    // FR: Configure le Logger global au processus.
    void applyLogging() const;
};

// EN: Builds an EngineConfig from YAML. Every error is reported as ConfigError naming the offending key.
// FR: Construit un EngineConfig depuis YAML. Chaque erreur est signalée par ConfigError avec la clé fautive.
class EngineConfigLoader {
public:
    explicit EngineConfigLoader(std::string env_prefix = "CKW_");

    EngineConfig loadFromFile(const std::string& filename) const;
    EngineConfig loadFromString(const std::string& yaml_content) const;

private:
    std::string env_prefix_;
};

} // namespace CKW::Orchestrator
