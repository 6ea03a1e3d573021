// EN: End-to-end example: a containerization session fails, escalates, is checkpointed and resumed
// FR: Exemple complet : une session de conteneurisation échoue, est escaladée, sauvegardée puis reprise

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/engine_config.hpp"
#include "storage/sqlite_key_value_store.hpp"

#include <iostream>
#include <unordered_map>

using namespace CKW;
using namespace CKW::Orchestrator;

int main(int argc, char** argv) {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::DEBUG);
    logger.setCorrelationId(logger.generateCorrelationId());
    logger.addGlobalMetadata("version", "1.0.0");

    try {
        EngineConfig config = argc > 1 ? EngineConfigLoader().loadFromFile(argv[1]) : EngineConfig{};
        config.applyLogging();
        config.coordination.timeout = std::chrono::milliseconds(2000);

        auto kv = std::make_shared<Storage::SqliteKeyValueStore>(":memory:");
        auto store = std::make_shared<CheckpointStore>(kv, config.checkpoint.store);
        auto sessions = std::make_shared<Workflow::InMemorySessionManager>();
        auto router = std::make_shared<EscalationRouter>();
        config.applyTo(*router);

        auto bridge = std::make_shared<InProcessCommunicationBridge>();
        auto engine = std::make_shared<CoordinationEngine>(bridge, router, config.coordination);
        engine->registerTool("analyze_repository");
        engine->registerTool("generate_dockerfile", {"analyze_repository"});
        engine->registerTool("build_image", {"generate_dockerfile"});

        // EN: The corrective tool answers every coordination it receives.
        // FR: L'outil correctif répond à chaque coordination reçue.
        bridge->registerHandler("generate_dockerfile", [&engine](const CancellationToken&, const ToolMessage& message) {
            LOG_INFO_META("generate_dockerfile", "Regenerating Dockerfile", (std::unordered_map<std::string, std::string>{
                {"coordination_id", message.correlation_id},
                {"fix_errors", message.payload.at("parameters").value("fix_errors", "false")}
            }));
            CoordinationResult result;
            result.success = true;
            result.output = {{"dockerfile", "FROM golang:1.22-alpine"}};
            engine->completeCoordination(message.correlation_id, result);
        });

        auto resume = std::make_shared<ResumeSystem>(store, sessions, config.resume);
        StageFailureHandler failures(sessions, router, engine, resume, config.failureHandlerConfig());

        Workflow::WorkflowSession session = sessions->createSession("containerization",
                                                                    Workflow::WorkflowSpecRef{"containerize", "1.0.0"});
        sessions->modifySession(session.id, [](Workflow::WorkflowSession& s) {
            s.beginStage("analyze_repository");
            s.completeStage("analyze_repository", {{"language", "go"}, {"framework", "gin"}});
            s.beginStage("build_image");
        });
        resume->checkpointSession(session.id, "analyze_repository", "analysis complete");

        Workflow::WorkflowError error;
        error.error_type = "build_error";
        error.message = "Dockerfile parse error on line 4";
        error.tool_name = "build_image";

        FailureDecision decision = failures.handleFailure(session.id, error, {{"exit_code", 1}});
        std::cout << "Decision: " << failureDispositionToString(decision.disposition)
                  << " -> " << decision.redirect_to << std::endl;

        // EN: Simulate a restart: a fresh session table rebuilt from the durable store.
        // FR: Simule un redémarrage : une table de sessions neuve reconstruite depuis le stockage.
        auto restarted_sessions = std::make_shared<Workflow::InMemorySessionManager>();
        ResumeSystem restarted(store, restarted_sessions, config.resume);
        auto resumed = restarted.resumeSession(session.id);
        if (resumed) {
            std::cout << "Resumed " << resumed->id << " with " << resumed->completed_stages.size()
                      << " completed stage(s) and " << resumed->checkpoints.size() << " checkpoint(s)" << std::endl;
        }

        engine->flushMetrics();
        CoordinationMetrics metrics = engine->getMetrics();
        std::cout << "Coordinations: " << metrics.successful_coordinations << "/"
                  << metrics.total_coordinations << " successful" << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR("main", std::string("Example failed: ") + e.what());
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
