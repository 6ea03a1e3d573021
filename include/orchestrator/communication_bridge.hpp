#pragma once

#include "infrastructure/system/cancellation.hpp"
#include "infrastructure/system/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: Message exchanged between two tools. `correlation_id` ties a reply to its coordination.
// FR: Message échangé entre deux outils. `correlation_id` relie une réponse à sa coordination.
struct ToolMessage {
    std::string id;
    std::string from;
    std::string to;
    std::string type;
    nlohmann::json payload;
    nlohmann::json context = nlohmann::json::object();
    TimePoint timestamp{};
    std::string reply_to;
    std::string correlation_id;
};

void to_json(nlohmann::json& j, const ToolMessage& message);
void from_json(const nlohmann::json& j, ToolMessage& message);

// EN: Dispatch failure between two tools.
// FR: Échec d'envoi entre deux outils.
class CommunicationError : public std::runtime_error {
public:
    CommunicationError(const std::string& message, std::string from, std::string to)
        : std::runtime_error(message), from_(std::move(from)), to_(std::move(to)) {}

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

private:
    std::string from_;
    std::string to_;
};

using MessageHandler = std::function<void(const CancellationToken&, const ToolMessage&)>;

// EN: Message delivery between tools. Callers assume delivery only, never an in-process call.
// FR: Livraison de messages entre outils. Les appelants ne supposent que la livraison.
class CommunicationBridge {
public:
    virtual ~CommunicationBridge() = default;

    // EN: Throws CommunicationError when the message cannot be delivered.
    // FR: Lève CommunicationError si le message ne peut pas être livré.
    virtual void send(const CancellationToken& cancellation, const std::string& from,
                      const std::string& to, const ToolMessage& message) = 0;

    virtual void registerHandler(const std::string& tool_name, MessageHandler handler) = 0;

    // EN: Drains the messages queued for a tool.
    // FR: Vide les messages en attente pour un outil.
    virtual std::vector<ToolMessage> getPendingMessages(const std::string& tool_name) = 0;
};

// EN: Same-process bridge: a registered handler receives the message synchronously, otherwise it
//     waits in a bounded per-tool queue.
// FR: Pont intra-processus : un handler enregistré reçoit le message de façon synchrone, sinon il
//     attend dans une file bornée par outil.
class InProcessCommunicationBridge : public CommunicationBridge {
public:
    explicit InProcessCommunicationBridge(size_t max_pending_per_tool = 1024);

    void send(const CancellationToken& cancellation, const std::string& from,
              const std::string& to, const ToolMessage& message) override;
    void registerHandler(const std::string& tool_name, MessageHandler handler) override;
    std::vector<ToolMessage> getPendingMessages(const std::string& tool_name) override;

    bool unregisterHandler(const std::string& tool_name);
    size_t pendingCount(const std::string& tool_name) const;

private:
    size_t max_pending_per_tool_;
    std::map<std::string, MessageHandler> handlers_;
    std::map<std::string, std::deque<ToolMessage>> pending_;
    mutable std::mutex mutex_;
};

} // namespace CKW::Orchestrator
