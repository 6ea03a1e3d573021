#include "orchestrator/communication_bridge.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iterator>

namespace CKW::Orchestrator {

void to_json(nlohmann::json& j, const ToolMessage& message) {
    j = nlohmann::json{
        {"id", message.id},
        {"from", message.from},
        {"to", message.to},
        {"type", message.type},
        {"payload", message.payload},
        {"context", message.context},
        {"timestamp", TimeUtils::toRfc3339(message.timestamp)}
    };
    if (!message.reply_to.empty()) {
        j["reply_to"] = message.reply_to;
    }
    if (!message.correlation_id.empty()) {
        j["correlation"] = message.correlation_id;
    }
}

void from_json(const nlohmann::json& j, ToolMessage& message) {
    message.id = j.value("id", "");
    message.from = j.value("from", "");
    message.to = j.value("to", "");
    message.type = j.value("type", "");
    message.payload = j.contains("payload") ? j.at("payload") : nlohmann::json();
    message.context = j.contains("context") && j.at("context").is_object() ? j.at("context") : nlohmann::json::object();
    if (auto ts = TimeUtils::fromRfc3339(j.value("timestamp", ""))) {
        message.timestamp = *ts;
    }
    message.reply_to = j.value("reply_to", "");
    message.correlation_id = j.value("correlation", "");
}

InProcessCommunicationBridge::InProcessCommunicationBridge(size_t max_pending_per_tool)
    : max_pending_per_tool_(max_pending_per_tool == 0 ? 1 : max_pending_per_tool) {}

void InProcessCommunicationBridge::send(const CancellationToken& cancellation, const std::string& from,
                                        const std::string& to, const ToolMessage& message) {
    if (cancellation.isCancelled()) {
        throw CommunicationError("Send cancelled before delivery to '" + to + "'", from, to);
    }
    if (to.empty()) {
        throw CommunicationError("Message has no recipient", from, to);
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(to);
        if (it != handlers_.end()) {
            handler = it->second;
        } else {
            auto& queue = pending_[to];
            if (queue.size() >= max_pending_per_tool_) {
                throw CommunicationError("Pending queue full for tool '" + to + "'", from, to);
            }
            queue.push_back(message);
            return;
        }
    }

    // EN: Handlers run outside the lock; they may send further messages.
    // FR: Les handlers s'exécutent hors verrou ; ils peuvent envoyer d'autres messages.
    try {
        handler(cancellation, message);
    } catch (const CommunicationError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_WARN("communication_bridge", "Handler of '" + to + "' rejected message " + message.id + ": " + e.what());
        throw CommunicationError("Handler of '" + to + "' failed: " + std::string(e.what()), from, to);
    }
}

void InProcessCommunicationBridge::registerHandler(const std::string& tool_name, MessageHandler handler) {
    if (tool_name.empty() || !handler) {
        throw std::invalid_argument("Handler registration needs a tool name and a callable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[tool_name] = std::move(handler);
}

std::vector<ToolMessage> InProcessCommunicationBridge::getPendingMessages(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(tool_name);
    if (it == pending_.end()) {
        return {};
    }
    std::vector<ToolMessage> messages(std::make_move_iterator(it->second.begin()),
                                      std::make_move_iterator(it->second.end()));
    pending_.erase(it);
    return messages;
}

bool InProcessCommunicationBridge::unregisterHandler(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(tool_name) > 0;
}

size_t InProcessCommunicationBridge::pendingCount(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(tool_name);
    return it != pending_.end() ? it->second.size() : 0;
}

} // namespace CKW::Orchestrator
