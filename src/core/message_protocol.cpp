#include "core/message_protocol.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace livenotes {
namespace core {

using json = nlohmann::json;

namespace {

// Transcript text comes from an external service and may carry invalid UTF-8.
std::string toWire(const json& root) {
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

std::string TranscriptMessage::serialize() const {
    json root = {
        {"type", "transcript"},
        {"text", text_},
        {"timestamp", timestamp_},
        {"isFinal", isFinal_}
    };
    return toWire(root);
}

std::string ActionItemMessage::serialize() const {
    json root = {
        {"type", "action_item"},
        {"item", item_}
    };
    return toWire(root);
}

std::string RecommendationMessage::serialize() const {
    json root = {
        {"type", "recommendation"},
        {"recommendation", recommendation_}
    };
    return toWire(root);
}

std::string SummaryUpdateMessage::serialize() const {
    json root = {
        {"type", "summary_update"},
        {"summary", summary_}
    };
    return toWire(root);
}

std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        utils::Logger::warn("Invalid message format: not valid JSON");
        return nullptr;
    }

    if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
        utils::Logger::warn("Invalid message format: missing type field");
        return nullptr;
    }

    MessageType type = stringToMessageType(root["type"].get<std::string>());

    switch (type) {
        case MessageType::CONFIG: {
            auto message = std::make_unique<ConfigMessage>();
            if (root.contains("clientId")) {
                const auto& clientId = root["clientId"];
                if (clientId.is_string()) {
                    message->setClientId(clientId.get<std::string>());
                } else if (clientId.is_number()) {
                    message->setClientId(clientId.dump());
                } else if (!clientId.is_null()) {
                    utils::Logger::warn("Ignoring config clientId of unexpected type");
                }
            }
            if (root.contains("context")) {
                const auto& context = root["context"];
                if (context.is_object() || context.is_null()) {
                    message->setContext(context);
                } else {
                    utils::Logger::warn("Ignoring config context that is not an object");
                }
            }
            return message;
        }
        default:
            utils::Logger::warn("Unsupported client message type: " + root["type"].get<std::string>());
            return nullptr;
    }
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "config") return MessageType::CONFIG;
    if (typeStr == "transcript") return MessageType::TRANSCRIPT;
    if (typeStr == "action_item") return MessageType::ACTION_ITEM;
    if (typeStr == "recommendation") return MessageType::RECOMMENDATION;
    if (typeStr == "summary_update") return MessageType::SUMMARY_UPDATE;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::CONFIG: return "config";
        case MessageType::TRANSCRIPT: return "transcript";
        case MessageType::ACTION_ITEM: return "action_item";
        case MessageType::RECOMMENDATION: return "recommendation";
        case MessageType::SUMMARY_UPDATE: return "summary_update";
        case MessageType::UNKNOWN: break;
    }
    return "unknown";
}

double MessageProtocol::currentTimestamp() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

} // namespace core
} // namespace livenotes
