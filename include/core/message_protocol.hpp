#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace livenotes {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    CONFIG,
    // Server to Client
    TRANSCRIPT,
    ACTION_ITEM,
    RECOMMENDATION,
    SUMMARY_UPDATE
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;

    MessageType getType() const { return type_; }

protected:
    MessageType type_;
};

// Events the server pushes to the client
class EventMessage : public Message {
public:
    explicit EventMessage(MessageType type) : Message(type) {}

    // Invalid UTF-8 in text fields is replaced with U+FFFD
    virtual std::string serialize() const = 0;
};

// Client to Server Messages
class ConfigMessage : public Message {
public:
    ConfigMessage() : Message(MessageType::CONFIG), hasClientId_(false) {}

    bool hasClientId() const { return hasClientId_; }
    const std::string& getClientId() const { return clientId_; }
    const nlohmann::json& getContext() const { return context_; }

    void setClientId(const std::string& clientId) { clientId_ = clientId; hasClientId_ = true; }
    void setContext(const nlohmann::json& context) { context_ = context; }

private:
    std::string clientId_;
    bool hasClientId_;
    nlohmann::json context_;
};

// Server to Client Messages
class TranscriptMessage : public EventMessage {
public:
    TranscriptMessage(const std::string& text, double timestamp, bool isFinal = true)
        : EventMessage(MessageType::TRANSCRIPT), text_(text), timestamp_(timestamp), isFinal_(isFinal) {}

    const std::string& getText() const { return text_; }
    double getTimestamp() const { return timestamp_; }
    bool isFinal() const { return isFinal_; }

    std::string serialize() const override;

private:
    std::string text_;
    double timestamp_;
    bool isFinal_;
};

class ActionItemMessage : public EventMessage {
public:
    explicit ActionItemMessage(const std::string& item)
        : EventMessage(MessageType::ACTION_ITEM), item_(item) {}

    const std::string& getItem() const { return item_; }
    std::string serialize() const override;

private:
    std::string item_;
};

class RecommendationMessage : public EventMessage {
public:
    explicit RecommendationMessage(const std::string& recommendation)
        : EventMessage(MessageType::RECOMMENDATION), recommendation_(recommendation) {}

    const std::string& getRecommendation() const { return recommendation_; }
    std::string serialize() const override;

private:
    std::string recommendation_;
};

class SummaryUpdateMessage : public EventMessage {
public:
    explicit SummaryUpdateMessage(const std::string& summary)
        : EventMessage(MessageType::SUMMARY_UPDATE), summary_(summary) {}

    const std::string& getSummary() const { return summary_; }
    std::string serialize() const override;

private:
    std::string summary_;
};

// Message factory and parser
class MessageProtocol {
public:
    // nullptr for invalid JSON, a missing type, or a type clients may not send
    static std::unique_ptr<Message> parseMessage(const std::string& json);

    static std::string messageTypeToString(MessageType type);
    static MessageType stringToMessageType(const std::string& typeStr);

    // Seconds since the Unix epoch with sub-second precision
    static double currentTimestamp();
};

} // namespace core
} // namespace livenotes
