#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace livenotes {
namespace utils {

namespace {

enum class ZeroPolicy { ALLOW, REJECT };

// Integers arrive as JSON numbers; a negative value must not wrap into a huge size_t
size_t readCount(const nlohmann::json& section, const std::string& name, size_t fallback, ZeroPolicy zero) {
    if (!section.contains(name)) {
        return fallback;
    }

    const auto& value = section[name];
    if (!value.is_number_integer()) {
        throw ConfigException("trigger." + name + " must be an integer");
    }

    long long count = value.get<long long>();
    if (count < 0 || (count == 0 && zero == ZeroPolicy::REJECT)) {
        throw ConfigException("trigger." + name +
                              (zero == ZeroPolicy::REJECT ? " must be positive" : " must not be negative"));
    }
    return static_cast<size_t>(count);
}

} // namespace

Config Config::load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        Logger::warn("Configuration file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = fromJson(buffer.str());
    Logger::info("Loaded configuration from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonContent) {
    Config config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonContent);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigException("Invalid JSON configuration", e.what());
    }

    if (!j.is_object()) {
        throw ConfigException("Invalid JSON configuration: root must be an object");
    }

    try {
        config.port_ = j.value("port", config.port_);
        config.path_ = j.value("path", config.path_);
        config.logLevel_ = j.value("logLevel", config.logLevel_);
        if (j.contains("workerThreads")) {
            const auto& threads = j["workerThreads"];
            if (!threads.is_number_integer() || threads.get<long long>() < 0) {
                throw ConfigException("workerThreads must be a non-negative integer");
            }
            config.workerThreads_ = threads.get<size_t>();
        }
        config.apiKeyEnv_ = j.value("apiKeyEnv", config.apiKeyEnv_);

        if (j.contains("trigger")) {
            const auto& t = j["trigger"];
            if (!t.is_object()) {
                throw ConfigException("trigger must be an object");
            }
            auto& trigger = config.trigger_;
            trigger.chunkCount = readCount(t, "chunkCount", trigger.chunkCount, ZeroPolicy::REJECT);
            trigger.timedChunkCount = readCount(t, "timedChunkCount", trigger.timedChunkCount, ZeroPolicy::REJECT);
            trigger.idleSeconds = t.value("idleSeconds", trigger.idleSeconds);
            trigger.maxBufferedBytes = readCount(t, "maxBufferedBytes", trigger.maxBufferedBytes, ZeroPolicy::REJECT);
            trigger.headerCaptureBytes = readCount(t, "headerCaptureBytes", trigger.headerCaptureBytes, ZeroPolicy::REJECT);
            trigger.minContainerBytes = readCount(t, "minContainerBytes", trigger.minContainerBytes, ZeroPolicy::ALLOW);
            trigger.keepChunksAfterTranscript =
                readCount(t, "keepChunksAfterTranscript", trigger.keepChunksAfterTranscript, ZeroPolicy::REJECT);
            trigger.silentAttemptLimit = readCount(t, "silentAttemptLimit", trigger.silentAttemptLimit, ZeroPolicy::ALLOW);
            trigger.silentTrimThreshold =
                readCount(t, "silentTrimThreshold", trigger.silentTrimThreshold, ZeroPolicy::ALLOW);
            trigger.keepChunksAfterSilence =
                readCount(t, "keepChunksAfterSilence", trigger.keepChunksAfterSilence, ZeroPolicy::REJECT);
            trigger.analysisInterval = readCount(t, "analysisInterval", trigger.analysisInterval, ZeroPolicy::REJECT);

            if (trigger.idleSeconds < 0.0) {
                throw ConfigException("trigger.idleSeconds must not be negative");
            }
        }

        if (j.contains("stt")) {
            const auto& s = j["stt"];
            auto& stt = config.stt_;
            stt.endpoint = s.value("endpoint", stt.endpoint);
            stt.model = s.value("model", stt.model);
            stt.language = s.value("language", stt.language);
            stt.prompt = s.value("prompt", stt.prompt);
            stt.timeoutMs = s.value("timeoutMs", stt.timeoutMs);
        }

        if (j.contains("completion")) {
            const auto& c = j["completion"];
            auto& completion = config.completion_;
            completion.endpoint = c.value("endpoint", completion.endpoint);
            completion.model = c.value("model", completion.model);
            completion.temperature = c.value("temperature", completion.temperature);
            completion.maxTokens = c.value("maxTokens", completion.maxTokens);
            completion.timeoutMs = c.value("timeoutMs", completion.timeoutMs);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigException("Invalid value type in configuration", e.what());
    }

    if (config.port_ < 0 || config.port_ > 65535) {
        throw ConfigException("port must be between 0 and 65535");
    }
    if (config.stt_.timeoutMs <= 0 || config.completion_.timeoutMs <= 0) {
        throw ConfigException("timeoutMs must be positive");
    }
    if (config.workerThreads_ == 0) {
        config.workerThreads_ = 1;
    }

    return config;
}

std::string Config::getApiKey() const {
    const char* value = std::getenv(apiKeyEnv_.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace utils
} // namespace livenotes
