#pragma once

#include <cstddef>
#include <string>

namespace livenotes {
namespace utils {

// Thresholds driving buffering, transcription triggers and analysis cadence
struct TriggerSettings {
    size_t chunkCount = 10;            // attempt once this many fragments are buffered
    size_t timedChunkCount = 5;        // ...or this many, once idleSeconds have passed
    double idleSeconds = 10.0;
    size_t maxBufferedBytes = 200000;  // ...or when the buffer grows past this
    size_t headerCaptureBytes = 5000;
    size_t minContainerBytes = 20000;
    size_t keepChunksAfterTranscript = 2;
    size_t silentAttemptLimit = 3;
    size_t silentTrimThreshold = 5;
    size_t keepChunksAfterSilence = 3;
    size_t analysisInterval = 3;       // analyze after every Nth accepted transcript
};

struct SttSettings {
    std::string endpoint = "https://api.openai.com/v1/audio/transcriptions";
    std::string model = "whisper-1";
    std::string language = "en";
    std::string prompt = "This is a business meeting or conference call. Transcribe all speech clearly.";
    long timeoutMs = 60000;
};

struct CompletionSettings {
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-3.5-turbo";
    double temperature = 0.3;
    int maxTokens = 500;
    long timeoutMs = 30000;
};

class Config {
public:
    // Missing file -> defaults. Unreadable or malformed file -> ConfigException.
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& jsonContent);

    int getPort() const { return port_; }
    const std::string& getPath() const { return path_; }
    std::string getLogLevel() const { return logLevel_; }
    size_t getWorkerThreads() const { return workerThreads_; }
    const std::string& getApiKeyEnv() const { return apiKeyEnv_; }

    // Value of the environment variable named by apiKeyEnv, empty when unset
    std::string getApiKey() const;

    const TriggerSettings& getTrigger() const { return trigger_; }
    const SttSettings& getStt() const { return stt_; }
    const CompletionSettings& getCompletion() const { return completion_; }

    void setPort(int port) { port_ = port; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setWorkerThreads(size_t threads) { workerThreads_ = threads; }

private:
    Config() = default;

    int port_ = 8080;
    std::string path_ = "/ws/transcribe";
    std::string logLevel_ = "INFO";
    size_t workerThreads_ = 4;
    std::string apiKeyEnv_ = "OPENAI_API_KEY";

    TriggerSettings trigger_;
    SttSettings stt_;
    CompletionSettings completion_;
};

} // namespace utils
} // namespace livenotes
