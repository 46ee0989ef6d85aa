#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace livenotes::utils;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(tempPath.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream file(tempPath);
        file << content;
    }

    std::string tempPath = "livenotes_config_test.json";
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Config config = Config::load("does/not/exist.json");

    EXPECT_EQ(config.getPort(), 8080);
    EXPECT_EQ(config.getPath(), "/ws/transcribe");
    EXPECT_EQ(config.getWorkerThreads(), 4u);
    EXPECT_EQ(config.getApiKeyEnv(), "OPENAI_API_KEY");

    const auto& trigger = config.getTrigger();
    EXPECT_EQ(trigger.chunkCount, 10u);
    EXPECT_EQ(trigger.timedChunkCount, 5u);
    EXPECT_DOUBLE_EQ(trigger.idleSeconds, 10.0);
    EXPECT_EQ(trigger.maxBufferedBytes, 200000u);
    EXPECT_EQ(trigger.headerCaptureBytes, 5000u);
    EXPECT_EQ(trigger.minContainerBytes, 20000u);
    EXPECT_EQ(trigger.analysisInterval, 3u);

    EXPECT_EQ(config.getStt().model, "whisper-1");
    EXPECT_EQ(config.getStt().timeoutMs, 60000);
    EXPECT_EQ(config.getCompletion().timeoutMs, 30000);
}

TEST_F(ConfigTest, LoadsOverridesFromFile) {
    writeFile(R"({
        "port": 9001,
        "logLevel": "DEBUG",
        "workerThreads": 2,
        "trigger": {"chunkCount": 6, "idleSeconds": 4.5},
        "stt": {"language": "de", "timeoutMs": 15000},
        "completion": {"model": "gpt-4o-mini", "maxTokens": 800}
    })");

    Config config = Config::load(tempPath);

    EXPECT_EQ(config.getPort(), 9001);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getWorkerThreads(), 2u);
    EXPECT_EQ(config.getTrigger().chunkCount, 6u);
    EXPECT_DOUBLE_EQ(config.getTrigger().idleSeconds, 4.5);
    EXPECT_EQ(config.getTrigger().timedChunkCount, 5u);
    EXPECT_EQ(config.getStt().language, "de");
    EXPECT_EQ(config.getStt().timeoutMs, 15000);
    EXPECT_EQ(config.getCompletion().model, "gpt-4o-mini");
    EXPECT_EQ(config.getCompletion().maxTokens, 800);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(Config::fromJson("{ port: "), ConfigException);
    EXPECT_THROW(Config::fromJson("[1, 2]"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"port": "eighty"})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"analysisInterval": 0}})"), ConfigException);
}

TEST_F(ConfigTest, RejectsOutOfRangeTriggerValues) {
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"chunkCount": -1}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"chunkCount": 0}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"keepChunksAfterTranscript": 0}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"keepChunksAfterSilence": 0}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"maxBufferedBytes": -200000}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"silentAttemptLimit": -3}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"timedChunkCount": 2.5}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": {"idleSeconds": -1.0}})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"trigger": [10]})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"workerThreads": -2})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"port": 70000})"), ConfigException);
    EXPECT_THROW(Config::fromJson(R"({"stt": {"timeoutMs": 0}})"), ConfigException);
}

TEST_F(ConfigTest, ZeroIsAcceptedWhereItDisablesAGate) {
    Config config = Config::fromJson(
        R"({"trigger": {"minContainerBytes": 0, "silentAttemptLimit": 0, "silentTrimThreshold": 0}})");

    EXPECT_EQ(config.getTrigger().minContainerBytes, 0u);
    EXPECT_EQ(config.getTrigger().silentAttemptLimit, 0u);
    EXPECT_EQ(config.getTrigger().silentTrimThreshold, 0u);
    EXPECT_EQ(config.getTrigger().chunkCount, 10u);
}

TEST_F(ConfigTest, ZeroWorkerThreadsBecomesOne) {
    Config config = Config::fromJson(R"({"workerThreads": 0})");
    EXPECT_EQ(config.getWorkerThreads(), 1u);
}

TEST_F(ConfigTest, CommandLineOverrides) {
    Config config = Config::fromJson("{}");
    config.setPort(7000);
    config.setWorkerThreads(8);
    config.setLogLevel("WARN");

    EXPECT_EQ(config.getPort(), 7000);
    EXPECT_EQ(config.getWorkerThreads(), 8u);
    EXPECT_EQ(config.getLogLevel(), "WARN");
}

TEST_F(ConfigTest, ApiKeyComesFromNamedVariable) {
    Config config = Config::fromJson(R"({"apiKeyEnv": "LIVENOTES_TEST_API_KEY"})");

    unsetenv("LIVENOTES_TEST_API_KEY");
    EXPECT_EQ(config.getApiKey(), "");

    setenv("LIVENOTES_TEST_API_KEY", "sk-test", 1);
    EXPECT_EQ(config.getApiKey(), "sk-test");
    unsetenv("LIVENOTES_TEST_API_KEY");
}
