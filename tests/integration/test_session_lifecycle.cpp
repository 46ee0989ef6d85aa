#include "core/session_manager.hpp"
#include "mocks/mock_services.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace livenotes;
using namespace livenotes::core;
using livenotes::test::MockCompletionService;
using livenotes::test::MockSpeechToTextService;
using livenotes::test::RecordingEmitter;
using livenotes::test::makeFragment;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        stt = std::make_shared<NiceMock<MockSpeechToTextService>>();
        completion = std::make_shared<NiceMock<MockCompletionService>>();
        emitter = std::make_shared<RecordingEmitter>();

        settings.maxBufferedBytes = 20000;
        taskQueue = std::make_shared<TaskQueue>();
        pool = std::make_unique<ThreadPool>(4);
        pool->start(taskQueue);

        manager = std::make_unique<SessionManager>(
            settings,
            std::make_shared<stt::TranscriptionAdapter>(stt, settings.minContainerBytes, "meeting"),
            std::make_shared<analysis::IncrementalAnalyzer>(completion),
            taskQueue);
        manager->setEventEmitter(emitter);
        manager->setSessionCompleteCallback([this](const SessionTranscript& transcript) {
            std::lock_guard<std::mutex> lock(completedMutex);
            completed.push_back(transcript);
        });
    }

    void TearDown() override {
        pool->stop();
    }

    bool waitFor(const std::function<bool()>& condition) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return condition();
    }

    size_t completedCount() {
        std::lock_guard<std::mutex> lock(completedMutex);
        return completed.size();
    }

    utils::TriggerSettings settings;
    std::shared_ptr<NiceMock<MockSpeechToTextService>> stt;
    std::shared_ptr<NiceMock<MockCompletionService>> completion;
    std::shared_ptr<RecordingEmitter> emitter;
    std::shared_ptr<TaskQueue> taskQueue;
    std::unique_ptr<ThreadPool> pool;
    std::unique_ptr<SessionManager> manager;

    std::mutex completedMutex;
    std::vector<SessionTranscript> completed;
};

TEST_F(SessionLifecycleTest, OpenRegistersSession) {
    EXPECT_TRUE(manager->openSession("a"));
    EXPECT_FALSE(manager->openSession("a"));

    EXPECT_TRUE(manager->getRegistry().contains("a"));
    EXPECT_EQ(manager->getOpenConnections(), 1u);
}

TEST_F(SessionLifecycleTest, EventsArriveInTranscriptOrder) {
    EXPECT_CALL(*stt, transcribe(_, _))
        .WillOnce(Return("First we cover the budget."))
        .WillOnce(Return("Then we discuss hiring plans."))
        .WillOnce(Return("Finally the travel policy."))
        .WillRepeatedly(Return(""));
    EXPECT_CALL(*completion, complete(_, _))
        .WillRepeatedly(Return(R"({"action_items": ["Book the offsite"], "recommendations": [], "summary": "Planning."})"));

    ASSERT_TRUE(manager->openSession("a"));
    manager->handleText("a", R"({"type": "config", "clientId": "client-1"})");
    manager->handleBinary("a", makeFragment(25000, true));
    manager->handleBinary("a", makeFragment(25000));
    manager->handleBinary("a", makeFragment(25000));
    manager->closeSession("a");

    ASSERT_TRUE(waitFor([this]() { return completedCount() == 1; }));

    auto transcripts = emitter->ofType("transcript");
    ASSERT_EQ(transcripts.size(), 3u);
    EXPECT_EQ(transcripts[0]["text"], "First we cover the budget.");
    EXPECT_EQ(transcripts[1]["text"], "Then we discuss hiring plans.");
    EXPECT_EQ(transcripts[2]["text"], "Finally the travel policy.");

    // One pass after the third transcript and one during close, item emitted once
    EXPECT_EQ(emitter->ofType("action_item").size(), 1u);
    EXPECT_EQ(emitter->ofType("summary_update").size(), 2u);

    for (const auto& event : emitter->events()) {
        EXPECT_EQ(event.session_id, "a");
    }

    std::lock_guard<std::mutex> lock(completedMutex);
    EXPECT_EQ(completed[0].client_id, "client-1");
    EXPECT_EQ(completed[0].segment_count, 3u);
}

TEST_F(SessionLifecycleTest, CloseRemovesSessionFromRegistry) {
    ASSERT_TRUE(manager->openSession("a"));
    ASSERT_TRUE(manager->openSession("b"));

    manager->handleBinary("a", makeFragment(4096, true));
    manager->closeSession("a");

    ASSERT_TRUE(waitFor([this]() { return completedCount() == 1; }));
    EXPECT_FALSE(manager->getRegistry().contains("a"));
    EXPECT_TRUE(manager->getRegistry().contains("b"));
    EXPECT_EQ(manager->getOpenConnections(), 1u);

    // Frames after close are dropped
    manager->handleBinary("a", makeFragment(4096));
    manager->closeSession("a");
    EXPECT_EQ(manager->getRegistry().size(), 1u);
}

TEST_F(SessionLifecycleTest, ClosingSessionStaysRegisteredUntilFlushed) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto calls = std::make_shared<std::atomic<int>>(0);
    EXPECT_CALL(*stt, transcribe(_, _))
        .WillRepeatedly([release, calls](const std::vector<uint8_t>&, const std::string&) {
            (*calls)++;
            while (!*release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return std::string();
        });

    ASSERT_TRUE(manager->openSession("a"));
    manager->handleBinary("a", makeFragment(25000, true));
    bool started = waitFor([calls]() { return *calls == 1; });

    manager->closeSession("a");
    size_t openWhileClosing = manager->getOpenConnections();
    bool registeredWhileClosing = manager->getRegistry().contains("a");
    manager->handleText("a", R"({"type": "config", "clientId": "late"})");
    manager->closeSession("a");
    release->store(true);

    EXPECT_TRUE(started);
    EXPECT_EQ(openWhileClosing, 0u);
    EXPECT_TRUE(registeredWhileClosing);

    ASSERT_TRUE(waitFor([this]() { return !manager->getRegistry().contains("a"); }));
    ASSERT_TRUE(waitFor([this]() { return completedCount() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::lock_guard<std::mutex> lock(completedMutex);
    EXPECT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].client_id, "");
}

TEST_F(SessionLifecycleTest, RemovalSurvivesFailingAnalysisAndCallback) {
    EXPECT_CALL(*stt, transcribe(_, _))
        .WillRepeatedly(Return("We should follow up on pricing."));
    EXPECT_CALL(*completion, complete(_, _))
        .WillRepeatedly(::testing::Throw(std::runtime_error("completion unavailable")));
    manager->setSessionCompleteCallback([this](const SessionTranscript& transcript) {
        {
            std::lock_guard<std::mutex> lock(completedMutex);
            completed.push_back(transcript);
        }
        throw std::runtime_error("storage unavailable");
    });

    ASSERT_TRUE(manager->openSession("a"));
    manager->handleBinary("a", makeFragment(25000, true));
    manager->closeSession("a");

    ASSERT_TRUE(waitFor([this]() { return completedCount() == 1; }));
    EXPECT_TRUE(waitFor([this]() { return !manager->getRegistry().contains("a"); }));
    EXPECT_EQ(emitter->ofType("action_item").size(), 1u);
}

TEST_F(SessionLifecycleTest, SessionsProgressIndependently) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    EXPECT_CALL(*stt, transcribe(_, _))
        .WillRepeatedly([release](const std::vector<uint8_t>& container, const std::string&) {
            // The slow session sends the larger fragment
            if (container.size() > 30000) {
                while (!*release) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                return std::string("Slow session speaking now.");
            }
            return std::string("Fast session speaking now.");
        });

    ASSERT_TRUE(manager->openSession("slow"));
    ASSERT_TRUE(manager->openSession("fast"));

    manager->handleBinary("slow", makeFragment(35000, true));
    manager->handleBinary("fast", makeFragment(25000, true));

    EXPECT_TRUE(waitFor([this]() { return emitter->ofType("transcript").size() == 1; }));
    auto first = emitter->events();
    release->store(true);

    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first[0].session_id, "fast");
    EXPECT_TRUE(waitFor([this]() { return emitter->ofType("transcript").size() == 2; }));
}
