#include <iostream>
#include <string>
#include <memory>
#include "analysis/chat_completion_client.hpp"
#include "analysis/incremental_analyzer.hpp"
#include "core/session_manager.hpp"
#include "core/task_queue.hpp"
#include "core/websocket_server.hpp"
#include "stt/transcription_adapter.hpp"
#include "stt/whisper_api_client.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/http_client.hpp"
#include "utils/logging.hpp"
#include "utils/signal_watcher.hpp"

using namespace livenotes;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>     Configuration file (default: config/server.json)\n"
              << "  --port <port>       Set server port (default: 8080)\n"
              << "  --threads <n>       Worker threads for external calls (default: 4)\n"
              << "  --log-level <lvl>   DEBUG, INFO, WARN or ERROR\n"
              << "  --help, -h          Show this help message\n";
}

void logSessionTranscript(const core::SessionTranscript& transcript) {
    utils::Logger::info("Session " + transcript.session_id + " finished" +
                        (transcript.client_id.empty() ? std::string() : " (client " + transcript.client_id + ")") +
                        ": " + std::to_string(transcript.chunk_count) + " fragments, " +
                        std::to_string(transcript.segment_count) + " transcript segments, " +
                        std::to_string(transcript.action_items.size()) + " action items, " +
                        std::to_string(transcript.recommendations.size()) + " recommendations");
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/server.json";
    std::string portArg;
    std::string threadsArg;
    std::string logLevelArg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portArg = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            threadsArg = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevelArg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    std::shared_ptr<core::TaskQueue> taskQueue;
    std::unique_ptr<core::ThreadPool> pool;
    std::shared_ptr<core::SessionManager> sessions;

    try {
        utils::Logger::initialize();

        auto config = utils::Config::load(configPath);
        if (!portArg.empty()) {
            config.setPort(std::stoi(portArg));
        }
        if (!threadsArg.empty()) {
            config.setWorkerThreads(static_cast<size_t>(std::stoul(threadsArg)));
        }
        if (!logLevelArg.empty()) {
            config.setLogLevel(logLevelArg);
        }
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        utils::HttpClient::globalInit();

        std::shared_ptr<stt::SpeechToTextService> sttService;
        std::shared_ptr<analysis::CompletionService> completionService;

        std::string apiKey = config.getApiKey();
        if (apiKey.empty()) {
            utils::Logger::warn(config.getApiKeyEnv() + " not set: transcription disabled, "
                                "analysis limited to keyword fallback");
        } else {
            sttService = std::make_shared<stt::WhisperApiClient>(config.getStt(), apiKey);
            completionService = std::make_shared<analysis::ChatCompletionClient>(config.getCompletion(), apiKey);
            utils::Logger::info("Speech-to-text: " + sttService->getName() +
                                ", analysis: " + completionService->getName());
        }

        auto transcriber = std::make_shared<stt::TranscriptionAdapter>(
            sttService, config.getTrigger().minContainerBytes, config.getStt().prompt);
        auto analyzer = std::make_shared<analysis::IncrementalAnalyzer>(completionService);

        taskQueue = std::make_shared<core::TaskQueue>();
        pool = std::make_unique<core::ThreadPool>(config.getWorkerThreads());

        sessions = std::make_shared<core::SessionManager>(config.getTrigger(), transcriber, analyzer, taskQueue);
        sessions->setSessionCompleteCallback(logSessionTranscript);

        auto server = std::make_shared<core::WebSocketServer>(config.getPort(), config.getPath(), sessions);
        sessions->setEventEmitter(server);
        server->start();

        // Workers started after this point inherit the blocked SIGINT/SIGTERM mask
        utils::SignalWatcher signals([server](int) {
            server->shutdown();
        });
        pool->start(taskQueue);

        server->run();
        signals.stop();

        // Closed connections queued their flush jobs; stop() runs them before joining
        utils::Logger::info("Shutting down...");
        pool->stop();
        sessions->setEventEmitter(nullptr);
        server->stop();

    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "startup");
        std::cerr << "Error: " << e.what() << std::endl;
        if (pool) {
            pool->stop();
        }
        return 1;
    }

    return 0;
}
