#include "utils/signal_watcher.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <pthread.h>
#include <cstring>
#include <system_error>

namespace livenotes {
namespace utils {

SignalWatcher::SignalWatcher(Callback callback)
    : callback_(std::move(callback)), stopping_(false), signalled_(false) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }

    thread_ = std::thread(&SignalWatcher::watch, this);
}

SignalWatcher::~SignalWatcher() {
    stop();
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) {
        return;
    }

    stopping_ = true;
    if (!signalled_) {
        // Wake sigwait(); the watcher sees stopping_ and skips the callback
        pthread_kill(thread_.native_handle(), SIGTERM);
    }
    thread_.join();
}

void SignalWatcher::watch() {
    int signal = 0;
    int rc = sigwait(&signals_, &signal);
    if (rc != 0) {
        ErrorHandler::getInstance().reportError(
            ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, "sigwait failed", std::strerror(rc),
                      "signal watcher"));
        return;
    }

    if (stopping_) {
        return;
    }

    signalled_ = true;
    Logger::info(std::string("Received ") + (signal == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
    if (callback_) {
        try {
            callback_(signal);
        } catch (const std::exception& e) {
            ErrorHandler::getInstance().reportError(e, "signal watcher");
        }
    }
}

} // namespace utils
} // namespace livenotes
