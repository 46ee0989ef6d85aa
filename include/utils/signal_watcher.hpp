#pragma once

#include <atomic>
#include <functional>
#include <signal.h>
#include <thread>

namespace livenotes {
namespace utils {

/**
 * Turns SIGINT and SIGTERM into a callback on a dedicated thread.
 *
 * The constructor blocks both signals in the calling thread; threads started
 * afterwards inherit the mask, so the watcher's sigwait() is the only place
 * they are delivered. Construct it before any worker threads and destroy it
 * on the thread that created it, which gets its previous mask back.
 * The callback runs at most once.
 */
class SignalWatcher {
public:
    using Callback = std::function<void(int)>;

    explicit SignalWatcher(Callback callback);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Ends the watcher without running the callback if no signal came in yet
    void stop();

    bool signalled() const { return signalled_; }

private:
    void watch();

    Callback callback_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<bool> stopping_;
    std::atomic<bool> signalled_;
    std::thread thread_;
};

} // namespace utils
} // namespace livenotes
