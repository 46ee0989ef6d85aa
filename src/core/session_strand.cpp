#include "core/session_strand.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livenotes {
namespace core {

SessionStrand::SessionStrand(std::shared_ptr<TaskQueue> task_queue, std::string name)
    : task_queue_(std::move(task_queue)), name_(std::move(name)), scheduled_(false) {
}

void SessionStrand::post(Task job) {
    if (!job) {
        return;
    }

    bool needs_schedule = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
        if (!scheduled_) {
            scheduled_ = true;
            needs_schedule = true;
        }
    }

    if (needs_schedule) {
        schedule();
    }
}

size_t SessionStrand::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool SessionStrand::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !scheduled_ && jobs_.empty();
}

void SessionStrand::schedule() {
    auto self = shared_from_this();
    if (task_queue_ && task_queue_->enqueue([self]() { self->runNext(); })) {
        return;
    }

    // The pool no longer accepts work: finish what was posted on this thread
    // so close jobs still run.
    utils::Logger::warn("Worker queue unavailable, draining strand " + name_ + " inline");
    while (true) {
        Task job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (jobs_.empty()) {
                scheduled_ = false;
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        runJob(job);
    }
}

void SessionStrand::runNext() {
    Task job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.empty()) {
            scheduled_ = false;
            return;
        }
        job = std::move(jobs_.front());
        jobs_.pop_front();
    }

    runJob(job);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.empty()) {
            scheduled_ = false;
            return;
        }
    }
    schedule();
}

void SessionStrand::runJob(Task& job) {
    try {
        job();
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "strand job", name_);
    }
}

} // namespace core
} // namespace livenotes
