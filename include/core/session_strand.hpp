#pragma once

#include "core/task_queue.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace livenotes {
namespace core {

/**
 * Serializes the work of one session on the shared worker pool.
 *
 * Jobs posted to a strand run one at a time, in posting order. Different
 * strands run concurrently on different workers. After each job the strand
 * goes back to the end of the pool queue so a busy session does not starve
 * the others.
 */
class SessionStrand : public std::enable_shared_from_this<SessionStrand> {
public:
    SessionStrand(std::shared_ptr<TaskQueue> task_queue, std::string name);

    SessionStrand(const SessionStrand&) = delete;
    SessionStrand& operator=(const SessionStrand&) = delete;

    void post(Task job);

    size_t pending() const;
    bool isIdle() const;
    const std::string& getName() const { return name_; }

private:
    void schedule();
    void runNext();
    void runJob(Task& job);

    std::shared_ptr<TaskQueue> task_queue_;
    std::string name_;

    mutable std::mutex mutex_;
    std::deque<Task> jobs_;
    bool scheduled_;
};

} // namespace core
} // namespace livenotes
