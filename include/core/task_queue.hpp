#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace livenotes {
namespace core {

using Task = std::function<void()>;

/**
 * Shared FIFO of pool jobs. Session strands and close jobs are pushed here and
 * drained by the ThreadPool workers in arrival order.
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    // False once shutdown() was called; the job is dropped
    bool enqueue(Task task);

    // Blocks for the next job. An empty Task means shut down and drained.
    Task dequeue();

    // Empty Task when nothing is queued
    Task tryDequeue();

    size_t size() const;
    bool empty() const;

    // Stops intake and wakes blocked workers. Queued jobs are still handed out.
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Workers that run external-service calls off the event loop. The pool size
 * bounds how many sessions can wait on a remote call at the same time.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    // Shuts the queue down, runs what is left and joins the workers
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
};

} // namespace core
} // namespace livenotes
