#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>
#include <cstdint>

namespace livetranslate {
namespace core {

/**
 * Priority levels for tasks in the queue
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

/**
 * Base task interface
 */
class Task {
public:
    Task(TaskPriority priority = TaskPriority::NORMAL)
        : priority_(priority), sequence_(0) {}

    virtual ~Task() = default;
    virtual void execute() = 0;

    TaskPriority getPriority() const { return priority_; }
    uint64_t getSequence() const { return sequence_; }
    void setSequence(uint64_t sequence) { sequence_ = sequence; }

private:
    TaskPriority priority_;
    uint64_t sequence_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL)
        : Task(priority), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Task comparator for priority queue (higher priority first, FIFO within a priority)
 */
struct TaskComparator {
    bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
        if (a->getPriority() != b->getPriority()) {
            return static_cast<int>(a->getPriority()) < static_cast<int>(b->getPriority());
        }
        return a->getSequence() > b->getSequence();
    }
};

/**
 * Thread-safe task queue with priority support
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task to the queue. Returns false when the queue is shutting down.
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Get the next task from the queue (blocks if empty).
     * Returns nullptr once the queue is shut down and drained.
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Non-blocking variant, nullptr if nothing is queued
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Stop accepting tasks and wake all waiting workers
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> queue_;
    std::atomic<bool> shutdown_;
    uint64_t next_sequence_;
};

/**
 * Fixed set of worker threads draining a TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down and join every worker. Tasks already queued still run.
     */
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
} // namespace livetranslate
