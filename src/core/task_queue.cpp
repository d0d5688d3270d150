#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace livetranslate {
namespace core {

TaskQueue::TaskQueue() : shutdown_(false), next_sequence_(0) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::shared_ptr<Task> task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        task->setSequence(next_sequence_++);
        queue_.push(task);
    }
    condition_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> func, TaskPriority priority) {
    return enqueue(std::make_shared<FunctionTask>(std::move(func), priority));
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);

    condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.top();
    queue_.pop();
    return task;
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.top();
    queue_.pop();
    return task;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> empty_queue;
    queue_.swap(empty_queue);
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condition_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

// ThreadPool implementation

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads), running_(false), active_threads_(0) {
    if (num_threads_ == 0) {
        num_threads_ = 1;
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> task_queue) {
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = task_queue;
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
    utils::Logger::debug("Thread pool started with " + std::to_string(num_threads_) + " workers");
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    if (task_queue_) {
        task_queue_->shutdown();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
    task_queue_.reset();
}

size_t ThreadPool::getActiveThreads() const {
    return active_threads_;
}

void ThreadPool::workerLoop() {
    // Keeps draining after stop() so accepted tasks are not lost
    while (true) {
        auto task = task_queue_->dequeue();

        if (!task) {
            break;
        }

        active_threads_++;
        try {
            task->execute();
        } catch (const std::exception& e) {
            utils::Logger::error("Unhandled exception in worker task: " + std::string(e.what()));
        }
        active_threads_--;
    }
}

} // namespace core
} // namespace livetranslate
