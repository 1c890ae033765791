#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace soksak {
namespace core {

/**
 * Priority levels for tasks in the queue
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * Base task interface
 */
class Task {
public:
    explicit Task(TaskPriority priority = TaskPriority::NORMAL, std::string name = "");
    virtual ~Task() = default;

    virtual void execute() = 0;

    TaskPriority getPriority() const { return priority_; }
    uint64_t getSequence() const { return sequence_; }
    std::chrono::steady_clock::time_point getCreatedAt() const { return created_at_; }
    const std::string& getName() const { return name_; }

private:
    TaskPriority priority_;
    uint64_t sequence_;
    std::chrono::steady_clock::time_point created_at_;
    std::string name_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL,
                 std::string name = "")
        : Task(priority, std::move(name)), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Higher priority first; submission order within a priority.
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

    /**
     * Add a task to the queue. Returns false once the queue is shut down,
     * in which case the task is dropped.
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL,
                 const std::string& name = "");

    /**
     * Get the next task (blocks while empty). After shutdown the remaining
     * tasks are still handed out; nullptr once the queue is drained.
     */
    std::shared_ptr<Task> dequeue();

    // Returns nullptr if queue is empty
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;

    /**
     * Drop all pending tasks without running them
     */
    void clear();

    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Thread pool executing tasks from a TaskQueue. An exception escaping a task
 * is logged and the worker keeps running.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down, let workers drain what is already queued and
     * join them. Called from one of the pool's own tasks, that worker is
     * detached instead and exits once its task returns; the pool must then
     * outlive the task.
     */
    void stop();

    // True on a thread currently owned by any ThreadPool
    static bool isWorkerThread();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const { return active_threads_; }
    uint64_t getCompletedTasks() const { return completed_tasks_; }
    uint64_t getFailedTasks() const { return failed_tasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop(std::shared_ptr<TaskQueue> task_queue);

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<uint64_t> completed_tasks_;
    std::atomic<uint64_t> failed_tasks_;
    std::mutex lifecycle_mutex_;
};

} // namespace core
} // namespace soksak
