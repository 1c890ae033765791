#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace soksak {
namespace core {

namespace {
std::atomic<uint64_t> g_nextSequence{0};
thread_local bool t_isPoolWorker = false;
}

Task::Task(TaskPriority priority, std::string name)
    : priority_(priority)
    , sequence_(g_nextSequence.fetch_add(1))
    , created_at_(std::chrono::steady_clock::now())
    , name_(std::move(name)) {
}

TaskQueue::TaskQueue() : shutdown_(false) {
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
        queue_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> func, TaskPriority priority, const std::string& name) {
    return enqueue(std::make_shared<FunctionTask>(std::move(func), priority, name));
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
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.swap(dropped);
    }
    // dropped tasks are destroyed here, outside the lock
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
    : num_threads_(num_threads == 0 ? 1 : num_threads)
    , running_(false)
    , active_threads_(0)
    , completed_tasks_(0)
    , failed_tasks_(0) {
}

ThreadPool::~ThreadPool() {
    try {
        stop();
    } catch (const std::exception& e) {
        utils::Logger::error(std::string("Thread pool shutdown failed: ") + e.what());
    }
}

bool ThreadPool::isWorkerThread() {
    return t_isPoolWorker;
}

void ThreadPool::start(std::shared_ptr<TaskQueue> task_queue) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = std::move(task_queue);
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this, task_queue_);
    }
    utils::Logger::debug("Thread pool started with " + std::to_string(num_threads_) + " workers");
}

void ThreadPool::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) {
        return;
    }

    if (task_queue_) {
        task_queue_->shutdown();
    }

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == self) {
            worker.detach();
        } else {
            worker.join();
        }
    }

    running_ = false;
    workers_.clear();
    task_queue_.reset();
}

void ThreadPool::workerLoop(std::shared_ptr<TaskQueue> task_queue) {
    t_isPoolWorker = true;
    for (;;) {
        auto task = task_queue->dequeue();
        if (!task) {
            break;
        }

        active_threads_++;
        try {
            task->execute();
            completed_tasks_++;
        } catch (const std::exception& e) {
            failed_tasks_++;
            utils::Logger::error("Task '" + task->getName() + "' failed: " + e.what());
        } catch (...) {
            failed_tasks_++;
            utils::Logger::error("Task '" + task->getName() + "' failed with a non-standard exception");
        }
        active_threads_--;
    }
}

} // namespace core
} // namespace soksak
