#include "core/thread/ThreadPool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace whispr {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;
    std::condition_variable taskCv;      // Новая задача или остановка
    std::condition_variable completionCv; // Очередь пуста и нет активных задач
    std::atomic<size_t> activeThreads{0};
    bool stopping = false;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    void workerLoop(size_t index) {
#ifdef WHISPR_PLATFORM_LINUX
        // Имя потока ограничено 15 символами
        std::string threadName = (config.name + "-" + std::to_string(index)).substr(0, 15);
        pthread_setname_np(pthread_self(), threadName.c_str());
#endif
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                taskCv.wait(lock, [this] { return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("ThreadPool: задача завершилась исключением: {}", e.what());
            }
            {
                std::lock_guard<std::mutex> lock(queueMutex);
                --activeThreads;
                if (tasks.empty() && activeThreads == 0) {
                    completionCv.notify_all();
                }
            }
        }
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: некорректная конфигурация");
    }
    pImpl->workers.reserve(config.threadCount);
    for (size_t i = 0; i < config.threadCount; ++i) {
        pImpl->workers.emplace_back([this, i] { pImpl->workerLoop(i); });
    }
    spdlog::debug("ThreadPool: запущено {} потоков, очередь={}", config.threadCount, config.queueSize);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stopping) {
            spdlog::warn("ThreadPool: задача отклонена, пул остановлен");
            return false;
        }
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            spdlog::warn("ThreadPool: задача отклонена, очередь заполнена ({})", pImpl->config.queueSize);
            return false;
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->completionCv.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads == 0;
    });
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return;
        }
        pImpl->stopping = true;
    }
    pImpl->taskCv.notify_all();
    for (auto& worker : pImpl->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    pImpl->workers.clear();
    pImpl->completionCv.notify_all();
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stopping;
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return ThreadPoolMetrics{pImpl->activeThreads.load(), pImpl->tasks.size(), pImpl->workers.size()};
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace whispr
