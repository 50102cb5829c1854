#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

// Определение платформо-зависимых макросов
#if defined(__linux__)
    #define WHISPR_PLATFORM_LINUX
    #include <pthread.h>
#endif

namespace whispr {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Активные потоки
    size_t queueSize;        // Размер очереди
    size_t totalThreads;     // Всего потоков
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 4;            // Потоки
    size_t queueSize = 256;            // Макс. очередь
    std::string name = "whispr-pool";  // Префикс имени потоков

    bool validate() const {
        return threadCount > 0 && queueSize > 0;
    }
};

// Пул потоков фиксированного размера с ограниченной очередью
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    bool enqueue(std::function<void()> task); // Добавить задачу (false: очередь полна или пул остановлен)
    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул
    bool isStopped() const; // Пул остановлен?
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace whispr
