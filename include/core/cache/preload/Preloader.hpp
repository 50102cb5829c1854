#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/thread/ThreadPool.hpp"

namespace whispr {
namespace core {
namespace cache {

// AudioTrack: элемент ленты для предзагрузки, url используется как ключ кэша
struct AudioTrack {
    std::string id;
    std::string title;
    std::string artist;
    std::string artwork;
    std::string url;
};

// PreloadMetrics: метрики предзагрузки (пакеты, отброшенные вызовы, прогретые треки)
struct PreloadMetrics {
    size_t batchesStarted = 0;  // Запущено пакетов
    size_t batchesDropped = 0;  // Отброшено (пакет уже выполнялся)
    size_t tracksRequested = 0; // Треков отправлено в кэш
};

// Preloader: прогрев кэша для окна следующих треков.
// Single-flight: пока пакет выполняется, новые вызовы отбрасываются без постановки в очередь.
class Preloader {
public:
    using FetchFunction = std::function<std::string(const std::string&)>;

    Preloader(FetchFunction fetch, std::shared_ptr<thread::ThreadPool> pool);

    // false: вызов отброшен, так как пакет уже выполняется. Блокирует до завершения пакета.
    bool preload(const std::vector<AudioTrack>& tracks, size_t currentIndex, size_t windowSize);
    bool isPreloading() const;
    PreloadMetrics getMetrics() const;

    // Индексы окна: currentIndex+1..currentIndex+windowSize, плюс 0..windowSize-1
    // при currentIndex < windowSize; без currentIndex и без дублей, по возрастанию
    static std::vector<size_t> windowIndices(size_t trackCount, size_t currentIndex, size_t windowSize);

private:
    void runBatch(const std::vector<AudioTrack>& tracks, const std::vector<size_t>& indices);

    FetchFunction fetch_;
    std::shared_ptr<thread::ThreadPool> pool_;
    std::atomic<bool> inProgress_{false};
    std::atomic<size_t> batchesStarted_{0};
    std::atomic<size_t> batchesDropped_{0};
    std::atomic<size_t> tracksRequested_{0};
};

} // namespace cache
} // namespace core
} // namespace whispr
