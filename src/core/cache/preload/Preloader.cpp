#include "core/cache/preload/Preloader.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <set>
#include <utility>

namespace whispr {
namespace core {
namespace cache {

namespace {

// Сбрасывает флаг single-flight на любом пути выхода
class InProgressGuard {
public:
    explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InProgressGuard() { flag_.store(false); }
    InProgressGuard(const InProgressGuard&) = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;
private:
    std::atomic<bool>& flag_;
};

} // namespace

Preloader::Preloader(FetchFunction fetch, std::shared_ptr<thread::ThreadPool> pool)
    : fetch_(std::move(fetch)), pool_(std::move(pool)) {}

std::vector<size_t> Preloader::windowIndices(size_t trackCount, size_t currentIndex, size_t windowSize) {
    std::set<size_t> indices;
    // Индекс за концом списка: вперёд смотреть некуда, currentIndex + offset мог бы переполниться
    if (currentIndex < trackCount) {
        for (size_t offset = 1; offset <= windowSize; ++offset) {
            size_t i = currentIndex + offset;
            if (i >= trackCount) {
                break;
            }
            indices.insert(i);
        }
    }
    // Прогрев начала списка
    if (currentIndex < windowSize) {
        for (size_t i = 0; i < windowSize && i < trackCount; ++i) {
            if (i != currentIndex) {
                indices.insert(i);
            }
        }
    }
    return std::vector<size_t>(indices.begin(), indices.end());
}

bool Preloader::preload(const std::vector<AudioTrack>& tracks, size_t currentIndex, size_t windowSize) {
    bool expected = false;
    if (!inProgress_.compare_exchange_strong(expected, true)) {
        ++batchesDropped_;
        spdlog::debug("Preloader: предзагрузка уже выполняется, вызов отброшен");
        return false;
    }
    InProgressGuard guard(inProgress_);
    ++batchesStarted_;

    try {
        auto indices = windowIndices(tracks.size(), currentIndex, windowSize);
        runBatch(tracks, indices);
    } catch (const std::exception& e) {
        spdlog::error("Preloader: ошибка предзагрузки: {}", e.what());
    }
    return true;
}

void Preloader::runBatch(const std::vector<AudioTrack>& tracks, const std::vector<size_t>& indices) {
    std::vector<std::future<void>> pending;
    pending.reserve(indices.size());

    for (size_t index : indices) {
        const AudioTrack& track = tracks[index];
        if (track.url.empty()) {
            continue;
        }
        auto promise = std::make_shared<std::promise<void>>();
        pending.push_back(promise->get_future());
        auto task = [this, promise, url = track.url, id = track.id]() {
            try {
                fetch_(url);
                spdlog::debug("Preloader: трек предзагружен: {}", id);
            } catch (const std::exception& e) {
                spdlog::warn("Preloader: не удалось предзагрузить {}: {}", id, e.what());
            }
            promise->set_value();
        };
        ++tracksRequested_;
        if (!pool_ || !pool_->enqueue(task)) {
            // Пул недоступен: выполняем в текущем потоке
            task();
        }
    }

    // Ждём все задачи, ошибки отдельных загрузок не прерывают остальные
    for (auto& future : pending) {
        future.wait();
    }
    spdlog::info("Preloader: пакет завершён, треков: {}", pending.size());
}

bool Preloader::isPreloading() const {
    return inProgress_.load();
}

PreloadMetrics Preloader::getMetrics() const {
    return PreloadMetrics{batchesStarted_.load(), batchesDropped_.load(), tracksRequested_.load()};
}

} // namespace cache
} // namespace core
} // namespace whispr
