#include "core/cache/manager/EvictionManager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>
#include <vector>

namespace whispr {
namespace core {
namespace cache {

EvictionManager::EvictionManager(MetadataStore& store, std::shared_ptr<io::IFileSystem> fileSystem)
    : store_(store), fileSystem_(std::move(fileSystem)) {}

size_t EvictionManager::reclaim(std::uint64_t incomingSize, std::uint64_t capacity,
                                const std::string& incomingPath) {
    if (store_.currentSize() + incomingSize <= capacity) {
        return 0;
    }

    spdlog::info("EvictionManager: освобождение места: current={}, incoming={}, capacity={}",
                 store_.currentSize(), incomingSize, capacity);

    // Самые старые первыми, при равенстве времени: по ключу
    auto candidates = store_.snapshot();
    std::sort(candidates.begin(), candidates.end(), [](const CacheEntry& a, const CacheEntry& b) {
        if (a.downloadedAt != b.downloadedAt) return a.downloadedAt < b.downloadedAt;
        return a.originalKey < b.originalKey;
    });

    size_t evicted = 0;
    for (const auto& candidate : candidates) {
        if (!incomingPath.empty() && candidate.localPath == incomingPath) {
            // Коллизия хэша: файл уже перезаписан новой записью, удалять нельзя
            spdlog::warn("EvictionManager: пропуск {}, путь совпадает с новой записью {}", candidate.originalKey, incomingPath);
            continue;
        }
        if (!fileSystem_->remove(candidate.localPath)) {
            // Файл остаётся на диске и в индексе, переходим к следующему кандидату
            spdlog::error("EvictionManager: не удалось удалить {} ({})", candidate.localPath, candidate.originalKey);
            continue;
        }
        store_.erase(candidate.originalKey);
        ++evicted;
        spdlog::info("EvictionManager: вытеснен {} ({} байт)", candidate.originalKey, candidate.sizeBytes);

        if (store_.currentSize() + incomingSize <= capacity) {
            break;
        }
    }

    if (store_.currentSize() + incomingSize > capacity) {
        spdlog::warn("EvictionManager: кандидаты исчерпаны, запись {} байт будет принята сверх лимита {}",
                     incomingSize, capacity);
    }

    if (!store_.save()) {
        spdlog::error("EvictionManager: не удалось сохранить индекс после вытеснения");
    }
    return evicted;
}

} // namespace cache
} // namespace core
} // namespace whispr
