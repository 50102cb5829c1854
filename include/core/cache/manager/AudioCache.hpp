#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/metrics/CacheStats.hpp"
#include "core/cache/manager/ResourceFetcher.hpp"
#include "core/cache/preload/Preloader.hpp"
#include "core/io/FileSystem.hpp"

namespace whispr {
namespace core {
namespace cache {

// AudioCache: дисковый кэш аудио с ограничением размера.
// Один экземпляр на процесс, создаётся при старте и передаётся потребителям явно.
// Публичные операции не бросают исключений: при любой ошибке возвращается исходный ключ.
class AudioCache {
public:
    // fileSystem == nullptr: NativeFileSystem (std::filesystem + libcurl).
    // Бросает std::invalid_argument при некорректной конфигурации.
    explicit AudioCache(const CacheConfig& config,
                        std::shared_ptr<io::IFileSystem> fileSystem = nullptr,
                        ResourceFetcher::Clock clock = {});
    ~AudioCache();
    AudioCache(const AudioCache&) = delete;
    AudioCache& operator=(const AudioCache&) = delete;

    bool initialize(); // Директория + загрузка индекса; повторный вызов безопасен

    // Локальный путь закэшированного файла либо исходный ключ, если закэшировать не удалось
    std::string getCachedAudioUrl(const std::string& key);
    void clearCache(); // Удалить все файлы и обнулить индекс
    CacheStats getCacheStats() const; // Статистика

    // Прогрев окна треков вокруг currentIndex. false: пакет уже выполняется
    bool preloadTracks(const std::vector<AudioTrack>& tracks, size_t currentIndex);
    bool preloadTracks(const std::vector<AudioTrack>& tracks, size_t currentIndex, size_t windowSize);
    bool isPreloading() const;
    PreloadMetrics getPreloadMetrics() const;

    CacheConfig getConfiguration() const; // Получить конфиг
    void shutdown(); // Завершение работы
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace whispr
