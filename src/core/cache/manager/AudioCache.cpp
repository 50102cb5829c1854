#include "core/cache/manager/AudioCache.hpp"
#include "core/cache/codec/KeyCodec.hpp"
#include "core/cache/manager/EvictionManager.hpp"
#include "core/cache/manager/MetadataStore.hpp"
#include "core/io/NativeFileSystem.hpp"
#include "core/thread/ThreadPool.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace whispr {
namespace core {
namespace cache {

namespace {

std::shared_ptr<io::IFileSystem> makeNativeFileSystem(const CacheConfig& config) {
    io::CurlDownloaderConfig downloaderConfig;
    downloaderConfig.timeoutSeconds = config.transferTimeoutSeconds;
    downloaderConfig.userAgent = config.userAgent;
    return std::make_shared<io::NativeFileSystem>(downloaderConfig);
}

MetadataStoreConfig makeStoreConfig(const CacheConfig& config) {
    MetadataStoreConfig storeConfig;
    storeConfig.cacheDirectory = config.cacheDirectory;
    storeConfig.metadataFileName = config.metadataFileName;
    storeConfig.atomicWrite = config.atomicMetadataWrite;
    storeConfig.recomputeSizeOnLoad = config.recomputeSizeOnLoad;
    return storeConfig;
}

} // namespace

// Реализация PIMPL
struct AudioCache::Impl {
    AudioCache& owner;
    CacheConfig config;
    std::shared_ptr<io::IFileSystem> fileSystem;
    MetadataStore store;
    EvictionManager eviction;
    ResourceFetcher fetcher;
    std::shared_ptr<thread::ThreadPool> pool;
    std::unique_ptr<Preloader> preloader;

    std::mutex initMutex;
    std::atomic<bool> initialized{false};
    std::mutex admissionMutex; // Вытеснение + вставка + сохранение, clearCache
    std::mutex inflightMutex;
    std::unordered_map<std::string, std::shared_future<std::string>> inflight; // Загрузки в процессе

    std::atomic<size_t> hitCount{0};
    std::atomic<size_t> missCount{0};
    std::atomic<size_t> evictionCount{0};

    Impl(AudioCache& self, const CacheConfig& cfg, std::shared_ptr<io::IFileSystem> fs, ResourceFetcher::Clock clock)
        : owner(self),
          config(cfg),
          fileSystem(fs ? std::move(fs) : makeNativeFileSystem(cfg)),
          store(fileSystem, makeStoreConfig(cfg)),
          eviction(store, fileSystem),
          fetcher(fileSystem, std::move(clock)) {}

    bool initialize();
    std::optional<std::string> lookup(const std::string& key);
    std::string fetchShared(const std::string& key);
    std::string fetchAndAdmit(const std::string& key);
    void admit(const CacheEntry& entry);
};

std::optional<std::string> AudioCache::Impl::lookup(const std::string& key) {
    auto cached = store.find(key);
    if (!cached) {
        return std::nullopt;
    }
    try {
        auto info = fileSystem->stat(cached->localPath);
        if (info.exists && !info.isDirectory) {
            spdlog::debug("AudioCache: используется кэш для {}", key);
            return cached->localPath;
        }
        // Файл удалён в обход кэша: убираем висячую запись и загружаем заново
        spdlog::info("AudioCache: файл {} не найден, запись удалена: {}", cached->localPath, key);
    } catch (const std::exception& e) {
        spdlog::warn("AudioCache: ошибка stat {}, запись удалена: {}: {}", cached->localPath, key, e.what());
    }
    store.erase(key);
    if (!store.save()) {
        spdlog::error("AudioCache: не удалось сохранить индекс после удаления висячей записи");
    }
    return std::nullopt;
}

std::string AudioCache::Impl::fetchShared(const std::string& key) {
    std::shared_ptr<std::promise<std::string>> promise;
    std::shared_future<std::string> future;
    {
        std::lock_guard<std::mutex> lock(inflightMutex);
        auto it = inflight.find(key);
        if (it != inflight.end()) {
            future = it->second;
        } else {
            promise = std::make_shared<std::promise<std::string>>();
            future = promise->get_future().share();
            inflight.emplace(key, future);
        }
    }
    if (!promise) {
        spdlog::debug("AudioCache: ожидание загрузки в процессе: {}", key);
        return future.get();
    }

    std::string result = key;
    try {
        result = fetchAndAdmit(key);
    } catch (const std::exception& e) {
        spdlog::error("AudioCache: ошибка загрузки {}: {}", key, e.what());
        result = key;
    }
    {
        std::lock_guard<std::mutex> lock(inflightMutex);
        inflight.erase(key);
    }
    promise->set_value(result);
    return result;
}

std::string AudioCache::Impl::fetchAndAdmit(const std::string& key) {
    const auto destination = KeyCodec::localPathFor(key, config.cacheDirectory);
    auto entry = fetcher.fetch(key, destination);
    if (!entry) {
        return key;
    }
    admit(*entry);
    return entry->localPath;
}

void AudioCache::Impl::admit(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(admissionMutex);
    // Новая запись заменяет прежнюю для того же ключа
    if (auto previous = store.erase(entry.originalKey)) {
        if (previous->localPath != entry.localPath && !fileSystem->remove(previous->localPath)) {
            spdlog::warn("AudioCache: не удалось удалить прежний файл {}", previous->localPath);
        }
    }
    evictionCount += eviction.reclaim(entry.sizeBytes, config.maxCacheSize, entry.localPath);
    store.put(entry);
    if (!store.save()) {
        spdlog::error("AudioCache: не удалось сохранить индекс после добавления {}", entry.originalKey);
    }
    spdlog::info("AudioCache: закэширован {} ({:.2f} MB)", entry.originalKey,
                 static_cast<double>(entry.sizeBytes) / 1024.0 / 1024.0);
}

AudioCache::AudioCache(const CacheConfig& config, std::shared_ptr<io::IFileSystem> fileSystem,
                       ResourceFetcher::Clock clock) {
    if (!config.validate()) {
        throw std::invalid_argument("AudioCache: некорректная конфигурация кэша");
    }
    pImpl = std::make_unique<Impl>(*this, config, std::move(fileSystem), std::move(clock));
    spdlog::info("AudioCache создан: cacheDirectory='{}', maxCacheSize={}", config.cacheDirectory,
                 config.maxCacheSize);
}

AudioCache::~AudioCache() {
    shutdown();
}

bool AudioCache::Impl::initialize() {
    if (initialized) {
        return true;
    }
    std::lock_guard<std::mutex> lock(initMutex);
    if (initialized) {
        return true;
    }
    try {
        if (!store.ensureDirectory()) {
            return false;
        }
        store.load();

        thread::ThreadPoolConfig poolConfig;
        poolConfig.threadCount = config.preloadThreads;
        poolConfig.name = "whispr-preload";
        pool = std::make_shared<thread::ThreadPool>(poolConfig);
        AudioCache* self = &owner;
        preloader = std::make_unique<Preloader>(
            [self](const std::string& url) { return self->getCachedAudioUrl(url); }, pool);

        initialized = true;
        spdlog::info("AudioCache инициализирован: {} файлов, {} байт", store.count(), store.currentSize());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("AudioCache: ошибка инициализации: {}", e.what());
        return false;
    }
}

bool AudioCache::initialize() {
    return pImpl->initialize();
}

std::string AudioCache::getCachedAudioUrl(const std::string& key) {
    if (key.empty()) {
        spdlog::warn("AudioCache: передан пустой ключ");
        return key;
    }
    try {
        if (!initialize()) {
            return key;
        }
        if (auto localPath = pImpl->lookup(key)) {
            ++pImpl->hitCount;
            return *localPath;
        }
        ++pImpl->missCount;
        return pImpl->fetchShared(key);
    } catch (const std::exception& e) {
        spdlog::error("AudioCache: ошибка getCachedAudioUrl для {}: {}", key, e.what());
        return key;
    }
}

void AudioCache::clearCache() {
    try {
        if (!initialize()) {
            return;
        }
        std::lock_guard<std::mutex> lock(pImpl->admissionMutex);
        auto removed = pImpl->store.clear();
        for (const auto& entry : removed) {
            if (!pImpl->fileSystem->remove(entry.localPath)) {
                spdlog::warn("AudioCache: не удалось удалить {} ({})", entry.localPath, entry.originalKey);
            }
        }
        if (!pImpl->store.save()) {
            spdlog::error("AudioCache: не удалось сохранить пустой индекс");
        }
        spdlog::info("AudioCache: кэш очищен, удалено записей: {}", removed.size());
    } catch (const std::exception& e) {
        spdlog::error("AudioCache: ошибка очистки кэша: {}", e.what());
    }
}

CacheStats AudioCache::getCacheStats() const {
    // Индекс с диска нужен и для статистики
    if (!pImpl->initialize()) {
        spdlog::warn("AudioCache: статистика без загруженного индекса");
    }
    CacheStats stats;
    stats.fileCount = pImpl->store.count();
    stats.totalSize = pImpl->store.currentSize();
    stats.maxSize = pImpl->config.maxCacheSize;
    stats.usagePercentage = stats.maxSize > 0
        ? static_cast<double>(stats.totalSize) / static_cast<double>(stats.maxSize) * 100.0
        : 0.0;
    stats.hitCount = pImpl->hitCount.load();
    stats.missCount = pImpl->missCount.load();
    stats.evictionCount = pImpl->evictionCount.load();
    return stats;
}

bool AudioCache::preloadTracks(const std::vector<AudioTrack>& tracks, size_t currentIndex) {
    return preloadTracks(tracks, currentIndex, pImpl->config.preloadCount);
}

bool AudioCache::preloadTracks(const std::vector<AudioTrack>& tracks, size_t currentIndex, size_t windowSize) {
    try {
        if (!initialize()) {
            return false;
        }
        return pImpl->preloader->preload(tracks, currentIndex, windowSize);
    } catch (const std::exception& e) {
        spdlog::error("AudioCache: ошибка предзагрузки: {}", e.what());
        return false;
    }
}

bool AudioCache::isPreloading() const {
    return pImpl->preloader && pImpl->preloader->isPreloading();
}

PreloadMetrics AudioCache::getPreloadMetrics() const {
    return pImpl->preloader ? pImpl->preloader->getMetrics() : PreloadMetrics{};
}

CacheConfig AudioCache::getConfiguration() const {
    return pImpl->config;
}

void AudioCache::shutdown() {
    if (pImpl && pImpl->pool) {
        pImpl->pool->stop();
    }
}

} // namespace cache
} // namespace core
} // namespace whispr
