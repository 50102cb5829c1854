#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheEntry.hpp"
#include "core/io/FileSystem.hpp"

namespace whispr {
namespace core {
namespace cache {

// MetadataStoreConfig: где и как хранить sidecar-файл индекса
struct MetadataStoreConfig {
    std::string cacheDirectory;
    std::string metadataFileName = "metadata.json";
    bool atomicWrite = true;     // tmp-файл + rename
    bool recomputeSizeOnLoad = true;
};

// MetadataStore: индекс кэша в памяти + JSON sidecar (metadata.json).
// Владеет счётчиком currentCacheSize; размер пересчитывается при каждом изменении.
// Потокобезопасен.
class MetadataStore {
public:
    MetadataStore(std::shared_ptr<io::IFileSystem> fileSystem, const MetadataStoreConfig& config);

    bool ensureDirectory(); // Создать директорию кэша
    CacheIndex load();      // Загрузить sidecar и установить индекс (ошибки -> пустой индекс)
    bool save();            // Сохранить текущий индекс

    std::optional<CacheEntry> find(const std::string& key) const;
    void put(const CacheEntry& entry); // Вставить или заменить
    std::optional<CacheEntry> erase(const std::string& key);
    std::vector<CacheEntry> clear(); // Очистить, вернуть удалённые записи
    std::vector<CacheEntry> snapshot() const;
    std::uint64_t currentSize() const;
    size_t count() const;

    std::string metadataPath() const;

    // Сериализация в формат sidecar (записи упорядочены по downloadTime)
    static nlohmann::json serialize(const CacheIndex& index);
    // Бросает nlohmann::json::exception / std::invalid_argument при неверной структуре
    static CacheIndex deserialize(const nlohmann::json& j, bool recomputeSize);

private:
    std::shared_ptr<io::IFileSystem> fileSystem_;
    MetadataStoreConfig config_;
    CacheIndex index_;
    mutable std::shared_mutex indexMutex_;
    std::mutex saveMutex_; // Сериализует запись sidecar
};

} // namespace cache
} // namespace core
} // namespace whispr
