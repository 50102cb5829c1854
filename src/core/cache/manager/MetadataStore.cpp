#include "core/cache/manager/MetadataStore.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace whispr {
namespace core {
namespace cache {

MetadataStore::MetadataStore(std::shared_ptr<io::IFileSystem> fileSystem, const MetadataStoreConfig& config)
    : fileSystem_(std::move(fileSystem)), config_(config) {}

std::string MetadataStore::metadataPath() const {
    return (std::filesystem::path(config_.cacheDirectory) / config_.metadataFileName).string();
}

bool MetadataStore::ensureDirectory() {
    auto info = fileSystem_->stat(config_.cacheDirectory);
    if (info.exists && info.isDirectory) {
        return true;
    }
    if (!fileSystem_->makeDirectory(config_.cacheDirectory)) {
        spdlog::error("MetadataStore: не удалось создать директорию кэша {}", config_.cacheDirectory);
        return false;
    }
    spdlog::info("MetadataStore: создана директория кэша {}", config_.cacheDirectory);
    return true;
}

nlohmann::json MetadataStore::serialize(const CacheIndex& index) {
    std::vector<const CacheEntry*> ordered;
    ordered.reserve(index.entries.size());
    for (const auto& [key, entry] : index.entries) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), [](const CacheEntry* a, const CacheEntry* b) {
        if (a->downloadedAt != b->downloadedAt) return a->downloadedAt < b->downloadedAt;
        return a->originalKey < b->originalKey;
    });

    nlohmann::json files = nlohmann::json::array();
    for (const auto* entry : ordered) {
        files.push_back(nlohmann::json::array({entry->originalKey, *entry}));
    }
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return {
        {"cachedFiles", files},
        {"currentCacheSize", index.currentSizeBytes},
        {"timestamp", now}
    };
}

CacheIndex MetadataStore::deserialize(const nlohmann::json& j, bool recomputeSize) {
    CacheIndex index;
    const auto& files = j.at("cachedFiles");
    if (!files.is_array()) {
        throw std::invalid_argument("cachedFiles должен быть массивом");
    }
    for (const auto& pair : files) {
        if (!pair.is_array() || pair.size() != 2) {
            throw std::invalid_argument("элемент cachedFiles должен быть парой [key, entry]");
        }
        auto key = pair.at(0).get<std::string>();
        auto entry = pair.at(1).get<CacheEntry>();
        entry.originalKey = key;
        if (entry.sizeBytes == 0) {
            spdlog::warn("MetadataStore: пропущена запись нулевого размера: {}", key);
            continue;
        }
        index.entries[key] = std::move(entry);
    }

    if (j.contains("currentCacheSize") && !j.at("currentCacheSize").is_number_unsigned()) {
        throw std::invalid_argument("currentCacheSize должен быть неотрицательным целым");
    }
    std::uint64_t declared = j.value("currentCacheSize", std::uint64_t{0});
    std::uint64_t actual = index.recomputeSize();
    if (declared != actual) {
        spdlog::warn("MetadataStore: currentCacheSize={} расходится с суммой записей={}", declared, actual);
    }
    index.currentSizeBytes = recomputeSize ? actual : declared;
    return index;
}

CacheIndex MetadataStore::load() {
    CacheIndex loaded;
    const auto path = metadataPath();
    try {
        auto info = fileSystem_->stat(path);
        if (info.exists) {
            auto content = fileSystem_->readText(path);
            if (!content) {
                spdlog::error("MetadataStore: не удалось прочитать {}", path);
            } else {
                loaded = deserialize(nlohmann::json::parse(*content), config_.recomputeSizeOnLoad);
                spdlog::info("MetadataStore: загружено {} записей, currentCacheSize={}",
                             loaded.entries.size(), loaded.currentSizeBytes);
            }
        } else {
            spdlog::info("MetadataStore: {} отсутствует, индекс пуст", path);
        }
    } catch (const std::exception& e) {
        spdlog::error("MetadataStore: повреждённые метаданные {}: {}", path, e.what());
        loaded = CacheIndex{};
    }

    std::unique_lock<std::shared_mutex> lock(indexMutex_);
    index_ = loaded;
    return loaded;
}

bool MetadataStore::save() {
    std::lock_guard<std::mutex> saveLock(saveMutex_);
    std::string payload;
    try {
        std::shared_lock<std::shared_mutex> lock(indexMutex_);
        payload = serialize(index_).dump();
    } catch (const std::exception& e) {
        spdlog::error("MetadataStore: ошибка сериализации индекса: {}", e.what());
        return false;
    }

    const auto path = metadataPath();
    if (!config_.atomicWrite) {
        // Одна запись целиком: обрыв посередине оставит файл, который load() распознает как повреждённый
        if (!fileSystem_->writeText(path, payload)) {
            spdlog::error("MetadataStore: не удалось записать {}", path);
            return false;
        }
        return true;
    }

    const auto tmpPath = path + ".tmp";
    if (!fileSystem_->writeText(tmpPath, payload)) {
        spdlog::error("MetadataStore: не удалось записать {}", tmpPath);
        return false;
    }
    if (!fileSystem_->move(tmpPath, path)) {
        spdlog::error("MetadataStore: не удалось переименовать {} -> {}", tmpPath, path);
        if (!fileSystem_->remove(tmpPath)) {
            spdlog::warn("MetadataStore: не удалось удалить {}", tmpPath);
        }
        return false;
    }
    return true;
}

std::optional<CacheEntry> MetadataStore::find(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    auto it = index_.entries.find(key);
    if (it == index_.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MetadataStore::put(const CacheEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(indexMutex_);
    index_.entries[entry.originalKey] = entry;
    index_.currentSizeBytes = index_.recomputeSize();
}

std::optional<CacheEntry> MetadataStore::erase(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(indexMutex_);
    auto it = index_.entries.find(key);
    if (it == index_.entries.end()) {
        return std::nullopt;
    }
    CacheEntry removed = std::move(it->second);
    index_.entries.erase(it);
    index_.currentSizeBytes = index_.recomputeSize();
    return removed;
}

std::vector<CacheEntry> MetadataStore::clear() {
    std::unique_lock<std::shared_mutex> lock(indexMutex_);
    std::vector<CacheEntry> removed;
    removed.reserve(index_.entries.size());
    for (auto& [key, entry] : index_.entries) {
        removed.push_back(std::move(entry));
    }
    index_.entries.clear();
    index_.currentSizeBytes = 0;
    return removed;
}

std::vector<CacheEntry> MetadataStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    std::vector<CacheEntry> entries;
    entries.reserve(index_.entries.size());
    for (const auto& [key, entry] : index_.entries) {
        entries.push_back(entry);
    }
    return entries;
}

std::uint64_t MetadataStore::currentSize() const {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    return index_.currentSizeBytes;
}

size_t MetadataStore::count() const {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    return index_.entries.size();
}

} // namespace cache
} // namespace core
} // namespace whispr
