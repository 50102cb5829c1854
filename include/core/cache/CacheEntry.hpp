#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace whispr {
namespace core {
namespace cache {

// CacheEntry: запись кэша (ключ, локальный путь, время загрузки, размер)
struct CacheEntry {
    std::string originalKey;      // URL или file:// путь (ключ индекса)
    std::string localPath;        // Путь к файлу в кэше
    std::int64_t downloadedAt = 0; // Время загрузки (epoch ms)
    std::uint64_t sizeBytes = 0;  // Размер (байт)
};

inline bool operator==(const CacheEntry& a, const CacheEntry& b) {
    return a.originalKey == b.originalKey && a.localPath == b.localPath &&
           a.downloadedAt == b.downloadedAt && a.sizeBytes == b.sizeBytes;
}

// Формат sidecar-файла: {originalUrl, localPath, downloadTime, fileSize}
inline void to_json(nlohmann::json& j, const CacheEntry& e) {
    j = nlohmann::json{
        {"originalUrl", e.originalKey},
        {"localPath", e.localPath},
        {"downloadTime", e.downloadedAt},
        {"fileSize", e.sizeBytes}
    };
}

// Бросает std::invalid_argument, если время или размер не целые (размер также неотрицательный)
inline void from_json(const nlohmann::json& j, CacheEntry& e) {
    if (!j.at("downloadTime").is_number_integer()) {
        throw std::invalid_argument("downloadTime должен быть целым числом");
    }
    if (!j.at("fileSize").is_number_unsigned()) {
        throw std::invalid_argument("fileSize должен быть неотрицательным целым");
    }
    j.at("originalUrl").get_to(e.originalKey);
    j.at("localPath").get_to(e.localPath);
    j.at("downloadTime").get_to(e.downloadedAt);
    j.at("fileSize").get_to(e.sizeBytes);
}

// CacheIndex: снимок индекса, записи + суммарный размер
struct CacheIndex {
    std::unordered_map<std::string, CacheEntry> entries;
    std::uint64_t currentSizeBytes = 0;

    std::uint64_t recomputeSize() const {
        std::uint64_t total = 0;
        for (const auto& [key, entry] : entries) {
            total += entry.sizeBytes;
        }
        return total;
    }
};

} // namespace cache
} // namespace core
} // namespace whispr
