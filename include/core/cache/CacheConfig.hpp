#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace whispr {
namespace core {
namespace cache {

// Значения по умолчанию
constexpr std::uint64_t DEFAULT_MAX_CACHE_SIZE = 100ULL * 1024 * 1024; // 100 MB
constexpr size_t DEFAULT_PRELOAD_COUNT = 5;

// Уровни, которые понимает spdlog::level::from_str
inline bool isKnownLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "warning" || level == "err" || level == "error" || level == "critical" ||
           level == "off";
}

// CacheConfig: параметры аудиокэша (директория, лимит, предзагрузка, логирование)
struct CacheConfig {
    std::string cacheDirectory = "./cache/whispr-audio"; // Директория кэша
    std::uint64_t maxCacheSize = DEFAULT_MAX_CACHE_SIZE;  // Макс. размер (байт)
    size_t preloadCount = DEFAULT_PRELOAD_COUNT;          // Окно предзагрузки
    size_t preloadThreads = 4;                            // Потоки предзагрузки
    std::string metadataFileName = "metadata.json";      // Sidecar-файл индекса
    bool atomicMetadataWrite = true;                      // Запись через tmp + rename
    bool recomputeSizeOnLoad = true;                      // Пересчитывать размер при загрузке
    long transferTimeoutSeconds = 0;                      // Таймаут загрузки (0 = без таймаута)
    std::string userAgent = "whispr-audiocache/1.0";     // User-Agent
    std::string logDirectory = "logs";                    // Директория логов
    std::string logLevel = "info";                        // Уровень логирования
    bool logToFile = true;                                // Писать лог в файл

    bool validate() const {
        return !cacheDirectory.empty() && maxCacheSize > 0 && preloadThreads > 0 &&
               !metadataFileName.empty() && transferTimeoutSeconds >= 0 && isKnownLogLevel(logLevel);
    }

    nlohmann::json toJson() const;
    // Бросает std::invalid_argument при неверной структуре или типах
    static CacheConfig fromJson(const nlohmann::json& j);
    // Бросает std::runtime_error, если файл не читается или не парсится
    static CacheConfig loadFromFile(const std::string& path);
};

} // namespace cache
} // namespace core
} // namespace whispr
