#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace whispr {
namespace core {
namespace cache {

// CacheStats: статистика аудиокэша (файлы, размер, заполненность, hit/miss, eviction)
struct CacheStats {
    size_t fileCount = 0;           // Кол-во файлов
    std::uint64_t totalSize = 0;    // Текущий размер (байт)
    std::uint64_t maxSize = 0;      // Макс. размер (байт)
    double usagePercentage = 0.0;   // Заполненность, % (может превышать 100)
    size_t hitCount = 0;            // Попадания
    size_t missCount = 0;           // Промахи
    size_t evictionCount = 0;       // Вытеснения
    nlohmann::json toJson() const {
        return {
            {"fileCount", fileCount},
            {"totalSize", totalSize},
            {"maxSize", maxSize},
            {"usagePercentage", usagePercentage},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"evictionCount", evictionCount}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace whispr
