#include "core/cache/CacheConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace whispr {
namespace core {
namespace cache {

namespace {

template<typename T>
void readField(const nlohmann::json& j, const char* name, T& target) {
    auto it = j.find(name);
    if (it == j.end()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("CacheConfig: неверный тип поля '") + name + "': " + e.what());
    }
}

} // namespace

nlohmann::json CacheConfig::toJson() const {
    return {
        {"cacheDirectory", cacheDirectory},
        {"maxCacheSize", maxCacheSize},
        {"preloadCount", preloadCount},
        {"preloadThreads", preloadThreads},
        {"metadataFileName", metadataFileName},
        {"atomicMetadataWrite", atomicMetadataWrite},
        {"recomputeSizeOnLoad", recomputeSizeOnLoad},
        {"transferTimeoutSeconds", transferTimeoutSeconds},
        {"userAgent", userAgent},
        {"logDirectory", logDirectory},
        {"logLevel", logLevel},
        {"logToFile", logToFile}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("CacheConfig: ожидался JSON-объект");
    }
    CacheConfig config;
    readField(j, "cacheDirectory", config.cacheDirectory);
    readField(j, "maxCacheSize", config.maxCacheSize);
    readField(j, "preloadCount", config.preloadCount);
    readField(j, "preloadThreads", config.preloadThreads);
    readField(j, "metadataFileName", config.metadataFileName);
    readField(j, "atomicMetadataWrite", config.atomicMetadataWrite);
    readField(j, "recomputeSizeOnLoad", config.recomputeSizeOnLoad);
    readField(j, "transferTimeoutSeconds", config.transferTimeoutSeconds);
    readField(j, "userAgent", config.userAgent);
    readField(j, "logDirectory", config.logDirectory);
    readField(j, "logLevel", config.logLevel);
    readField(j, "logToFile", config.logToFile);
    if (!config.validate()) {
        throw std::invalid_argument("CacheConfig: некорректная конфигурация кэша");
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("CacheConfig: не удалось открыть файл " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("CacheConfig: ошибка разбора " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace whispr
