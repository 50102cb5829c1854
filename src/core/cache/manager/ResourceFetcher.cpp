#include "core/cache/manager/ResourceFetcher.hpp"
#include "core/io/CurlDownloader.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <utility>

namespace whispr {
namespace core {
namespace cache {

ResourceFetcher::ResourceFetcher(std::shared_ptr<io::IFileSystem> fileSystem, Clock clock)
    : fileSystem_(std::move(fileSystem)), clock_(clock ? std::move(clock) : Clock(&ResourceFetcher::systemNowMs)) {}

std::int64_t ResourceFetcher::systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool ResourceFetcher::isLocal(const std::string& key) {
    return key.compare(0, std::strlen(LOCAL_SCHEME), LOCAL_SCHEME) == 0;
}

std::string ResourceFetcher::localSourcePath(const std::string& key) {
    return isLocal(key) ? key.substr(std::strlen(LOCAL_SCHEME)) : key;
}

std::optional<CacheEntry> ResourceFetcher::fetch(const std::string& key, const std::string& destinationPath) {
    try {
        spdlog::debug("ResourceFetcher: {} -> {}", key, destinationPath);
        if (isLocal(key)) {
            return fetchLocal(key, destinationPath);
        }
        return fetchRemote(key, destinationPath);
    } catch (const std::exception& e) {
        spdlog::error("ResourceFetcher: ошибка загрузки {}: {}", key, e.what());
        return std::nullopt;
    }
}

std::optional<CacheEntry> ResourceFetcher::fetchLocal(const std::string& key, const std::string& destinationPath) {
    const auto source = localSourcePath(key);
    const auto sourceNormal = std::filesystem::path(source).lexically_normal();
    const auto destNormal = std::filesystem::path(destinationPath).lexically_normal();
    if (sourceNormal != destNormal) {
        if (!fileSystem_->copy(source, destinationPath)) {
            spdlog::error("ResourceFetcher: не удалось скопировать {} в кэш", source);
            return std::nullopt;
        }
    }
    return makeEntry(key, destinationPath);
}

std::optional<CacheEntry> ResourceFetcher::fetchRemote(const std::string& key, const std::string& destinationPath) {
    if (!io::CurlDownloader::isValidRemoteUrl(key)) {
        spdlog::warn("ResourceFetcher: некорректный URL, загрузка пропущена: {}", key);
        return std::nullopt;
    }
    auto result = fileSystem_->download(key, destinationPath);
    if (result.statusCode != HTTP_OK) {
        // Частично записанный файл может остаться на диске, но в индекс не попадает
        spdlog::error("ResourceFetcher: загрузка {} завершилась со статусом {} {}", key, result.statusCode, result.error);
        return std::nullopt;
    }
    return makeEntry(key, destinationPath);
}

std::optional<CacheEntry> ResourceFetcher::makeEntry(const std::string& key, const std::string& destinationPath) {
    auto info = fileSystem_->stat(destinationPath);
    if (!info.exists) {
        spdlog::error("ResourceFetcher: файл {} не найден после загрузки", destinationPath);
        return std::nullopt;
    }
    if (info.size == 0) {
        spdlog::warn("ResourceFetcher: пропуск файла нулевого размера: {}", key);
        return std::nullopt;
    }
    CacheEntry entry;
    entry.originalKey = key;
    entry.localPath = destinationPath;
    entry.downloadedAt = clock_();
    entry.sizeBytes = info.size;
    return entry;
}

} // namespace cache
} // namespace core
} // namespace whispr
