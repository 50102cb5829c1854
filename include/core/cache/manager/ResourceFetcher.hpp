#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "core/cache/CacheEntry.hpp"
#include "core/io/FileSystem.hpp"

namespace whispr {
namespace core {
namespace cache {

// ResourceFetcher: материализует ресурс по пути из KeyCodec.
// file:// копируется, http(s) загружается. Ошибки не выходят наружу.
class ResourceFetcher {
public:
    using Clock = std::function<std::int64_t()>; // epoch ms

    static constexpr const char* LOCAL_SCHEME = "file://";
    static constexpr long HTTP_OK = 200;

    explicit ResourceFetcher(std::shared_ptr<io::IFileSystem> fileSystem, Clock clock = {});

    // nullopt: ресурс не закэширован (вызывающий возвращает исходный ключ)
    std::optional<CacheEntry> fetch(const std::string& key, const std::string& destinationPath);

    static bool isLocal(const std::string& key);
    static std::string localSourcePath(const std::string& key);
    static std::int64_t systemNowMs();

private:
    std::optional<CacheEntry> fetchLocal(const std::string& key, const std::string& destinationPath);
    std::optional<CacheEntry> fetchRemote(const std::string& key, const std::string& destinationPath);
    std::optional<CacheEntry> makeEntry(const std::string& key, const std::string& destinationPath);

    std::shared_ptr<io::IFileSystem> fileSystem_;
    Clock clock_;
};

} // namespace cache
} // namespace core
} // namespace whispr
