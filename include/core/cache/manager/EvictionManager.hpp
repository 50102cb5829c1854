#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "core/cache/manager/MetadataStore.hpp"
#include "core/io/FileSystem.hpp"

namespace whispr {
namespace core {
namespace cache {

// EvictionManager: освобождает место под новую запись, удаляя самые старые
// (по времени загрузки) записи. Не LRU: порядок определяется только downloadedAt.
class EvictionManager {
public:
    EvictionManager(MetadataStore& store, std::shared_ptr<io::IFileSystem> fileSystem);

    // Вызывается до учёта новой записи. Если кандидаты закончились, а места
    // всё ещё не хватает, запись всё равно будет принята (политика кэша).
    // Кандидаты с путём incomingPath не удаляются.
    // Возвращает количество вытесненных записей.
    size_t reclaim(std::uint64_t incomingSize, std::uint64_t capacity, const std::string& incomingPath = {});

private:
    MetadataStore& store_;
    std::shared_ptr<io::IFileSystem> fileSystem_;
};

} // namespace cache
} // namespace core
} // namespace whispr
