#pragma once
#include <string>

namespace whispr {
namespace core {
namespace cache {

// KeyCodec: стабильный путь в кэше для ключа ресурса (хэш + расширение).
// Коллизия хэша приводит лишь к перезаписи файла, источник истины: индекс.
class KeyCodec {
public:
    static constexpr const char* DEFAULT_EXTENSION = ".mp3";

    // 32-битный rolling hash (h * 31 + c), модуль в base36. Пустая строка -> "0"
    static std::string hash(const std::string& key);
    // ".ext" перед query-строкой, 1..4 символа [a-zA-Z0-9], иначе ".mp3"
    static std::string extensionOf(const std::string& key);
    static std::string localPathFor(const std::string& key, const std::string& cacheDir);
};

} // namespace cache
} // namespace core
} // namespace whispr
