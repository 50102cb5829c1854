#include "core/cache/codec/KeyCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>

namespace whispr {
namespace core {
namespace cache {

std::string KeyCodec::hash(const std::string& key) {
    std::uint32_t h = 0;
    for (unsigned char c : key) {
        h = (h << 5) - h + c; // h * 31 + c, переполнение по модулю 2^32
    }
    // Знаковое 32-битное значение по модулю
    std::int64_t value = static_cast<std::int32_t>(h);
    if (value < 0) {
        value = -value;
    }
    if (value == 0) {
        return "0";
    }
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    while (value > 0) {
        out.push_back(digits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string KeyCodec::extensionOf(const std::string& key) {
    std::string path = key.substr(0, key.find('?'));
    auto dot = path.rfind('.');
    if (dot == std::string::npos) {
        return DEFAULT_EXTENSION;
    }
    std::string ext = path.substr(dot + 1);
    if (ext.empty() || ext.size() > 4) {
        return DEFAULT_EXTENSION;
    }
    for (unsigned char c : ext) {
        if (!std::isalnum(c)) {
            return DEFAULT_EXTENSION;
        }
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "." + ext;
}

std::string KeyCodec::localPathFor(const std::string& key, const std::string& cacheDir) {
    std::filesystem::path path(cacheDir);
    path /= hash(key) + extensionOf(key);
    return path.string();
}

} // namespace cache
} // namespace core
} // namespace whispr
