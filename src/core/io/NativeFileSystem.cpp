#include "core/io/NativeFileSystem.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace whispr {
namespace core {
namespace io {

NativeFileSystem::NativeFileSystem(const CurlDownloaderConfig& downloaderConfig)
    : downloader_(downloaderConfig) {}

FileInfo NativeFileSystem::stat(const std::string& path) {
    FileInfo info;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return info;
    }
    info.exists = true;
    info.isDirectory = fs::is_directory(status);
    if (!info.isDirectory) {
        auto size = fs::file_size(path, ec);
        if (ec) {
            spdlog::warn("NativeFileSystem: file_size({}) не удался: {}", path, ec.message());
            return FileInfo{};
        }
        info.size = static_cast<std::uint64_t>(size);
    }
    return info;
}

bool NativeFileSystem::makeDirectory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("NativeFileSystem: не удалось создать директорию {}: {}", path, ec.message());
        return false;
    }
    return fs::is_directory(path, ec);
}

std::optional<std::string> NativeFileSystem::readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("NativeFileSystem: не удалось открыть {} для чтения", path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        spdlog::warn("NativeFileSystem: ошибка чтения {}", path);
        return std::nullopt;
    }
    return buffer.str();
}

bool NativeFileSystem::writeText(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("NativeFileSystem: не удалось открыть {} для записи", path);
        return false;
    }
    file << content;
    file.flush();
    if (!file) {
        spdlog::error("NativeFileSystem: ошибка записи {}", path);
        return false;
    }
    return true;
}

bool NativeFileSystem::copy(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("NativeFileSystem: копирование {} -> {} не удалось: {}", from, to, ec.message());
        return false;
    }
    return true;
}

bool NativeFileSystem::move(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        spdlog::error("NativeFileSystem: rename {} -> {} не удался: {}", from, to, ec.message());
        return false;
    }
    return true;
}

DownloadResult NativeFileSystem::download(const std::string& url, const std::string& toPath) {
    return downloader_.download(url, toPath);
}

bool NativeFileSystem::remove(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("NativeFileSystem: не удалось удалить {}: {}", path, ec.message());
        return false;
    }
    return true;
}

} // namespace io
} // namespace core
} // namespace whispr
