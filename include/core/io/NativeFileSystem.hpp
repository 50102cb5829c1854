#pragma once
#include "core/io/FileSystem.hpp"
#include "core/io/CurlDownloader.hpp"

namespace whispr {
namespace core {
namespace io {

// NativeFileSystem: IFileSystem поверх std::filesystem и libcurl
class NativeFileSystem : public IFileSystem {
public:
    explicit NativeFileSystem(const CurlDownloaderConfig& downloaderConfig = {});
    FileInfo stat(const std::string& path) override;
    bool makeDirectory(const std::string& path) override;
    std::optional<std::string> readText(const std::string& path) override;
    bool writeText(const std::string& path, const std::string& content) override;
    bool copy(const std::string& from, const std::string& to) override;
    bool move(const std::string& from, const std::string& to) override;
    DownloadResult download(const std::string& url, const std::string& toPath) override;
    bool remove(const std::string& path) override;
private:
    CurlDownloader downloader_;
};

} // namespace io
} // namespace core
} // namespace whispr
