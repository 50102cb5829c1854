#pragma once
#include <string>
#include "core/io/FileSystem.hpp"

namespace whispr {
namespace core {
namespace io {

// CurlDownloaderConfig: параметры HTTP-загрузки
struct CurlDownloaderConfig {
    long timeoutSeconds = 0;        // 0: без таймаута
    long connectTimeoutSeconds = 0; // 0: значение libcurl по умолчанию
    std::string userAgent;
    bool followRedirects = true;
};

// CurlDownloader: загрузка URL в файл через libcurl easy interface.
// Потокобезопасен: каждый вызов использует собственный easy handle.
class CurlDownloader {
public:
    explicit CurlDownloader(const CurlDownloaderConfig& config);
    DownloadResult download(const std::string& url, const std::string& toPath) const;
    // Разбирается ли строка как http(s) URL с непустым хостом
    static bool isValidRemoteUrl(const std::string& url);
private:
    CurlDownloaderConfig config_;
};

} // namespace io
} // namespace core
} // namespace whispr
