#include "core/io/CurlDownloader.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>
#include <mutex>

namespace whispr {
namespace core {
namespace io {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};
struct CurlStringDeleter {
    void operator()(char* str) const { curl_free(str); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("CurlDownloader: curl_global_init завершился ошибкой: {}", curl_easy_strerror(rc));
        }
    });
}

size_t writeToStream(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    const size_t bytes = size * nmemb;
    out->write(data, static_cast<std::streamsize>(bytes));
    // Короткая запись прерывает передачу с CURLE_WRITE_ERROR
    return out->good() ? bytes : 0;
}

std::string urlPart(CURLU* url, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(url, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return {};
    }
    CurlStringPtr holder(raw);
    return std::string(raw);
}

} // namespace

CurlDownloader::CurlDownloader(const CurlDownloaderConfig& config) : config_(config) {
    ensureCurlGlobalInit();
}

bool CurlDownloader::isValidRemoteUrl(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return false;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return false;
    }
    const std::string scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    return !urlPart(handle.get(), CURLUPART_HOST).empty();
}

DownloadResult CurlDownloader::download(const std::string& url, const std::string& toPath) const {
    DownloadResult result;
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        result.error = "curl_easy_init failed";
        spdlog::error("CurlDownloader: не удалось создать easy handle");
        return result;
    }

    std::ofstream out(toPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = "cannot open " + toPath;
        spdlog::error("CurlDownloader: не удалось открыть файл {}", toPath);
        return result;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, config_.followRedirects ? 1L : 0L);
    if (config_.timeoutSeconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeoutSeconds);
    }
    if (config_.connectTimeoutSeconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.connectTimeoutSeconds);
    }
    if (!config_.userAgent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.userAgent.c_str());
    }

    CURLcode rc = curl_easy_perform(curl.get());
    out.close();

    if (rc == CURLE_OK && out.fail()) {
        // Сброс буфера при закрытии не удался: файл неполный
        result.error = "write to " + toPath + " failed";
        spdlog::error("CurlDownloader: ошибка записи {} при загрузке {}", toPath, url);
        return result;
    }
    if (rc != CURLE_OK) {
        result.error = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(rc);
        spdlog::error("CurlDownloader: ошибка загрузки {}: {}", url, result.error);
        return result;
    }
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    result.statusCode = status;
    spdlog::debug("CurlDownloader: {} -> {} (status={})", url, toPath, status);
    return result;
}

} // namespace io
} // namespace core
} // namespace whispr
