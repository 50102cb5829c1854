#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "core/io/CurlDownloader.hpp"
#include "core/io/NativeFileSystem.hpp"

using namespace whispr::core::io;
namespace fs = std::filesystem;

namespace {

fs::path makeTempDir(const std::string& name) {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    return dir;
}

} // namespace

void testNativeFileSystemFiles() {
    std::cout << "Testing NativeFileSystem file operations...\n";

    const auto dir = makeTempDir("whispr_native_fs_test");
    NativeFileSystem nativeFs;

    assert(!nativeFs.stat(dir.string()).exists);
    assert(nativeFs.makeDirectory((dir / "nested").string()));
    assert(nativeFs.makeDirectory((dir / "nested").string())); // Повторно: успех
    auto dirInfo = nativeFs.stat(dir.string());
    assert(dirInfo.exists && dirInfo.isDirectory);

    const auto file = (dir / "a.txt").string();
    assert(nativeFs.writeText(file, "hello"));
    auto info = nativeFs.stat(file);
    assert(info.exists && !info.isDirectory);
    assert(info.size == 5);
    assert(nativeFs.readText(file).value() == "hello");
    assert(!nativeFs.readText((dir / "absent.txt").string()).has_value());

    const auto copy = (dir / "b.txt").string();
    assert(nativeFs.copy(file, copy));
    assert(nativeFs.readText(copy).value() == "hello");
    assert(nativeFs.writeText(file, "rewritten"));
    assert(nativeFs.copy(file, copy)); // Перезапись существующего
    assert(nativeFs.readText(copy).value() == "rewritten");
    assert(!nativeFs.copy((dir / "absent.txt").string(), copy));

    const auto moved = (dir / "c.txt").string();
    assert(nativeFs.move(copy, moved));
    assert(!nativeFs.stat(copy).exists);
    assert(nativeFs.stat(moved).size == 9);

    assert(nativeFs.remove(moved));
    assert(!nativeFs.stat(moved).exists);
    assert(nativeFs.remove(moved)); // Отсутствующий файл: успех

    fs::remove_all(dir);

    std::cout << "[OK] NativeFileSystem file operations test\n";
}

void testCurlUrlValidation() {
    std::cout << "Testing CurlDownloader url validation...\n";

    assert(CurlDownloader::isValidRemoteUrl("https://cdn.whispr.app/a.mp3"));
    assert(CurlDownloader::isValidRemoteUrl("http://localhost:8080/a.mp3?x=1"));
    assert(!CurlDownloader::isValidRemoteUrl(""));
    assert(!CurlDownloader::isValidRemoteUrl("not a url"));
    assert(!CurlDownloader::isValidRemoteUrl("ftp://host/a.mp3"));
    assert(!CurlDownloader::isValidRemoteUrl("file:///tmp/a.mp3"));

    std::cout << "[OK] CurlDownloader url validation test\n";
}

void testDownloadTransportFailure() {
    std::cout << "Testing NativeFileSystem download transport failure...\n";

    const auto dir = makeTempDir("whispr_native_dl_test");
    fs::create_directories(dir);

    CurlDownloaderConfig config;
    config.timeoutSeconds = 5;
    config.connectTimeoutSeconds = 2;
    NativeFileSystem nativeFs(config);

    // Порт 1 на loopback закрыт: ошибка транспорта, статус 0
    auto result = nativeFs.download("http://127.0.0.1:1/a.mp3", (dir / "a.mp3").string());
    assert(result.statusCode == 0);
    assert(!result.error.empty());

    // Файл назначения не открывается
    auto unwritable = nativeFs.download("http://127.0.0.1:1/a.mp3", (dir / "missing" / "a.mp3").string());
    assert(unwritable.statusCode == 0);

    fs::remove_all(dir);

    std::cout << "[OK] NativeFileSystem download failure test\n";
}

void testDownloadWriteFailure() {
    std::cout << "Testing CurlDownloader reports failed flush on close...\n";

    // /dev/full принимает open(), но любая запись падает с ENOSPC
    if (!fs::exists("/dev/full")) {
        std::cout << "[SKIP] /dev/full недоступен\n";
        return;
    }
    const auto dir = makeTempDir("whispr_native_full_test");
    fs::create_directories(dir);
    const auto source = dir / "src.mp3";
    {
        std::ofstream out(source, std::ios::binary);
        out << "short body";
    }

    CurlDownloader downloader{CurlDownloaderConfig{}};
    // Тело меньше буфера потока: ошибка проявляется только при close()
    auto result = downloader.download("file://" + source.string(), "/dev/full");
    assert(result.statusCode == 0);
    assert(!result.error.empty());

    fs::remove_all(dir);

    std::cout << "[OK] CurlDownloader write failure test\n";
}

int main() {
    try {
        testNativeFileSystemFiles();
        testCurlUrlValidation();
        testDownloadTransportFailure();
        testDownloadWriteFailure();
        std::cout << "All NativeFileSystem tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
