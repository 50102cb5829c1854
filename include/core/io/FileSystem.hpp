#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace whispr {
namespace core {
namespace io {

// FileInfo: результат stat (ошибка трактуется как exists=false)
struct FileInfo {
    bool exists = false;
    std::uint64_t size = 0;
    bool isDirectory = false;
};

// DownloadResult: итог сетевой загрузки (statusCode == 0 при транспортной ошибке)
struct DownloadResult {
    long statusCode = 0;
    std::string error;
};

// IFileSystem: файловые и сетевые операции кэша.
// Реализации не бросают исключений: ошибки возвращаются как false / nullopt / exists=false.
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual FileInfo stat(const std::string& path) = 0; // Информация о файле
    virtual bool makeDirectory(const std::string& path) = 0; // Создать (с промежуточными)
    virtual std::optional<std::string> readText(const std::string& path) = 0; // Прочитать
    virtual bool writeText(const std::string& path, const std::string& content) = 0; // Записать
    virtual bool copy(const std::string& from, const std::string& to) = 0; // Копировать
    virtual bool move(const std::string& from, const std::string& to) = 0; // Переименовать
    virtual DownloadResult download(const std::string& url, const std::string& toPath) = 0; // Загрузить
    virtual bool remove(const std::string& path) = 0; // Удалить (отсутствующий файл: успех)
};

} // namespace io
} // namespace core
} // namespace whispr
