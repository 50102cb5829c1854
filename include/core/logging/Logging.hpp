#pragma once
#include <string>
#include "core/cache/CacheConfig.hpp"

namespace whispr {
namespace core {
namespace logging {

constexpr const char* LOGGER_NAME = "audiocache";
constexpr size_t LOG_FILE_MAX_SIZE = 1024 * 1024 * 5; // 5 MB
constexpr size_t LOG_FILE_COUNT = 2;

// Логгер по умолчанию: цветной stdout + ротируемый файл <logDirectory>/audiocache.log.
// Ошибки настройки пишутся в stderr, кэш продолжает работу со стандартным логгером.
void initializeLogging(const cache::CacheConfig& config);

} // namespace logging
} // namespace core
} // namespace whispr
