#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"

using whispr::core::cache::CacheConfig;

void testCacheConfigDefaults() {
    std::cout << "Testing CacheConfig defaults...\n";

    CacheConfig config;
    assert(config.validate());
    assert(config.maxCacheSize == 100ULL * 1024 * 1024);
    assert(config.preloadCount == 5);
    assert(config.metadataFileName == "metadata.json");
    assert(config.atomicMetadataWrite);
    assert(config.recomputeSizeOnLoad);
    assert(config.cacheDirectory.find("whispr-audio") != std::string::npos);

    CacheConfig broken;
    broken.cacheDirectory.clear();
    assert(!broken.validate());
    broken = CacheConfig();
    broken.maxCacheSize = 0;
    assert(!broken.validate());
    broken = CacheConfig();
    broken.preloadThreads = 0;
    assert(!broken.validate());
    broken = CacheConfig();
    broken.logLevel = "verbose";
    assert(!broken.validate());
    broken.logLevel = "warning";
    assert(broken.validate());

    std::cout << "[OK] CacheConfig defaults test\n";
}

void testCacheConfigFromJson() {
    std::cout << "Testing CacheConfig JSON parsing...\n";

    auto j = nlohmann::json::parse(R"({
        "cacheDirectory": "/var/cache/whispr-audio",
        "maxCacheSize": 2048,
        "preloadCount": 3,
        "logToFile": false
    })");
    auto config = CacheConfig::fromJson(j);
    assert(config.cacheDirectory == "/var/cache/whispr-audio");
    assert(config.maxCacheSize == 2048);
    assert(config.preloadCount == 3);
    assert(!config.logToFile);
    // Отсутствующие поля берутся по умолчанию
    assert(config.metadataFileName == "metadata.json");
    assert(config.preloadThreads == 4);

    // toJson -> fromJson сохраняет значения
    auto again = CacheConfig::fromJson(config.toJson());
    assert(again.cacheDirectory == config.cacheDirectory);
    assert(again.maxCacheSize == config.maxCacheSize);
    assert(again.logToFile == config.logToFile);

    std::cout << "[OK] CacheConfig JSON parsing test\n";
}

void testCacheConfigRejectsInvalid() {
    std::cout << "Testing CacheConfig invalid input...\n";

    auto expectInvalid = [](const std::string& text) {
        bool thrown = false;
        try {
            CacheConfig::fromJson(nlohmann::json::parse(text));
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    };
    expectInvalid("[1, 2]");
    expectInvalid(R"({"maxCacheSize": "big"})");
    expectInvalid(R"({"maxCacheSize": 0})");
    expectInvalid(R"({"cacheDirectory": ""})");
    expectInvalid(R"({"logLevel": "verbose"})");

    std::cout << "[OK] CacheConfig invalid input test\n";
}

void testCacheConfigLoadFromFile() {
    std::cout << "Testing CacheConfig file loading...\n";

    const auto dir = std::filesystem::temp_directory_path() / "whispr_cache_config_test";
    std::filesystem::create_directories(dir);
    const auto good = dir / "good.json";
    const auto bad = dir / "bad.json";
    {
        std::ofstream out(good);
        out << R"({"maxCacheSize": 4096, "logLevel": "debug"})";
    }
    {
        std::ofstream out(bad);
        out << "{ not json";
    }

    auto config = CacheConfig::loadFromFile(good.string());
    assert(config.maxCacheSize == 4096);
    assert(config.logLevel == "debug");

    bool thrown = false;
    try {
        CacheConfig::loadFromFile(bad.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        CacheConfig::loadFromFile((dir / "absent.json").string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::filesystem::remove_all(dir);

    std::cout << "[OK] CacheConfig file loading test\n";
}

int main() {
    try {
        testCacheConfigDefaults();
        testCacheConfigFromJson();
        testCacheConfigRejectsInvalid();
        testCacheConfigLoadFromFile();
        std::cout << "All CacheConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
