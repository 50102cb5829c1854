#include <cassert>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <nlohmann/json.hpp>
#include "core/cache/manager/MetadataStore.hpp"
#include "FakeFileSystem.hpp"

using namespace whispr::core::cache;
using whispr::test::FakeFileSystem;

namespace {

MetadataStoreConfig makeConfig(bool atomicWrite = true, bool recompute = true) {
    MetadataStoreConfig config;
    config.cacheDirectory = "/cache";
    config.atomicWrite = atomicWrite;
    config.recomputeSizeOnLoad = recompute;
    return config;
}

CacheEntry makeEntry(const std::string& key, std::int64_t time, std::uint64_t size) {
    return CacheEntry{key, "/cache/" + key + ".mp3", time, size};
}

} // namespace

void testMetadataStoreEmptyLoad() {
    std::cout << "Testing MetadataStore load without sidecar...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    MetadataStore store(fs, makeConfig());
    assert(store.ensureDirectory());
    assert(fs->stat("/cache").isDirectory);

    auto index = store.load();
    assert(index.entries.empty());
    assert(index.currentSizeBytes == 0);
    assert(store.count() == 0);

    std::cout << "[OK] MetadataStore empty load test\n";
}

void testMetadataStoreSizeInvariant() {
    std::cout << "Testing MetadataStore size invariant...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    MetadataStore store(fs, makeConfig());

    store.put(makeEntry("a", 1, 10));
    store.put(makeEntry("b", 2, 20));
    assert(store.currentSize() == 30);

    // Повторная запись ключа заменяет, а не дублирует
    store.put(makeEntry("a", 3, 5));
    assert(store.count() == 2);
    assert(store.currentSize() == 25);

    auto removed = store.erase("b");
    assert(removed.has_value());
    assert(removed->sizeBytes == 20);
    assert(store.currentSize() == 5);
    assert(!store.erase("missing").has_value());

    auto cleared = store.clear();
    assert(cleared.size() == 1);
    assert(store.currentSize() == 0);
    assert(store.count() == 0);

    std::cout << "[OK] MetadataStore size invariant test\n";
}

void testMetadataStoreRoundTrip() {
    std::cout << "Testing MetadataStore persistence...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    {
        MetadataStore store(fs, makeConfig());
        store.put(makeEntry("https://x/b.mp3", 200, 7));
        store.put(makeEntry("https://x/a.mp3", 100, 3));
        assert(store.save());
    }
    assert(fs->hasFile("/cache/metadata.json"));
    assert(!fs->hasFile("/cache/metadata.json.tmp"));

    // Формат sidecar: упорядоченный список пар [key, entry]
    auto j = nlohmann::json::parse(fs->fileContent("/cache/metadata.json"));
    assert(j["currentCacheSize"] == 10);
    assert(j["cachedFiles"].size() == 2);
    assert(j["cachedFiles"][0][0] == "https://x/a.mp3");
    assert(j["cachedFiles"][0][1]["originalUrl"] == "https://x/a.mp3");
    assert(j["cachedFiles"][0][1]["downloadTime"] == 100);
    assert(j["cachedFiles"][0][1]["fileSize"] == 3);
    assert(j["cachedFiles"][1][0] == "https://x/b.mp3");

    MetadataStore reloaded(fs, makeConfig());
    auto index = reloaded.load();
    assert(index.entries.size() == 2);
    assert(index.currentSizeBytes == 10);
    auto entry = reloaded.find("https://x/b.mp3");
    assert(entry.has_value());
    assert(entry->localPath == "/cache/https://x/b.mp3.mp3");
    assert(entry->downloadedAt == 200);
    assert(entry->sizeBytes == 7);

    std::cout << "[OK] MetadataStore persistence test\n";
}

void testMetadataStoreSingleWrite() {
    std::cout << "Testing MetadataStore non-atomic write...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    MetadataStore store(fs, makeConfig(false));
    store.put(makeEntry("a", 1, 4));
    assert(store.save());
    assert(fs->hasFile("/cache/metadata.json"));
    assert(!fs->hasFile("/cache/metadata.json.tmp"));

    MetadataStore reloaded(fs, makeConfig(false));
    assert(reloaded.load().currentSizeBytes == 4);

    std::cout << "[OK] MetadataStore non-atomic write test\n";
}

void testMetadataStoreCorruption() {
    std::cout << "Testing MetadataStore corrupt sidecar handling...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    MetadataStore store(fs, makeConfig());

    fs->addFile("/cache/metadata.json", "{\"cachedFiles\": [[\"a\", {\"originalUrl\"");
    auto index = store.load();
    assert(index.entries.empty());
    assert(index.currentSizeBytes == 0);

    fs->addFile("/cache/metadata.json", "{\"cachedFiles\": 5, \"currentCacheSize\": 10}");
    assert(store.load().entries.empty());

    fs->addFile("/cache/metadata.json", "{\"cachedFiles\": [[\"a\"]], \"currentCacheSize\": 10}");
    assert(store.load().entries.empty());

    fs->addFile("/cache/metadata.json", "[1, 2, 3]");
    assert(store.load().entries.empty());
    assert(store.count() == 0);

    std::cout << "[OK] MetadataStore corrupt sidecar test\n";
}

void testMetadataStoreDrift() {
    std::cout << "Testing MetadataStore size drift on load...\n";

    const std::string sidecar = R"({
        "cachedFiles": [
            ["a", {"originalUrl": "a", "localPath": "/cache/a.mp3", "downloadTime": 1, "fileSize": 6}],
            ["b", {"originalUrl": "b", "localPath": "/cache/b.mp3", "downloadTime": 2, "fileSize": 4}],
            ["z", {"originalUrl": "z", "localPath": "/cache/z.mp3", "downloadTime": 3, "fileSize": 0}]
        ],
        "currentCacheSize": 999
    })";

    auto fs = std::make_shared<FakeFileSystem>();
    fs->addFile("/cache/metadata.json", sidecar);

    MetadataStore recomputing(fs, makeConfig(true, true));
    auto index = recomputing.load();
    assert(index.entries.size() == 2); // Запись нулевого размера отброшена
    assert(index.currentSizeBytes == 10);
    assert(recomputing.currentSize() == 10);

    MetadataStore trusting(fs, makeConfig(true, false));
    assert(trusting.load().currentSizeBytes == 999);

    std::cout << "[OK] MetadataStore drift test\n";
}

void testMetadataStoreRejectsNegativeNumbers() {
    std::cout << "Testing MetadataStore rejects negative sizes...\n";

    auto fs = std::make_shared<FakeFileSystem>();
    MetadataStore store(fs, makeConfig());
    store.put(makeEntry("keep", 1, 4));

    // Отрицательный размер не должен превращаться в огромное беззнаковое число
    fs->addFile("/cache/metadata.json", R"({
        "cachedFiles": [["a", {"originalUrl": "a", "localPath": "/cache/a.mp3", "downloadTime": 1, "fileSize": -5}]],
        "currentCacheSize": 0
    })");
    auto index = store.load();
    assert(index.entries.empty());
    assert(index.currentSizeBytes == 0);
    assert(store.count() == 0);
    assert(store.currentSize() == 0);

    auto expectInvalid = [](const std::string& text) {
        bool thrown = false;
        try {
            MetadataStore::deserialize(nlohmann::json::parse(text), true);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    };
    expectInvalid(R"({"cachedFiles": [["a", {"originalUrl": "a", "localPath": "/p", "downloadTime": 1, "fileSize": -5}]]})");
    expectInvalid(R"({"cachedFiles": [["a", {"originalUrl": "a", "localPath": "/p", "downloadTime": 1, "fileSize": 2.5}]]})");
    expectInvalid(R"({"cachedFiles": [["a", {"originalUrl": "a", "localPath": "/p", "downloadTime": "now", "fileSize": 3}]]})");
    expectInvalid(R"({"cachedFiles": [], "currentCacheSize": -1})");

    // Отрицательное время допустимо: это просто очень старая запись
    auto old = MetadataStore::deserialize(nlohmann::json::parse(
        R"({"cachedFiles": [["a", {"originalUrl": "a", "localPath": "/p", "downloadTime": -1, "fileSize": 3}]]})"), true);
    assert(old.entries.size() == 1);
    assert(old.entries.at("a").downloadedAt == -1);

    std::cout << "[OK] MetadataStore negative sizes test\n";
}

int main() {
    try {
        testMetadataStoreEmptyLoad();
        testMetadataStoreSizeInvariant();
        testMetadataStoreRoundTrip();
        testMetadataStoreSingleWrite();
        testMetadataStoreCorruption();
        testMetadataStoreDrift();
        testMetadataStoreRejectsNegativeNumbers();
        std::cout << "All MetadataStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
