#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "core/cache/CacheConfig.hpp"
#include "core/cache/manager/AudioCache.hpp"
#include "core/logging/Logging.hpp"

using namespace whispr::core;

namespace {

void printUsage() {
    std::cerr << "Usage: whispr-audiocache [--config <file>] <command>\n"
              << "Commands:\n"
              << "  get <url>...                    resolve urls to cached files\n"
              << "  preload <currentIndex> <url>... warm the cache around currentIndex\n"
              << "  stats                           print cache statistics as JSON\n"
              << "  clear                           delete all cached files\n";
}

int runGet(cache::AudioCache& audioCache, const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    for (const auto& url : args) {
        std::cout << url << " -> " << audioCache.getCachedAudioUrl(url) << "\n";
    }
    return 0;
}

int runPreload(cache::AudioCache& audioCache, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 1;
    }
    size_t currentIndex = 0;
    try {
        currentIndex = static_cast<size_t>(std::stoul(args[0]));
    } catch (const std::exception& e) {
        std::cerr << "Invalid currentIndex '" << args[0] << "': " << e.what() << "\n";
        return 1;
    }
    std::vector<cache::AudioTrack> tracks;
    for (size_t i = 1; i < args.size(); ++i) {
        cache::AudioTrack track;
        track.id = "track_" + std::to_string(i - 1);
        track.url = args[i];
        tracks.push_back(track);
    }
    if (!audioCache.preloadTracks(tracks, currentIndex)) {
        spdlog::warn("Предзагрузка не выполнена");
    }
    std::cout << audioCache.getCacheStats().toJson().dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        printUsage();
        return 1;
    }

    cache::CacheConfig config;
    try {
        if (!configPath.empty()) {
            config = cache::CacheConfig::loadFromFile(configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    logging::initializeLogging(config);

    try {
        cache::AudioCache audioCache(config);
        if (!audioCache.initialize()) {
            spdlog::error("Не удалось инициализировать кэш в {}", config.cacheDirectory);
            return 1;
        }

        const std::string command = args[0];
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        int rc = 0;
        if (command == "get") {
            rc = runGet(audioCache, rest);
        } else if (command == "preload") {
            rc = runPreload(audioCache, rest);
        } else if (command == "stats") {
            std::cout << audioCache.getCacheStats().toJson().dump(2) << "\n";
        } else if (command == "clear") {
            audioCache.clearCache();
        } else {
            printUsage();
            rc = 1;
        }
        audioCache.shutdown();
        spdlog::shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
