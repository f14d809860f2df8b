#include "crow.h"
#include <chrono>
#include <format>
#include <memory>
#include <print>
#include <string>

#include "../engine/GameEngine.hpp"
#include "../engine/RandomSource.hpp"
#include "../external/OllamaProvider.hpp"
#include "../external/PokeApiProvider.hpp"
#include "../infra/Log.hpp"
#include "../infra/TaskQueue.hpp"
#include "../shared/Config.hpp"
#include "../storage/GameStore.hpp"
#include "HttpServer.hpp"

using namespace MemoryDuel;

static void printBanner(const ServerConfig& config) {
    std::println("{}", std::string(50, '='));
    std::println("Memory Duel with Roast Judge");
    std::println("{}", std::string(50, '='));
    std::println("Commentary: {} (model {}), optional", config.ollamaUrl, config.ollamaModel);
    std::println("   ollama pull {}", config.ollamaModel);
    std::println("   ollama serve");
    std::println("{}", std::string(50, '='));
    std::println("Open: http://localhost:{}", config.port);
    std::println("{}", std::string(50, '='));
}

int main()
{
    try
    {
        ServerConfig config = ServerConfig::fromEnvironment();

        printBanner(config);

        auto taskQueue = std::make_shared<TaskQueue>(config.workerThreads);

        auto store = std::make_shared<GameStore>(std::chrono::minutes(config.gameTtlMinutes));

        auto illustrations = std::make_shared<PokeApiProvider>(config.pokeApiUrl, config.providerTimeoutMs);

        auto commentary = std::make_shared<OllamaProvider>(config.ollamaUrl, config.ollamaModel, config.providerTimeoutMs);

        auto engine = std::make_shared<GameEngine>(
            store, illustrations, commentary, std::make_shared<MersenneRandomSource>(), taskQueue);

        HttpServer server(engine, config);

        server.run();
    }
    catch (const std::exception& e) {
        Log::error(std::format("[FATAL] Main: {}", e.what()));
        return -1;
    }

    return 0;
}
