#pragma once

#include <memory>
#include <crow.h>
#include <optional>
#include <string>

#include "../engine/GameEngine.hpp"
#include "../shared/Config.hpp"

namespace MemoryDuel {

    class HttpServer {
    public:
        HttpServer(
            std::shared_ptr<GameEngine> engine,
            ServerConfig config
            );
        ~HttpServer() = default;

        void run();

        // Route handlers, callable without a running app.
        crow::response handleNewGame(const crow::request& req);
        crow::response handleJoin(const std::string& gameId);
        crow::response handleState(const crow::request& req, const std::string& gameId);
        crow::response handleFlip(const crow::request& req, const std::string& gameId);
        crow::response handleReset(const crow::request& req, const std::string& gameId);
        crow::response handleTimeBonus(const crow::request& req, const std::string& gameId);
        crow::response handleRoast(const crow::request& req, const std::string& gameId);
        crow::response handleOpponentMove(const std::string& gameId);
        crow::response handleHistory(const std::string& gameId);
        crow::response handleOpponentMemory(const std::string& gameId);
        crow::response handleHealth();

    private:
        // Body field, then ?token=, then the X-Player-Token header.
        static std::optional<std::string> extractToken(const crow::request& req, const crow::json::rvalue* body);

        // Components
        std::shared_ptr<GameEngine> engine;
        ServerConfig config;
    };
}
