#include "HttpServer.hpp"
#include "JsonViews.hpp"
#include "../engine/StateView.hpp"
#include "../infra/Log.hpp"

#include <cmath>
#include <format>
#include <limits>

using namespace MemoryDuel;

namespace {

    // Empty bodies count as {}.
    crow::json::rvalue parseBody(const crow::request& req) {
        if (req.body.empty()) return crow::json::load("{}");
        return crow::json::load(req.body);
    }

    bool isObject(const crow::json::rvalue& body) {
        return body && body.t() == crow::json::type::Object;
    }

    bool boolField(const crow::json::rvalue& body, const char* key, bool fallback) {
        if (!body.has(key)) return fallback;
        const auto& v = body[key];
        switch (v.t()) {
        case crow::json::type::True:   return true;
        case crow::json::type::False:  return false;
        case crow::json::type::Number: return v.d() != 0.0;
        default:                       return fallback;
        }
    }

    std::optional<std::string> stringField(const crow::json::rvalue& body, const char* key) {
        if (!body.has(key) || body[key].t() != crow::json::type::String) return std::nullopt;
        return std::string(body[key].s());
    }

    // Integral numbers, or strings holding one.
    std::optional<int> intField(const crow::json::rvalue& body, const char* key) {
        if (!body.has(key)) return std::nullopt;
        const auto& v = body[key];

        if (v.t() == crow::json::type::Number) {
            double d = v.d();
            if (std::floor(d) != d) return std::nullopt;
            if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) return std::nullopt;
            return static_cast<int>(d);
        }
        if (v.t() == crow::json::type::String) {
            std::string text = v.s();
            try {
                size_t consumed = 0;
                int value = std::stoi(text, &consumed);
                if (consumed == text.size()) return value;
            }
            catch (const std::exception&) {
            }
        }
        return std::nullopt;
    }

    template <typename T>
    std::optional<T> enumField(const crow::json::rvalue& body, const char* key, T fallback,
        std::optional<T>(*parse)(std::string_view)) {
        if (!body.has(key) || body[key].t() == crow::json::type::Null) return fallback;
        auto text = stringField(body, key);
        if (!text) return std::nullopt;
        return parse(*text);
    }

    crow::response invalidBody() {
        return JsonViews::error(ErrorKind::InvalidRequest, "Request body must be a JSON object.");
    }

}

HttpServer::HttpServer(
    std::shared_ptr<GameEngine> engine,
    ServerConfig config
) : engine(std::move(engine)),
config(std::move(config))
{
    Log::info("[INIT] HttpServer ready.");
}

void HttpServer::run() {

    crow::SimpleApp app;

    if (config.logLevel == "debug") app.loglevel(crow::LogLevel::Debug);
    else if (config.logLevel == "warning") app.loglevel(crow::LogLevel::Warning);
    else if (config.logLevel == "error") app.loglevel(crow::LogLevel::Error);
    else app.loglevel(crow::LogLevel::Info);

    CROW_ROUTE(app, "/api/health")
        ([this]() { return handleHealth(); });

    CROW_ROUTE(app, "/api/game/new").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req) { return handleNewGame(req); });

    CROW_ROUTE(app, "/api/game/<string>/join").methods(crow::HTTPMethod::POST)
        ([this](std::string gameId) { return handleJoin(gameId); });

    CROW_ROUTE(app, "/api/game/<string>/state").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, std::string gameId) { return handleState(req, gameId); });

    CROW_ROUTE(app, "/api/game/<string>/flip").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, std::string gameId) { return handleFlip(req, gameId); });

    CROW_ROUTE(app, "/api/game/<string>/reset").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, std::string gameId) { return handleReset(req, gameId); });

    CROW_ROUTE(app, "/api/game/<string>/time-bonus").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, std::string gameId) { return handleTimeBonus(req, gameId); });

    CROW_ROUTE(app, "/api/game/<string>/roast").methods(crow::HTTPMethod::GET)
        ([this](const crow::request& req, std::string gameId) { return handleRoast(req, gameId); });

    CROW_ROUTE(app, "/api/game/<string>/opponent-move").methods(crow::HTTPMethod::GET)
        ([this](std::string gameId) { return handleOpponentMove(gameId); });

    CROW_ROUTE(app, "/api/game/<string>/history").methods(crow::HTTPMethod::GET)
        ([this](std::string gameId) { return handleHistory(gameId); });

    CROW_ROUTE(app, "/api/game/<string>/opponent-memory").methods(crow::HTTPMethod::GET)
        ([this](std::string gameId) { return handleOpponentMemory(gameId); });

    Log::info(std::format("[HTTP] Listening on {}:{}", config.bindAddress, config.port));

    app.bindaddr(config.bindAddress).port(config.port).multithreaded().run();
}

std::optional<std::string> HttpServer::extractToken(const crow::request& req, const crow::json::rvalue* body) {
    if (body) {
        if (auto token = stringField(*body, "player_token")) return token;
    }
    if (const char* query = req.url_params.get("token")) {
        return std::string(query);
    }
    std::string header = req.get_header_value("X-Player-Token");
    if (!header.empty()) return header;
    return std::nullopt;
}

crow::response HttpServer::handleHealth() {
    crow::json::wvalue body;
    body["status"] = "ok";
    body["games"] = static_cast<int>(engine->getStore()->size());
    return JsonViews::ok(std::move(body));
}

crow::response HttpServer::handleNewGame(const crow::request& req) {
    auto body = parseBody(req);
    if (!isObject(body)) return invalidBody();

    NewGameRequest request;

    auto difficulty = enumField(body, "difficulty", Difficulty::Medium, &parseDifficulty);
    auto theme = enumField(body, "theme", Theme::Pokemon, &parseTheme);
    auto aiDifficulty = enumField(body, "ai_difficulty", Difficulty::Medium, &parseDifficulty);

    if (!difficulty || !theme || !aiDifficulty) {
        return JsonViews::error(ErrorKind::InvalidRequest,
            "difficulty and ai_difficulty must be easy|medium|hard, theme must be pokemon|emoji|flags.");
    }

    request.difficulty = *difficulty;
    request.theme = *theme;
    request.aiDifficulty = *aiDifficulty;
    request.multiplayer = boolField(body, "multiplayer", false);
    request.aiMode = boolField(body, "ai_mode", false);
    request.daily = boolField(body, "daily", false);
    request.timeAttack = boolField(body, "time_attack", false);
    request.timeSeconds = intField(body, "time_seconds").value_or(0);

    if (body.has("seed") && body["seed"].t() != crow::json::type::Null) {
        request.seed = stringField(body, "seed");
        if (!request.seed) {
            auto numeric = intField(body, "seed");
            if (!numeric) return JsonViews::error(ErrorKind::InvalidRequest, "seed must be a string.");
            request.seed = std::to_string(*numeric);
        }
    }

    auto result = engine->createGame(request);
    if (!result.success) return JsonViews::error(result.error, result.message);

    return JsonViews::ok(JsonViews::newGame(result));
}

crow::response HttpServer::handleJoin(const std::string& gameId) {
    auto result = engine->joinGame(gameId);
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue body;
    body["success"] = true;
    body["game_id"] = gameId;
    body["player"] = toString(Seat::Player2);
    body["player_token"] = result.playerToken;
    return JsonViews::ok(std::move(body));
}

crow::response HttpServer::handleState(const crow::request& req, const std::string& gameId) {
    auto result = engine->getState(gameId, extractToken(req, nullptr));
    if (!result.success) return JsonViews::error(result.error, result.message);

    return JsonViews::ok(JsonViews::state(result.state));
}

crow::response HttpServer::handleFlip(const crow::request& req, const std::string& gameId) {
    auto body = parseBody(req);
    if (!isObject(body)) return invalidBody();

    auto cardId = intField(body, "card_id");
    if (!cardId) {
        return JsonViews::error(ErrorKind::InvalidRequest, "card_id must be an integer.");
    }

    auto player = enumField(body, "player", Seat::Player1, &parseSeat);
    if (!player) {
        return JsonViews::error(ErrorKind::InvalidRequest, "player must be player1 or player2.");
    }

    auto result = engine->flip(gameId, *cardId, *player, extractToken(req, &body));

    crow::response res = JsonViews::ok(JsonViews::flip(result));
    if (auto* rejected = std::get_if<FlipRejected>(&result.outcome)) {
        res.code = JsonViews::statusFor(rejected->error);
    }
    return res;
}

crow::response HttpServer::handleReset(const crow::request& req, const std::string& gameId) {
    auto body = parseBody(req);
    if (!isObject(body)) return invalidBody();

    auto result = engine->resetUnmatched(gameId, extractToken(req, &body));
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["cards"] = JsonViews::cardViews(StateView::publicView(result.state));
    return JsonViews::ok(std::move(reply));
}

crow::response HttpServer::handleTimeBonus(const crow::request& req, const std::string& gameId) {
    auto body = parseBody(req);
    if (!isObject(body)) return invalidBody();

    auto secondsLeft = intField(body, "seconds_left");
    if (body.has("seconds_left") && !secondsLeft) {
        return JsonViews::error(ErrorKind::InvalidRequest, "seconds_left must be an integer.");
    }

    auto result = engine->applyTimeBonus(gameId, secondsLeft.value_or(0), extractToken(req, &body));
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["bonus"] = result.bonus;
    reply["player_score"] = result.playerScore;
    return JsonViews::ok(std::move(reply));
}

crow::response HttpServer::handleRoast(const crow::request& req, const std::string& gameId) {
    Seat player = Seat::Player1;
    if (const char* requested = req.url_params.get("player")) {
        auto parsed = parseSeat(requested);
        if (!parsed) return JsonViews::error(ErrorKind::InvalidRequest, "player must be player1 or player2.");
        player = *parsed;
    }

    auto result = engine->roast(gameId, player);
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["roast"] = result.roast;
    return JsonViews::ok(std::move(reply));
}

crow::response HttpServer::handleOpponentMove(const std::string& gameId) {
    auto result = engine->opponentMove(gameId);
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["card_id"] = result.cardId;
    return JsonViews::ok(std::move(reply));
}

crow::response HttpServer::handleHistory(const std::string& gameId) {
    auto result = engine->history(gameId);
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["move_history"] = JsonViews::moves(result.state.moveHistory, JsonViews::HistoryMoves);
    reply["commentary_history"] = JsonViews::commentary(result.state.commentaryHistory, result.state.commentaryHistory.size());
    return JsonViews::ok(std::move(reply));
}

crow::response HttpServer::handleOpponentMemory(const std::string& gameId) {
    auto result = engine->opponentMemory(gameId);
    if (!result.success) return JsonViews::error(result.error, result.message);

    crow::json::wvalue reply;
    reply["success"] = true;
    reply["memory"] = JsonViews::memory(result.memory);
    return JsonViews::ok(std::move(reply));
}
