#include "GameEngine.hpp"
#include "CommentarySystem.hpp"
#include "DeckBuilder.hpp"
#include "FlipSystem.hpp"
#include "OpponentSystem.hpp"
#include "../infra/Log.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <random>

namespace MemoryDuel {

    namespace {

        template <typename Result>
        Result failure(ErrorKind kind, std::string message) {
            Result result;
            result.success = false;
            result.error = kind;
            result.message = std::move(message);
            return result;
        }

        std::string gameNotFoundMessage(const std::string& gameId) {
            return std::format("Game not found: {}", gameId);
        }

        std::string generateToken() {
            thread_local std::mt19937_64 gen{ std::random_device{}() };
            return std::format("{:016x}{:016x}", gen(), gen());
        }

        // Any seated identity may read or reset a shared board.
        std::optional<FlipRejected> authorizeAnySeat(const GameState& state, const std::optional<std::string>& token) {
            if (!state.isMultiplayer()) return std::nullopt;

            if (!token || token->empty()) {
                return FlipRejected{ ErrorKind::TokenRequired, "A seat token is required for this game." };
            }
            if (token == state.player1Token || token == state.player2Token) {
                return std::nullopt;
            }
            return FlipRejected{ ErrorKind::InvalidToken, "Token does not match any seat." };
        }

        bool tokenRejection(ErrorKind kind) {
            return kind == ErrorKind::TokenRequired || kind == ErrorKind::InvalidToken;
        }

    }

    class GameEngine::Impl {
    public:
        Impl(std::shared_ptr<GameStore> store,
            std::shared_ptr<IllustrationProvider> illustrations,
            std::shared_ptr<CommentaryProvider> commentaryProvider,
            std::shared_ptr<RandomSource> random,
            std::shared_ptr<TaskQueue> taskQueue)
            : store(std::move(store)),
            taskQueue(taskQueue),
            deckBuilder(std::move(illustrations), taskQueue),
            commentary(std::make_shared<CommentarySystem>(std::move(commentaryProvider))),
            flipSystem(commentary),
            opponentSystem(std::move(random)) {
        }

        std::shared_ptr<GameStore> store;
        std::shared_ptr<TaskQueue> taskQueue;
        DeckBuilder deckBuilder;
        std::shared_ptr<CommentarySystem> commentary;
        FlipSystem flipSystem;
        OpponentSystem opponentSystem;

        void scheduleReap() {
            if (!taskQueue || store->ttl().count() <= 0) return;
            try {
                taskQueue->enqueue([store = store]() { store->reapExpired(); });
            }
            catch (const std::exception& e) {
                Log::warn(std::format("[STORE] Reap not scheduled: {}", e.what()));
            }
        }
    };

    GameEngine::GameEngine(
        std::shared_ptr<GameStore> store,
        std::shared_ptr<IllustrationProvider> illustrations,
        std::shared_ptr<CommentaryProvider> commentary,
        std::shared_ptr<RandomSource> random,
        std::shared_ptr<TaskQueue> taskQueue)
        : pImpl(std::make_unique<Impl>(std::move(store), std::move(illustrations),
            std::move(commentary), std::move(random), std::move(taskQueue))) {
    }

    GameEngine::~GameEngine() = default;

    std::shared_ptr<GameStore> GameEngine::getStore() const {
        return pImpl->store;
    }

    std::string GameEngine::dailySeed(Difficulty difficulty, Theme theme, std::chrono::system_clock::time_point day) {
        std::tm local = Log::localTime(std::chrono::system_clock::to_time_t(day));

        char date[16];
        std::strftime(date, sizeof(date), "%Y-%m-%d", &local);

        return std::format("{}-{}-{}", date, toString(difficulty), toString(theme));
    }

    NewGameResult GameEngine::createGame(const NewGameRequest& request) {
        GameState state;

        state.settings.difficulty = request.difficulty;
        state.settings.theme = request.theme;
        state.settings.aiDifficulty = request.aiDifficulty;
        state.settings.daily = request.daily;

        if (request.multiplayer) {
            state.settings.mode = GameMode::VsHuman;
        }
        else if (request.aiMode) {
            state.settings.mode = GameMode::VsAi;
        }
        else {
            state.settings.mode = GameMode::Solo;
        }

        state.settings.seed = request.seed;
        if (request.daily && !state.settings.seed) {
            state.settings.seed = dailySeed(request.difficulty, request.theme);
        }

        state.settings.timeAttack = request.timeAttack && !request.multiplayer;
        state.settings.timeSeconds = state.settings.timeAttack ? std::max(0, request.timeSeconds) : 0;

        state.pairs = pairsFor(request.difficulty);

        auto deck = pImpl->deckBuilder.build(request.theme, state.pairs, state.settings.seed);
        if (!deck.success) {
            Log::warn(std::format("[GAME] Deck build failed: {}", deck.message));
            return failure<NewGameResult>(deck.error, deck.message);
        }
        state.cards = std::move(deck.cards);

        state.currentPlayer = Seat::Player1;
        if (state.isMultiplayer()) {
            state.player1Token = generateToken();
        }
        state.player2Joined = state.settings.mode != GameMode::VsHuman;

        NewGameResult result;
        result.playerToken = state.player1Token;
        result.gameId = pImpl->store->insert(state);
        state.gameId = result.gameId;

        Log::info(std::format("[GAME] Created {} ({}, {}, {} pairs{})",
            result.gameId, toString(state.settings.mode), toString(state.settings.theme), state.pairs,
            state.settings.seed ? ", seed " + *state.settings.seed : std::string()));

        result.success = true;
        result.state = std::move(state);

        pImpl->scheduleReap();
        return result;
    }

    JoinResult GameEngine::joinGame(const std::string& gameId) {
        JoinResult result;

        bool found = pImpl->store->withGame(gameId, [&](GameState& state) {
            if (state.settings.mode != GameMode::VsHuman) {
                result = failure<JoinResult>(ErrorKind::InvalidPlayerForMode, "Only vs_human games have a second seat to join.");
                return;
            }
            if (state.player2Joined) {
                result = failure<JoinResult>(ErrorKind::SeatTaken, "The second seat is already taken.");
                return;
            }

            state.player2Token = generateToken();
            state.player2Joined = true;

            result.success = true;
            result.playerToken = *state.player2Token;
            });

        if (!found) {
            return failure<JoinResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        if (result.success) {
            Log::info(std::format("[GAME] Second player joined {}", gameId));
        }
        return result;
    }

    SnapshotResult GameEngine::getState(const std::string& gameId, const std::optional<std::string>& token) {
        auto stateOpt = pImpl->store->getGameState(gameId);
        if (!stateOpt) {
            return failure<SnapshotResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }

        if (auto rejected = authorizeAnySeat(*stateOpt, token)) {
            return failure<SnapshotResult>(rejected->error, rejected->message);
        }

        return { .success = true, .state = std::move(*stateOpt) };
    }

    FlipResult GameEngine::flip(
        const std::string& gameId,
        int cardId,
        Seat player,
        const std::optional<std::string>& token) {

        FlipResult result{ .outcome = FlipRejected{ ErrorKind::GameNotFound, gameNotFoundMessage(gameId) } };

        pImpl->store->withGame(gameId, [&](GameState& state) {
            result.outcome = pImpl->flipSystem.flip(state, cardId, player, token);

            auto* rejected = std::get_if<FlipRejected>(&result.outcome);
            if (!rejected || !tokenRejection(rejected->error)) {
                result.state = state;
            }
            });

        if (auto* resolved = std::get_if<PairResolved>(&result.outcome); resolved && resolved->gameWon) {
            Log::info(std::format("[GAME] {} cleared in {} moves", gameId, resolved->moves));
        }
        return result;
    }

    SnapshotResult GameEngine::resetUnmatched(const std::string& gameId, const std::optional<std::string>& token) {
        SnapshotResult result;

        bool found = pImpl->store->withGame(gameId, [&](GameState& state) {
            if (auto rejected = authorizeAnySeat(state, token)) {
                result = failure<SnapshotResult>(rejected->error, rejected->message);
                return;
            }
            pImpl->flipSystem.resetUnmatched(state);
            result.success = true;
            result.state = state;
            });

        if (!found) {
            return failure<SnapshotResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        return result;
    }

    TimeBonusResult GameEngine::applyTimeBonus(
        const std::string& gameId,
        int secondsLeft,
        const std::optional<std::string>& token) {

        TimeBonusResult result;

        bool found = pImpl->store->withGame(gameId, [&](GameState& state) {
            if (state.isMultiplayer()) {
                if (auto rejected = FlipSystem::authorize(state, Seat::Player1, token)) {
                    result = failure<TimeBonusResult>(rejected->error, rejected->message);
                    return;
                }
            }

            result.bonus = std::max(0, secondsLeft) / 10;
            state.player1.score += result.bonus;

            result.success = true;
            result.playerScore = state.player1.score;
            });

        if (!found) {
            return failure<TimeBonusResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        return result;
    }

    RoastResult GameEngine::roast(const std::string& gameId, Seat player) {
        auto stateOpt = pImpl->store->getGameState(gameId);
        if (!stateOpt) {
            return failure<RoastResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        if (!stateOpt->isMultiplayer() && player != Seat::Player1) {
            return failure<RoastResult>(ErrorKind::InvalidPlayerForMode, "Solo games only have player1.");
        }

        // Works on a snapshot: the text call must not hold the game lock.
        return { .success = true, .roast = pImpl->commentary->roast(*stateOpt, player) };
    }

    OpponentMoveResult GameEngine::opponentMove(const std::string& gameId) {
        OpponentMoveResult result;

        bool found = pImpl->store->withGame(gameId, [&](GameState& state) {
            if (!state.hasOpponent()) {
                result = failure<OpponentMoveResult>(ErrorKind::OpponentNotConfigured, "This game has no AI opponent.");
                return;
            }
            result = pImpl->opponentSystem.chooseMove(state);
            });

        if (!found) {
            return failure<OpponentMoveResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        return result;
    }

    SnapshotResult GameEngine::history(const std::string& gameId) {
        auto stateOpt = pImpl->store->getGameState(gameId);
        if (!stateOpt) {
            return failure<SnapshotResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        return { .success = true, .state = std::move(*stateOpt) };
    }

    OpponentMemoryResult GameEngine::opponentMemory(const std::string& gameId) {
        auto stateOpt = pImpl->store->getGameState(gameId);
        if (!stateOpt) {
            return failure<OpponentMemoryResult>(ErrorKind::GameNotFound, gameNotFoundMessage(gameId));
        }
        if (!stateOpt->hasOpponent()) {
            return failure<OpponentMemoryResult>(ErrorKind::OpponentNotConfigured, "This game has no AI opponent.");
        }
        // Same window the opponent decides with, applied to the snapshot only.
        OpponentSystem::refreshMemory(*stateOpt, OpponentProfile::forDifficulty(stateOpt->settings.aiDifficulty));
        return { .success = true, .memory = OpponentSystem::memoryHud(*stateOpt) };
    }
}
