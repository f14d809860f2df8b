#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "../storage/GameStore.hpp"
#include "../external/CommentaryProvider.hpp"
#include "../external/IllustrationProvider.hpp"
#include "../infra/TaskQueue.hpp"
#include "RandomSource.hpp"
#include "Types.hpp"

namespace MemoryDuel {

    class GameEngine {
    public:
        // taskQueue may be null: identity lookups then run inline and no reaping is scheduled.
        GameEngine(
            std::shared_ptr<GameStore> store,
            std::shared_ptr<IllustrationProvider> illustrations,
            std::shared_ptr<CommentaryProvider> commentary,
            std::shared_ptr<RandomSource> random,
            std::shared_ptr<TaskQueue> taskQueue
        );
        ~GameEngine();

        NewGameResult createGame(const NewGameRequest& request);

        JoinResult joinGame(const std::string& gameId);

        SnapshotResult getState(const std::string& gameId, const std::optional<std::string>& token);

        FlipResult flip(
            const std::string& gameId,
            int cardId,
            Seat player,
            const std::optional<std::string>& token
        );

        SnapshotResult resetUnmatched(const std::string& gameId, const std::optional<std::string>& token);

        TimeBonusResult applyTimeBonus(
            const std::string& gameId,
            int secondsLeft,
            const std::optional<std::string>& token
        );

        RoastResult roast(const std::string& gameId, Seat player);

        OpponentMoveResult opponentMove(const std::string& gameId);

        SnapshotResult history(const std::string& gameId);

        OpponentMemoryResult opponentMemory(const std::string& gameId);

        std::shared_ptr<GameStore> getStore() const;

        // "YYYY-MM-DD-difficulty-theme" for the local date of `day`.
        static std::string dailySeed(
            Difficulty difficulty,
            Theme theme,
            std::chrono::system_clock::time_point day = std::chrono::system_clock::now()
        );

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };
}
