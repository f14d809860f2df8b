#pragma once

#include "../shared/DTOs.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace MemoryDuel {

	// Process-lifetime registry of games. The map has its own lock, and every game has
	// a lock of its own that serializes all mutation of that game.
	class GameStore {
	public:
		// ttl of zero keeps games until the process exits.
		explicit GameStore(std::chrono::minutes ttl = std::chrono::minutes(120));
		~GameStore() = default;

		GameStore(const GameStore&) = delete;
		GameStore& operator=(const GameStore&) = delete;

		// Assigns a fresh game id, stores the game and returns the id.
		std::string insert(GameState state);

		// Runs fn with the game locked and refreshes its activity stamp.
		// False when the id is unknown, fn is not called then.
		bool withGame(const std::string& gameId, const std::function<void(GameState&)>& fn);

		std::optional<GameState> getGameState(const std::string& gameId) const;
		bool exists(const std::string& gameId) const;
		size_t size() const;

		// Drops games idle for longer than the ttl. Never waits on a game lock: a game
		// being played is skipped. Returns how many were removed.
		size_t reapExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

		std::chrono::minutes ttl() const { return ttl_; }

	private:
		struct Entry {
			std::mutex mutex;
			GameState state;
		};

		std::shared_ptr<Entry> find(const std::string& gameId) const;
		std::string generateGameId() const;

		std::chrono::minutes ttl_;

		mutable std::mutex mutex_;
		std::unordered_map<std::string, std::shared_ptr<Entry>> games_;
	};

}
