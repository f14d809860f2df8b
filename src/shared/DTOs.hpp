#pragma once

#include "Enums.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MemoryDuel {

	struct Card {
		int id{ 0 };
		int pairKey{ 0 };
		std::string name;

		// Exactly one of these is set, depending on the theme.
		std::optional<std::string> image;
		std::optional<std::string> emoji;

		bool flipped{ false };
		bool matched{ false };
	};

	// What a client is allowed to see of a card.
	struct CardView {
		int id{ 0 };
		bool flipped{ false };
		bool matched{ false };
		std::optional<std::string> name;
		std::optional<std::string> image;
		std::optional<std::string> emoji;
	};

	struct MoveRecord {
		int cardId{ 0 };
		int pairKey{ 0 };
		std::string name;
		int moveNumber{ 0 };
		Seat player{ Seat::Player1 };
	};

	struct CommentaryEntry {
		std::string text;
		CommentaryType type{ CommentaryType::Match };
		Seat player{ Seat::Player1 };
		int move{ 0 };
	};

	struct PlayerStats {
		int score{ 0 };
		int attempts{ 0 };
		int pairsWon{ 0 };
		int streak{ 0 };
	};

	struct OpponentProfile {
		static constexpr std::size_t UnboundedWindow = std::numeric_limits<std::size_t>::max();

		double epsilon{ 0.20 };
		std::size_t memoryWindow{ 12 };

		static OpponentProfile forDifficulty(Difficulty difficulty) {
			switch (difficulty) {
			case Difficulty::Easy: return { .epsilon = 0.50, .memoryWindow = 6 };
			case Difficulty::Hard: return { .epsilon = 0.05, .memoryWindow = UnboundedWindow };
			default:               return { .epsilon = 0.20, .memoryWindow = 12 };
			}
		}
	};

	struct GameSettings {
		Difficulty difficulty{ Difficulty::Medium };
		Theme theme{ Theme::Pokemon };
		GameMode mode{ GameMode::Solo };
		Difficulty aiDifficulty{ Difficulty::Medium };
		std::optional<std::string> seed;
		bool daily{ false };
		bool timeAttack{ false };
		int timeSeconds{ 0 };
	};

	struct GameState {
		std::string gameId;
		GameSettings settings;
		int pairs{ 8 };

		std::vector<Card> cards;
		std::vector<int> currentFlipped;

		// Turn
		Seat currentPlayer{ Seat::Player1 };
		PlayerStats player1;
		PlayerStats player2;
		int bestStreak{ 0 };
		int moves{ 0 };
		int matches{ 0 };
		int commentaryFrequency{ 3 };

		std::vector<MoveRecord> moveHistory;
		std::vector<std::string> mistakes;
		std::vector<CommentaryEntry> commentaryHistory;

		// pair_key -> card ids seen face-up
		std::map<int, std::vector<int>> opponentMemory;

		// Seats
		std::optional<std::string> player1Token;
		std::optional<std::string> player2Token;
		bool player2Joined{ true };

		std::chrono::system_clock::time_point createdAt;
		std::chrono::system_clock::time_point lastActivity;

		PlayerStats& stats(Seat seat) {
			return seat == Seat::Player1 ? player1 : player2;
		}

		const PlayerStats& stats(Seat seat) const {
			return seat == Seat::Player1 ? player1 : player2;
		}

		Card* findCard(int cardId) {
			auto it = std::find_if(cards.begin(), cards.end(),
				[cardId](const Card& c) { return c.id == cardId; });
			return it != cards.end() ? &(*it) : nullptr;
		}

		const Card* findCard(int cardId) const {
			auto it = std::find_if(cards.begin(), cards.end(),
				[cardId](const Card& c) { return c.id == cardId; });
			return it != cards.end() ? &(*it) : nullptr;
		}

		bool hasOpponent() const {
			return settings.mode == GameMode::VsAi;
		}

		bool isMultiplayer() const {
			return settings.mode != GameMode::Solo;
		}

		bool isComplete() const {
			return matches == pairs;
		}
	};

}
