#pragma once

#include "../shared/DTOs.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace MemoryDuel {

	struct DeckResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		std::vector<Card> cards;
	};

	struct ScoreBoard {
		int player1Score{ 0 };
		int player2Score{ 0 };
		double player1Accuracy{ 0.0 };
		double player2Accuracy{ 0.0 };
		int bestStreak{ 0 };
		Seat currentPlayer{ Seat::Player1 };
	};

	// Flip outcomes

	struct FlipRejected {
		ErrorKind error{ ErrorKind::InvalidCard };
		std::string message;
	};

	struct FirstCardRevealed {
		Card card;
		Seat player{ Seat::Player1 };
		ScoreBoard scores;
	};

	struct PairResolved {
		bool match{ false };
		Card first;
		Card second;
		Seat player{ Seat::Player1 };
		int moves{ 0 };
		int matches{ 0 };
		int streak{ 0 };
		int pointsAwarded{ 0 };
		bool gameWon{ false };
		std::string commentary;
		ScoreBoard scores;
	};

	using FlipOutcome = std::variant<FlipRejected, FirstCardRevealed, PairResolved>;

	// Engine requests and results

	struct NewGameRequest {
		Difficulty difficulty{ Difficulty::Medium };
		Theme theme{ Theme::Pokemon };
		bool multiplayer{ false };
		bool aiMode{ false };
		Difficulty aiDifficulty{ Difficulty::Medium };
		bool daily{ false };
		std::optional<std::string> seed;
		bool timeAttack{ false };
		int timeSeconds{ 0 };
	};

	struct NewGameResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		std::string gameId;
		std::optional<std::string> playerToken;
		GameState state;
	};

	struct JoinResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		std::string playerToken;
	};

	struct SnapshotResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		GameState state;
	};

	struct FlipResult {
		FlipOutcome outcome;
		std::optional<GameState> state;
	};

	struct TimeBonusResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		int bonus{ 0 };
		int playerScore{ 0 };
	};

	struct RoastResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		std::string roast;
	};

	struct OpponentMoveResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		int cardId{ -1 };
	};

	struct MemoryHudEntry {
		int pairKey{ 0 };
		std::string name;
		int seen{ 0 };
	};

	struct OpponentMemoryResult {
		bool success{ false };
		ErrorKind error{ ErrorKind::None };
		std::string message;
		std::vector<MemoryHudEntry> memory;
	};

}
