#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace MemoryDuel {

	enum class Difficulty {
		Easy,
		Medium,
		Hard
	};

	enum class Theme {
		Pokemon,
		Emoji,
		Flags
	};

	enum class GameMode {
		Solo,
		VsAi,
		VsHuman
	};

	enum class Seat {
		Player1,
		Player2
	};

	enum class CommentaryType {
		Match,
		Miss,
		Endgame
	};

	enum class ErrorKind {
		None,
		GameNotFound,
		TokenRequired,
		InvalidToken,
		NotYourTurn,
		InvalidCard,
		InvalidPlayerForMode,
		NoValidMoves,
		InsufficientPoolSize,
		SeatTaken,
		OpponentNotConfigured,
		InvalidRequest
	};

	std::string toString(Difficulty difficulty);
	std::string toString(Theme theme);
	std::string toString(GameMode mode);
	std::string toString(Seat seat);
	std::string toString(CommentaryType type);
	std::string toString(ErrorKind kind);

	std::optional<Difficulty> parseDifficulty(std::string_view text);
	std::optional<Theme> parseTheme(std::string_view text);
	std::optional<Seat> parseSeat(std::string_view text);

	inline Seat otherSeat(Seat seat) {
		return seat == Seat::Player1 ? Seat::Player2 : Seat::Player1;
	}

	// easy=6, medium=8, hard=12
	int pairsFor(Difficulty difficulty);
}
