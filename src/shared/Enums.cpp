#include "Enums.hpp"

using namespace MemoryDuel;

std::string MemoryDuel::toString(Difficulty difficulty) {
	switch (difficulty) {
	case Difficulty::Easy:   return "easy";
	case Difficulty::Medium: return "medium";
	case Difficulty::Hard:   return "hard";
	}
	return "medium";
}

std::string MemoryDuel::toString(Theme theme) {
	switch (theme) {
	case Theme::Pokemon: return "pokemon";
	case Theme::Emoji:   return "emoji";
	case Theme::Flags:   return "flags";
	}
	return "pokemon";
}

std::string MemoryDuel::toString(GameMode mode) {
	switch (mode) {
	case GameMode::Solo:    return "solo";
	case GameMode::VsAi:    return "vs_ai";
	case GameMode::VsHuman: return "vs_human";
	}
	return "solo";
}

std::string MemoryDuel::toString(Seat seat) {
	return seat == Seat::Player1 ? "player1" : "player2";
}

std::string MemoryDuel::toString(CommentaryType type) {
	switch (type) {
	case CommentaryType::Match:   return "match";
	case CommentaryType::Miss:    return "miss";
	case CommentaryType::Endgame: return "endgame";
	}
	return "match";
}

std::string MemoryDuel::toString(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::None:                  return "None";
	case ErrorKind::GameNotFound:          return "GameNotFound";
	case ErrorKind::TokenRequired:         return "TokenRequired";
	case ErrorKind::InvalidToken:          return "InvalidToken";
	case ErrorKind::NotYourTurn:           return "NotYourTurn";
	case ErrorKind::InvalidCard:           return "InvalidCard";
	case ErrorKind::InvalidPlayerForMode:  return "InvalidPlayerForMode";
	case ErrorKind::NoValidMoves:          return "NoValidMoves";
	case ErrorKind::InsufficientPoolSize:  return "InsufficientPoolSize";
	case ErrorKind::SeatTaken:             return "SeatTaken";
	case ErrorKind::OpponentNotConfigured: return "OpponentNotConfigured";
	case ErrorKind::InvalidRequest:        return "InvalidRequest";
	}
	return "InvalidRequest";
}

std::optional<Difficulty> MemoryDuel::parseDifficulty(std::string_view text) {
	if (text == "easy") return Difficulty::Easy;
	if (text == "medium") return Difficulty::Medium;
	if (text == "hard") return Difficulty::Hard;
	return std::nullopt;
}

std::optional<Theme> MemoryDuel::parseTheme(std::string_view text) {
	if (text == "pokemon") return Theme::Pokemon;
	if (text == "emoji") return Theme::Emoji;
	if (text == "flags") return Theme::Flags;
	return std::nullopt;
}

std::optional<Seat> MemoryDuel::parseSeat(std::string_view text) {
	if (text == "player1") return Seat::Player1;
	if (text == "player2") return Seat::Player2;
	return std::nullopt;
}

int MemoryDuel::pairsFor(Difficulty difficulty) {
	switch (difficulty) {
	case Difficulty::Easy: return 6;
	case Difficulty::Hard: return 12;
	default:               return 8;
	}
}
