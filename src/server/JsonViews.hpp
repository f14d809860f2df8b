#pragma once

#include "crow.h"
#include "../engine/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace MemoryDuel::JsonViews {

	constexpr size_t HistoryMoves = 20;
	constexpr size_t RecentCommentary = 5;

	int statusFor(ErrorKind kind);

	crow::response error(ErrorKind kind, const std::string& message);
	crow::response ok(crow::json::wvalue body);

	crow::json::wvalue cardViews(const std::vector<CardView>& cards);
	crow::json::wvalue card(const Card& card);
	crow::json::wvalue moves(const std::vector<MoveRecord>& history, size_t lastN);
	crow::json::wvalue commentary(const std::vector<CommentaryEntry>& history, size_t lastN);
	crow::json::wvalue memory(const std::vector<MemoryHudEntry>& entries);

	// Adds score, accuracy, streak and turn fields to an object.
	void writeScores(crow::json::wvalue& target, const ScoreBoard& scores);

	void writeSettings(crow::json::wvalue& target, const GameState& state);

	crow::json::wvalue newGame(const NewGameResult& result);
	crow::json::wvalue state(const GameState& state);
	crow::json::wvalue flip(const FlipResult& result);

}
