#include "JsonViews.hpp"
#include "../engine/StateView.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace MemoryDuel::JsonViews {

	namespace {

		void setOptional(crow::json::wvalue& target, const char* key, const std::optional<std::string>& value) {
			if (value) target[key] = *value;
			else target[key] = nullptr;
		}

	}

	int statusFor(ErrorKind kind) {
		switch (kind) {
		case ErrorKind::GameNotFound:  return 404;
		case ErrorKind::TokenRequired: return 401;
		case ErrorKind::InvalidToken:  return 403;
		case ErrorKind::NotYourTurn:
		case ErrorKind::SeatTaken:     return 409;
		case ErrorKind::None:          return 200;
		default:                       return 400;
		}
	}

	crow::response error(ErrorKind kind, const std::string& message) {
		crow::json::wvalue body;
		body["success"] = false;
		body["error"] = toString(kind);
		body["message"] = message;

		crow::response res(std::move(body));
		res.code = statusFor(kind);
		return res;
	}

	crow::response ok(crow::json::wvalue body) {
		crow::response res(std::move(body));
		res.code = 200;
		return res;
	}

	crow::json::wvalue cardViews(const std::vector<CardView>& cards) {
		crow::json::wvalue list = crow::json::wvalue::list();
		int index = 0;

		for (const auto& cv : cards) {
			crow::json::wvalue item;
			item["id"] = cv.id;
			item["flipped"] = cv.flipped;
			item["matched"] = cv.matched;
			setOptional(item, "name", cv.name);
			setOptional(item, "image", cv.image);
			setOptional(item, "emoji", cv.emoji);
			list[index++] = std::move(item);
		}
		return list;
	}

	crow::json::wvalue card(const Card& c) {
		crow::json::wvalue item;
		item["id"] = c.id;
		item["name"] = c.name;
		setOptional(item, "image", c.image);
		setOptional(item, "emoji", c.emoji);
		item["flipped"] = c.flipped;
		item["matched"] = c.matched;
		return item;
	}

	crow::json::wvalue moves(const std::vector<MoveRecord>& history, size_t lastN) {
		crow::json::wvalue list = crow::json::wvalue::list();
		size_t start = history.size() > lastN ? history.size() - lastN : 0;
		int index = 0;

		for (size_t i = start; i < history.size(); ++i) {
			const auto& move = history[i];
			crow::json::wvalue item;
			item["card_id"] = move.cardId;
			item["pair_key"] = move.pairKey;
			item["name"] = move.name;
			item["move_number"] = move.moveNumber;
			item["player"] = toString(move.player);
			list[index++] = std::move(item);
		}
		return list;
	}

	crow::json::wvalue commentary(const std::vector<CommentaryEntry>& history, size_t lastN) {
		crow::json::wvalue list = crow::json::wvalue::list();
		size_t start = history.size() > lastN ? history.size() - lastN : 0;
		int index = 0;

		for (size_t i = start; i < history.size(); ++i) {
			const auto& entry = history[i];
			crow::json::wvalue item;
			item["text"] = entry.text;
			item["type"] = toString(entry.type);
			item["player"] = toString(entry.player);
			item["move"] = entry.move;
			list[index++] = std::move(item);
		}
		return list;
	}

	crow::json::wvalue memory(const std::vector<MemoryHudEntry>& entries) {
		crow::json::wvalue list = crow::json::wvalue::list();
		int index = 0;

		for (const auto& entry : entries) {
			crow::json::wvalue item;
			item["pair_key"] = entry.pairKey;
			item["name"] = entry.name;
			item["seen"] = entry.seen;
			list[index++] = std::move(item);
		}
		return list;
	}

	void writeScores(crow::json::wvalue& target, const ScoreBoard& scores) {
		target["player1_score"] = scores.player1Score;
		target["player2_score"] = scores.player2Score;
		target["player1_accuracy"] = scores.player1Accuracy;
		target["player2_accuracy"] = scores.player2Accuracy;

		// Single-player client field names.
		target["player_score"] = scores.player1Score;
		target["ai_score"] = scores.player2Score;
		target["player_accuracy"] = scores.player1Accuracy;
		target["ai_accuracy"] = scores.player2Accuracy;

		target["best_streak"] = scores.bestStreak;
		target["current_player"] = toString(scores.currentPlayer);
	}

	void writeSettings(crow::json::wvalue& target, const GameState& state) {
		const auto& settings = state.settings;

		target["game_id"] = state.gameId;
		target["pairs"] = state.pairs;
		target["difficulty"] = toString(settings.difficulty);
		target["theme"] = toString(settings.theme);
		target["mode"] = toString(settings.mode);
		target["multiplayer"] = settings.mode == GameMode::VsHuman;
		target["ai_mode"] = settings.mode == GameMode::VsAi;
		target["ai_difficulty"] = toString(settings.aiDifficulty);
		setOptional(target, "seed", settings.seed);
		target["daily"] = settings.daily;
		target["time_attack"] = settings.timeAttack;
		target["time_seconds"] = settings.timeSeconds;
		target["player2_joined"] = state.player2Joined;
	}

	crow::json::wvalue newGame(const NewGameResult& result) {
		crow::json::wvalue body;
		body["success"] = true;
		writeSettings(body, result.state);
		setOptional(body, "player_token", result.playerToken);
		body["cards"] = cardViews(StateView::publicView(result.state));
		// Competitive games never see the deal.
		if (result.state.settings.mode == GameMode::Solo) {
			body["preview_cards"] = cardViews(StateView::fullView(result.state));
		}
		writeScores(body, StateView::scoreBoard(result.state));
		return body;
	}

	crow::json::wvalue state(const GameState& s) {
		crow::json::wvalue body;
		body["success"] = true;
		writeSettings(body, s);
		body["cards"] = cardViews(StateView::publicView(s));
		body["moves"] = s.moves;
		body["matches"] = s.matches;
		body["game_complete"] = s.isComplete();
		writeScores(body, StateView::scoreBoard(s));
		body["commentary_history"] = commentary(s.commentaryHistory, RecentCommentary);
		return body;
	}

	crow::json::wvalue flip(const FlipResult& result) {
		crow::json::wvalue body;

		std::visit([&body](const auto& outcome) {
			using T = std::decay_t<decltype(outcome)>;

			if constexpr (std::is_same_v<T, FlipRejected>) {
				body["success"] = false;
				body["error"] = toString(outcome.error);
				body["message"] = outcome.message;
			}
			else if constexpr (std::is_same_v<T, FirstCardRevealed>) {
				body["success"] = true;
				body["resolved"] = false;
				body["card"] = card(outcome.card);
				body["player"] = toString(outcome.player);
				body["commentary"] = "";
				writeScores(body, outcome.scores);
			}
			else {
				body["success"] = true;
				body["resolved"] = true;
				body["match"] = outcome.match;

				crow::json::wvalue pair = crow::json::wvalue::list();
				pair[0] = card(outcome.first);
				pair[1] = card(outcome.second);
				body["cards"] = std::move(pair);

				body["player"] = toString(outcome.player);
				body["moves"] = outcome.moves;
				body["matches"] = outcome.matches;
				body["streak"] = outcome.streak;
				body["points_awarded"] = outcome.pointsAwarded;
				body["game_won"] = outcome.gameWon;
				body["commentary"] = outcome.commentary;
				writeScores(body, outcome.scores);
			}
			}, result.outcome);

		if (result.state) {
			body["cards_state"] = cardViews(StateView::publicView(*result.state));
			body["commentary_history"] = commentary(result.state->commentaryHistory, RecentCommentary);
		}
		return body;
	}

}
