#include "StateView.hpp"

#include <cmath>

namespace MemoryDuel::StateView {

	std::vector<CardView> publicView(const GameState& state) {
		std::vector<CardView> view;
		view.reserve(state.cards.size());

		for (const auto& card : state.cards) {
			CardView cv{ .id = card.id, .flipped = card.flipped, .matched = card.matched };
			if (card.flipped || card.matched) {
				cv.name = card.name;
				cv.image = card.image;
				cv.emoji = card.emoji;
			}
			view.push_back(std::move(cv));
		}
		return view;
	}

	std::vector<CardView> fullView(const GameState& state) {
		std::vector<CardView> view;
		view.reserve(state.cards.size());

		for (const auto& card : state.cards) {
			view.push_back({
				.id = card.id,
				.flipped = card.flipped,
				.matched = card.matched,
				.name = card.name,
				.image = card.image,
				.emoji = card.emoji
				});
		}
		return view;
	}

	double accuracy(const PlayerStats& stats) {
		if (stats.attempts == 0) return 0.0;
		double pct = static_cast<double>(stats.pairsWon) / stats.attempts * 100.0;
		return std::round(pct * 10.0) / 10.0;
	}

	ScoreBoard scoreBoard(const GameState& state) {
		return {
			.player1Score = state.player1.score,
			.player2Score = state.player2.score,
			.player1Accuracy = accuracy(state.player1),
			.player2Accuracy = accuracy(state.player2),
			.bestStreak = state.bestStreak,
			.currentPlayer = state.currentPlayer
		};
	}

}
