#include "FlipSystem.hpp"
#include "StateView.hpp"

#include <algorithm>
#include <format>

using namespace MemoryDuel;

FlipSystem::FlipSystem(std::shared_ptr<const CommentarySystem> commentary)
	: commentary(std::move(commentary)) {
}

int FlipSystem::pointsForStreak(int streak) {
	return 1 + std::max(0, streak - 1);
}

std::optional<FlipRejected> FlipSystem::authorize(
	const GameState& state,
	Seat player,
	const std::optional<std::string>& token) {

	switch (state.settings.mode) {
	case GameMode::Solo:
		if (player != Seat::Player1) {
			return FlipRejected{ ErrorKind::InvalidPlayerForMode, "Solo games only have player1." };
		}
		return std::nullopt;

	case GameMode::VsAi:
		if (player == Seat::Player2) {
			return std::nullopt;
		}
		break;

	case GameMode::VsHuman:
		break;
	}

	const auto& expected = player == Seat::Player1 ? state.player1Token : state.player2Token;

	if (!token || token->empty()) {
		return FlipRejected{ ErrorKind::TokenRequired, std::format("A token is required to act as {}.", toString(player)) };
	}
	if (!expected || *token != *expected) {
		return FlipRejected{ ErrorKind::InvalidToken, std::format("Token does not match {}.", toString(player)) };
	}
	return std::nullopt;
}

FlipOutcome FlipSystem::flip(
	GameState& state,
	int cardId,
	Seat player,
	const std::optional<std::string>& token) const {

	if (auto rejected = authorize(state, player, token)) {
		return *rejected;
	}

	if (player != state.currentPlayer) {
		return FlipRejected{ ErrorKind::NotYourTurn,
			std::format("Not your turn. Waiting for {}.", toString(state.currentPlayer)) };
	}

	Card* card = state.findCard(cardId);
	if (!card || card->matched || card->flipped || state.currentFlipped.size() >= 2) {
		return FlipRejected{ ErrorKind::InvalidCard, "Invalid card" };
	}

	card->flipped = true;
	state.currentFlipped.push_back(card->id);

	state.moveHistory.push_back({
		.cardId = card->id,
		.pairKey = card->pairKey,
		.name = card->name,
		.moveNumber = static_cast<int>(state.moveHistory.size()) + 1,
		.player = player
		});

	if (state.hasOpponent()) {
		auto& seen = state.opponentMemory[card->pairKey];
		if (std::find(seen.begin(), seen.end(), card->id) == seen.end()) {
			seen.push_back(card->id);
		}
	}

	if (state.currentFlipped.size() == 1) {
		return FirstCardRevealed{ .card = *card, .player = player, .scores = StateView::scoreBoard(state) };
	}

	return resolvePair(state, player);
}

PairResolved FlipSystem::resolvePair(GameState& state, Seat player) const {
	Card& first = *state.findCard(state.currentFlipped[0]);
	Card& second = *state.findCard(state.currentFlipped[1]);
	PlayerStats& stats = state.stats(player);

	state.moves++;
	stats.attempts++;

	PairResolved result;
	result.player = player;
	result.match = first.pairKey == second.pairKey;

	std::optional<CommentaryEntry> line;

	if (result.match) {
		first.matched = true;
		second.matched = true;
		state.matches++;

		stats.pairsWon++;
		stats.streak++;
		result.pointsAwarded = pointsForStreak(stats.streak);
		stats.score += result.pointsAwarded;

		state.bestStreak = std::max({ state.bestStreak, state.player1.streak, state.player2.streak });
		state.currentFlipped.clear();

		if (commentary) line = commentary->afterMatch(state, player);
	}
	else {
		state.mistakes.push_back(first.name + "-" + second.name);
		stats.streak = 0;
		state.currentFlipped.clear();

		if (commentary) line = commentary->afterMiss(state, player);
	}

	// No extra turn on a match.
	if (state.isMultiplayer()) {
		state.currentPlayer = otherSeat(player);
	}

	if (line) {
		result.commentary = line->text;
		state.commentaryHistory.push_back(std::move(*line));
	}

	result.first = first;
	result.second = second;
	result.moves = state.moves;
	result.matches = state.matches;
	result.streak = stats.streak;
	result.gameWon = state.isComplete();
	result.scores = StateView::scoreBoard(state);
	return result;
}

void FlipSystem::resetUnmatched(GameState& state) const {
	for (auto& card : state.cards) {
		if (!card.matched) {
			card.flipped = false;
		}
	}
	state.currentFlipped.clear();
}
