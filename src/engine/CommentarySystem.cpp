#include "CommentarySystem.hpp"
#include "../infra/Log.hpp"

#include <algorithm>
#include <format>

using namespace MemoryDuel;

CommentarySystem::CommentarySystem(std::shared_ptr<CommentaryProvider> provider)
	: provider(std::move(provider)) {
}

std::string CommentarySystem::seatLabel(const GameState& state, Seat player) {
	switch (state.settings.mode) {
	case GameMode::Solo:
		return "Player";
	case GameMode::VsAi:
		return player == Seat::Player1 ? "Player" : "The AI";
	case GameMode::VsHuman:
		return player == Seat::Player1 ? "Player 1" : "Player 2";
	}
	return "Player";
}

std::string CommentarySystem::matchPrompt(const GameState& state, Seat player) {
	const std::string who = seatLabel(state, player);
	const int optimalMoves = state.pairs;

	if (state.isComplete()) {
		if (state.moves <= optimalMoves + 3) {
			return std::format("{} won {}-pair memory in {} moves (near optimal). Short grudging compliment (1 sentence).",
				who, state.pairs, state.moves);
		}
		return std::format("{} won but took {} moves for {} pairs. Gentle mock (1 sentence).",
			who, state.moves, state.pairs);
	}

	double efficiency = static_cast<double>(optimalMoves) / std::max(state.moves, 1) * 100.0;
	if (efficiency > 80.0) {
		return std::format("{} doing very well. Short competitive response (1 sentence).", who);
	}
	return std::format("{} made match but struggling. Playful jab (1 sentence).", who);
}

std::string CommentarySystem::missPrompt(const GameState& state, Seat player) {
	const std::string who = seatLabel(state, player);

	long repeated = 0;
	if (!state.mistakes.empty()) {
		repeated = std::count(state.mistakes.begin(), state.mistakes.end(), state.mistakes.back());
	}

	if (repeated >= 3) {
		return std::format("{} flipped same wrong pair {} times. Funny roast (1 sentence).", who, repeated);
	}
	if (state.moves >= state.pairs * 2) {
		return std::format("{} at {} moves for {} pairs. Sarcastic comment (1 sentence).", who, state.moves, state.pairs);
	}
	return std::format("{} missed. Short sassy comment (1 sentence).", who);
}

std::string CommentarySystem::roastPrompt(const GameState& state, Seat player) {
	const std::string who = seatLabel(state, player);
	const int optimal = state.pairs;
	const int current = state.moves;
	const int won = state.stats(player).pairsWon;

	double ratio = optimal > 0 ? static_cast<double>(current) / optimal : 1.0;

	if (ratio > 3.0) {
		return std::format("{} took {} moves for {}/{} pairs (should be ~{}). Savage roast (1 sentence).",
			who, current, won, state.pairs, optimal);
	}
	if (ratio > 2.0) {
		return std::format("{} at {} moves, {}/{} matched. Struggling. Roast (1 sentence).",
			who, current, won, state.pairs);
	}
	return std::format("{} doing well - {} moves, {}/{} pairs. Competitive response (1 sentence).",
		who, current, won, state.pairs);
}

std::string CommentarySystem::ask(const std::string& prompt) const {
	if (!provider) return CommentaryProvider::fallbackTaunt();

	try {
		std::string text = provider->generate(prompt);
		if (!text.empty()) return text;
		Log::warn("[COMMENTARY] Provider returned an empty line");
	}
	catch (const std::exception& e) {
		Log::warn(std::format("[COMMENTARY] Provider failed: {}", e.what()));
	}
	return CommentaryProvider::fallbackTaunt();
}

std::optional<CommentaryEntry> CommentarySystem::afterMatch(const GameState& state, Seat player) const {
	bool endgame = state.isComplete();
	if (!endgame && state.matches % state.commentaryFrequency != 0) {
		return std::nullopt;
	}

	return CommentaryEntry{
		.text = ask(matchPrompt(state, player)),
		.type = endgame ? CommentaryType::Endgame : CommentaryType::Match,
		.player = player,
		.move = state.moves
	};
}

std::optional<CommentaryEntry> CommentarySystem::afterMiss(const GameState& state, Seat player) const {
	if (state.moves % state.commentaryFrequency != 0) {
		return std::nullopt;
	}

	return CommentaryEntry{
		.text = ask(missPrompt(state, player)),
		.type = CommentaryType::Miss,
		.player = player,
		.move = state.moves
	};
}

std::string CommentarySystem::roast(const GameState& state, Seat player) const {
	return ask(roastPrompt(state, player));
}
