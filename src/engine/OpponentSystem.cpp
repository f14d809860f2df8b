#include "OpponentSystem.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <unordered_set>

using namespace MemoryDuel;

namespace {

	bool isAvailable(const GameState& state, int cardId) {
		const Card* card = state.findCard(cardId);
		return card && !card->matched && !card->flipped;
	}

}

OpponentSystem::OpponentSystem(std::shared_ptr<RandomSource> random)
	: random(std::move(random)) {
}

void OpponentSystem::refreshMemory(GameState& state, const OpponentProfile& profile) {
	const auto& history = state.moveHistory;
	size_t start = 0;
	if (profile.memoryWindow != OpponentProfile::UnboundedWindow && history.size() > profile.memoryWindow) {
		start = history.size() - profile.memoryWindow;
	}

	std::map<int, std::vector<int>> memory;
	for (size_t i = start; i < history.size(); ++i) {
		auto& seen = memory[history[i].pairKey];
		if (std::find(seen.begin(), seen.end(), history[i].cardId) == seen.end()) {
			seen.push_back(history[i].cardId);
		}
	}
	state.opponentMemory = std::move(memory);
}

OpponentMoveResult OpponentSystem::chooseMove(GameState& state) const {
	refreshMemory(state, OpponentProfile::forDifficulty(state.settings.aiDifficulty));

	std::vector<int> available;
	for (const auto& card : state.cards) {
		if (!card.matched && !card.flipped) available.push_back(card.id);
	}

	if (available.empty()) {
		return { .success = false, .error = ErrorKind::NoValidMoves, .message = "No valid moves" };
	}

	auto chosen = [](int cardId) {
		return OpponentMoveResult{ .success = true, .cardId = cardId };
		};

	std::map<int, std::vector<int>> knownPositions;
	for (const auto& [pairKey, ids] : state.opponentMemory) {
		std::vector<int> stillAvailable;
		for (int id : ids) {
			if (isAvailable(state, id)) stillAvailable.push_back(id);
		}
		if (!stillAvailable.empty()) knownPositions[pairKey] = std::move(stillAvailable);
	}

	if (state.currentFlipped.size() == 1) {
		const Card* up = state.findCard(state.currentFlipped.front());
		if (up) {
			auto it = knownPositions.find(up->pairKey);
			if (it != knownPositions.end()) {
				for (int id : it->second) {
					if (id != up->id) return chosen(id);
				}
			}
		}
	}

	for (const auto& [pairKey, ids] : knownPositions) {
		if (ids.size() >= 2) return chosen(ids.front());
	}

	double epsilon = OpponentProfile::forDifficulty(state.settings.aiDifficulty).epsilon;
	if (random->chance() < epsilon) {
		return chosen(available[random->pick(available.size())]);
	}

	std::unordered_set<int> seenIds;
	for (const auto& [pairKey, ids] : state.opponentMemory) {
		seenIds.insert(ids.begin(), ids.end());
	}

	std::vector<int> unknown;
	for (int id : available) {
		if (!seenIds.contains(id)) unknown.push_back(id);
	}

	if (!unknown.empty()) {
		return chosen(unknown[random->pick(unknown.size())]);
	}

	return chosen(available[random->pick(available.size())]);
}

std::vector<MemoryHudEntry> OpponentSystem::memoryHud(const GameState& state, size_t limit) {
	std::vector<MemoryHudEntry> entries;
	entries.reserve(state.opponentMemory.size());

	for (const auto& [pairKey, ids] : state.opponentMemory) {
		auto it = std::find_if(state.cards.begin(), state.cards.end(),
			[key = pairKey](const Card& c) { return c.pairKey == key; });

		std::unordered_set<int> distinct(ids.begin(), ids.end());
		entries.push_back({
			.pairKey = pairKey,
			.name = it != state.cards.end() ? it->name : std::format("#{}", pairKey),
			.seen = static_cast<int>(distinct.size())
			});
	}

	std::stable_sort(entries.begin(), entries.end(),
		[](const MemoryHudEntry& a, const MemoryHudEntry& b) { return a.seen > b.seen; });

	if (entries.size() > limit) entries.resize(limit);
	return entries;
}
