#pragma once

#include "Types.hpp"
#include <vector>

namespace MemoryDuel {

	// Read-only projections of a game. publicView is the only projection that may be sent
	// to a player during play: face-down cards carry no identity.
	namespace StateView {

		std::vector<CardView> publicView(const GameState& state);

		// Unmasked. Only for the creation-time preview and debugging.
		std::vector<CardView> fullView(const GameState& state);

		// pairs_won / attempts * 100, one decimal; 0.0 before the first attempt.
		double accuracy(const PlayerStats& stats);

		ScoreBoard scoreBoard(const GameState& state);

	}
}
