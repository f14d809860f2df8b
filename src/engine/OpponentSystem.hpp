#pragma once

#include "Types.hpp"
#include "RandomSource.hpp"

#include <memory>
#include <vector>

namespace MemoryDuel {

	// Scripted opponent. Sees only what move history revealed, never the hidden deck.
	class OpponentSystem {
	public:
		explicit OpponentSystem(std::shared_ptr<RandomSource> random);

		// Rebuilds the opponent's memory from the profile's window, then picks a card:
		//   1. the known mate of the card already face-up
		//   2. one card of a fully known pair
		//   3. with probability epsilon, any available card
		//   4. a card never seen before
		//   5. any available card
		OpponentMoveResult chooseMove(GameState& state) const;

		static void refreshMemory(GameState& state, const OpponentProfile& profile);

		static std::vector<MemoryHudEntry> memoryHud(const GameState& state, size_t limit = 8);

	private:
		std::shared_ptr<RandomSource> random;
	};

}
