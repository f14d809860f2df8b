#pragma once

#include "Types.hpp"
#include "CommentarySystem.hpp"

#include <memory>
#include <optional>
#include <string>

namespace MemoryDuel {

	// Transition function for one game: Idle (no card up) -> OneUp -> resolve -> Idle.
	// The caller serializes access to the state.
	class FlipSystem {
	public:
		explicit FlipSystem(std::shared_ptr<const CommentarySystem> commentary);

		FlipOutcome flip(
			GameState& state,
			int cardId,
			Seat player,
			const std::optional<std::string>& token
		) const;

		// Face-down again for every card that is not matched. Matched cards stay up.
		void resetUnmatched(GameState& state) const;

		// Seat and token check shared with the other seat-gated operations.
		static std::optional<FlipRejected> authorize(
			const GameState& state,
			Seat player,
			const std::optional<std::string>& token
		);

		static int pointsForStreak(int streak);

	private:
		PairResolved resolvePair(GameState& state, Seat player) const;

		std::shared_ptr<const CommentarySystem> commentary;
	};

}
