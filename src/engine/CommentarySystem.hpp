#pragma once

#include "../external/CommentaryProvider.hpp"
#include "../shared/DTOs.hpp"

#include <memory>
#include <optional>
#include <string>

namespace MemoryDuel {

	class CommentarySystem {
	public:
		explicit CommentarySystem(std::shared_ptr<CommentaryProvider> provider);

		// Called after the match counters were updated. Endgame when the board is cleared,
		// otherwise every commentaryFrequency-th cumulative match.
		std::optional<CommentaryEntry> afterMatch(const GameState& state, Seat player) const;

		// Called after the miss was recorded. Every commentaryFrequency-th cumulative move.
		std::optional<CommentaryEntry> afterMiss(const GameState& state, Seat player) const;

		std::string roast(const GameState& state, Seat player) const;

		static std::string matchPrompt(const GameState& state, Seat player);
		static std::string missPrompt(const GameState& state, Seat player);
		static std::string roastPrompt(const GameState& state, Seat player);
		static std::string seatLabel(const GameState& state, Seat player);

	private:
		std::string ask(const std::string& prompt) const;

		std::shared_ptr<CommentaryProvider> provider;
	};

}
