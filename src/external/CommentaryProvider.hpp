#pragma once

#include <array>
#include <string>
#include <string_view>

namespace MemoryDuel {

	// One sentence of flavor text for a short prompt. Implementations never throw and
	// never return an empty line: on any failure they answer with a canned taunt.
	class CommentaryProvider {
	public:
		virtual ~CommentaryProvider() = default;

		virtual std::string generate(const std::string& prompt) = 0;

		static constexpr std::array<std::string_view, 4> FallbackTaunts{
			"Are you even trying? \xF0\x9F\x98\x82",
			"My grandmother could do better...",
			"This is painful to watch.",
			"Maybe memory games aren't your thing?"
		};

		static std::string fallbackTaunt();
	};

}
