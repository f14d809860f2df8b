#pragma once

#include "Types.hpp"
#include "../external/IllustrationProvider.hpp"
#include "../infra/TaskQueue.hpp"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace MemoryDuel {

	class DeckBuilder {
	public:
		static constexpr int PokemonPoolSize = 150;
		static constexpr int EmojiPairKeyBase = 10'000;
		static constexpr int FlagPairKeyBase = 20'000;

		// taskQueue may be null, identities are then resolved on the calling thread.
		DeckBuilder(std::shared_ptr<IllustrationProvider> illustrations,
			std::shared_ptr<TaskQueue> taskQueue);

		// 2 x pairs shuffled cards. Same seed, theme and pairs give the same order.
		DeckResult build(Theme theme, int pairs, const std::optional<std::string>& seed) const;

		static size_t poolSize(Theme theme);
		static const std::vector<std::string_view>& emojiPool();
		static const std::vector<std::string_view>& flagPool();

		static std::mt19937 makeRng(const std::optional<std::string>& seed);

	private:
		std::vector<Illustration> resolveAll(const std::vector<int>& identities) const;

		std::shared_ptr<IllustrationProvider> illustrations;
		std::shared_ptr<TaskQueue> taskQueue;
	};

}
