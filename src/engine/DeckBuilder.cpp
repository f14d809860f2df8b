#include "DeckBuilder.hpp"
#include "../infra/Log.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <numeric>

using namespace MemoryDuel;

namespace {

	template <typename T>
	std::vector<T> sampleWithoutReplacement(std::vector<T> pool, size_t count, std::mt19937& rng) {
		std::shuffle(pool.begin(), pool.end(), rng);
		pool.resize(count);
		return pool;
	}

	Card makeCard(int id, int pairKey, const std::string& name) {
		Card card;
		card.id = id;
		card.pairKey = pairKey;
		card.name = name;
		return card;
	}

}

DeckBuilder::DeckBuilder(std::shared_ptr<IllustrationProvider> illustrations,
	std::shared_ptr<TaskQueue> taskQueue)
	: illustrations(std::move(illustrations)), taskQueue(std::move(taskQueue)) {
}

const std::vector<std::string_view>& DeckBuilder::emojiPool() {
	static const std::vector<std::string_view> pool{
		"🐶","🐱","🦊","🐻","🐼","🐨","🐯","🦁","🐮","🐷","🐸","🐵",
		"🦄","🐔","🐧","🐦","🐤","🐙","🦋","🐞","🦖","🦕","🐢","🐍",
		"🍎","🍌","🍓","🍒","🍉","🍍","🥝","🥑","🌶️","🥕","🥐","🍕",
		"⚽","🏀","🏈","🎾","🎲","🎹","🎸","🎧","🎯","🚗","🚲","🚀",
		"🌞","🌙","⭐","☁️","🌈","❄️","🔥","💧","🌊","🌳","🌵","🌸"
	};
	return pool;
}

const std::vector<std::string_view>& DeckBuilder::flagPool() {
	static const std::vector<std::string_view> pool{
		"🇺🇸","🇬🇧","🇫🇷","🇩🇪","🇯🇵","🇨🇦","🇮🇹","🇪🇸","🇨🇳","🇧🇷",
		"🇷🇺","🇷🇴","🇸🇪","🇳🇴","🇫🇮","🇦🇺","🇳🇿","🇲🇽","🇮🇳","🇰🇷",
		"🇹🇷","🇵🇱","🇭🇺","🇵🇹","🇬🇷","🇳🇱","🇧🇪","🇨🇭","🇩🇰","🇿🇦"
	};
	return pool;
}

size_t DeckBuilder::poolSize(Theme theme) {
	switch (theme) {
	case Theme::Pokemon: return PokemonPoolSize;
	case Theme::Emoji:   return emojiPool().size();
	case Theme::Flags:   return flagPool().size();
	}
	return 0;
}

std::mt19937 DeckBuilder::makeRng(const std::optional<std::string>& seed) {
	if (!seed) {
		return std::mt19937(std::random_device{}());
	}
	std::vector<uint32_t> material(seed->begin(), seed->end());
	material.push_back(static_cast<uint32_t>(seed->size()));
	std::seed_seq seq(material.begin(), material.end());
	return std::mt19937(seq);
}

std::vector<Illustration> DeckBuilder::resolveAll(const std::vector<int>& identities) const {
	std::vector<Illustration> result;
	result.reserve(identities.size());

	if (!taskQueue) {
		for (int id : identities) result.push_back(illustrations->resolve(id));
		return result;
	}

	std::vector<std::future<Illustration>> pending;
	pending.reserve(identities.size());
	for (int id : identities) {
		pending.push_back(taskQueue->submit([provider = illustrations, id]() {
			return provider->resolve(id);
			}));
	}

	for (size_t i = 0; i < pending.size(); ++i) {
		try {
			result.push_back(pending[i].get());
		}
		catch (const std::exception& e) {
			Log::warn(std::format("[DECK] Identity {} failed to resolve: {}", identities[i], e.what()));
			result.push_back(IllustrationProvider::fallback(identities[i]));
		}
	}
	return result;
}

DeckResult DeckBuilder::build(Theme theme, int pairs, const std::optional<std::string>& seed) const {
	DeckResult result;

	if (pairs < 1) {
		result.error = ErrorKind::InvalidRequest;
		result.message = std::format("A deck needs at least one pair, got {}.", pairs);
		return result;
	}

	size_t available = poolSize(theme);
	if (static_cast<size_t>(pairs) > available) {
		result.error = ErrorKind::InsufficientPoolSize;
		result.message = std::format("Theme '{}' has {} items, {} pairs requested.",
			toString(theme), available, pairs);
		return result;
	}

	auto rng = makeRng(seed);
	auto& cards = result.cards;
	cards.reserve(static_cast<size_t>(pairs) * 2);

	if (theme == Theme::Pokemon) {
		std::vector<int> ids(PokemonPoolSize);
		std::iota(ids.begin(), ids.end(), 1);
		auto chosen = sampleWithoutReplacement(std::move(ids), static_cast<size_t>(pairs), rng);

		auto art = resolveAll(chosen);
		for (size_t i = 0; i < art.size(); ++i) {
			int base = static_cast<int>(i) * 2;
			for (int copy = 0; copy < 2; ++copy) {
				Card card = makeCard(base + copy, chosen[i], art[i].name);
				card.image = art[i].image;
				cards.push_back(std::move(card));
			}
		}
	}
	else {
		bool emoji = theme == Theme::Emoji;
		const auto& pool = emoji ? emojiPool() : flagPool();
		auto chosen = sampleWithoutReplacement(pool, static_cast<size_t>(pairs), rng);

		for (size_t i = 0; i < chosen.size(); ++i) {
			int base = static_cast<int>(i) * 2;
			int pairKey = (emoji ? EmojiPairKeyBase : FlagPairKeyBase) + static_cast<int>(i);
			std::string glyph(chosen[i]);
			std::string name = std::format("{} {}", emoji ? "Emoji" : "Flag", glyph);
			for (int copy = 0; copy < 2; ++copy) {
				Card card = makeCard(base + copy, pairKey, name);
				card.emoji = glyph;
				cards.push_back(std::move(card));
			}
		}
	}

	std::shuffle(cards.begin(), cards.end(), rng);

	result.success = true;
	return result;
}
