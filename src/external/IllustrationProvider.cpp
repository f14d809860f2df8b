#include "IllustrationProvider.hpp"

#include <format>

using namespace MemoryDuel;

std::string IllustrationProvider::spriteUrl(int identity) {
	return std::format("https://raw.githubusercontent.com/PokeAPI/sprites/master/sprites/pokemon/{}.png", identity);
}

Illustration IllustrationProvider::fallback(int identity) {
	return { .id = identity, .name = std::format("Pokemon {}", identity), .image = spriteUrl(identity) };
}
