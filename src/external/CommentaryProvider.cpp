#include "CommentaryProvider.hpp"

#include <random>

using namespace MemoryDuel;

std::string CommentaryProvider::fallbackTaunt() {
	thread_local std::mt19937 gen{ std::random_device{}() };
	std::uniform_int_distribution<size_t> dis(0, FallbackTaunts.size() - 1);
	return std::string(FallbackTaunts[dis(gen)]);
}
