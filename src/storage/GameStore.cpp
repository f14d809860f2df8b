#include "GameStore.hpp"
#include "../infra/Log.hpp"

#include <format>
#include <random>
#include <utility>
#include <vector>

using namespace MemoryDuel;

GameStore::GameStore(std::chrono::minutes ttl)
	: ttl_(ttl) {
}

std::string GameStore::generateGameId() const {
	static const char alphanum[] =
		"0123456789"
		"ABCDEFGHIJKLMNOPQRSTUVWXYZ";

	thread_local std::mt19937 gen{ std::random_device{}() };
	std::uniform_int_distribution<> dis(0, sizeof(alphanum) - 2);

	const int len = 6;

	std::string id;
	for (int i = 0; i < len; ++i) {
		id += alphanum[dis(gen)];
	}
	return id;
}

std::string GameStore::insert(GameState state) {
	auto entry = std::make_shared<Entry>();

	std::lock_guard<std::mutex> lock(mutex_);

	std::string gameId;
	do {
		gameId = generateGameId();
	} while (games_.contains(gameId));

	auto now = std::chrono::system_clock::now();
	state.gameId = gameId;
	state.createdAt = now;
	state.lastActivity = now;
	entry->state = std::move(state);

	games_.emplace(gameId, std::move(entry));
	return gameId;
}

std::shared_ptr<GameStore::Entry> GameStore::find(const std::string& gameId) const {
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = games_.find(gameId);
	return it != games_.end() ? it->second : nullptr;
}

bool GameStore::withGame(const std::string& gameId, const std::function<void(GameState&)>& fn) {
	auto entry = find(gameId);
	if (!entry) return false;

	std::lock_guard<std::mutex> lock(entry->mutex);
	fn(entry->state);
	entry->state.lastActivity = std::chrono::system_clock::now();
	return true;
}

std::optional<GameState> GameStore::getGameState(const std::string& gameId) const {
	auto entry = find(gameId);
	if (!entry) return std::nullopt;

	std::lock_guard<std::mutex> lock(entry->mutex);
	return entry->state;
}

bool GameStore::exists(const std::string& gameId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return games_.contains(gameId);
}

size_t GameStore::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return games_.size();
}

size_t GameStore::reapExpired(std::chrono::system_clock::time_point now) {
	if (ttl_.count() <= 0) return 0;

	auto threshold = now - ttl_;

	auto isStale = [threshold](Entry& entry) {
		// A game whose lock is held is in use, so it is not idle.
		std::unique_lock<std::mutex> gameLock(entry.mutex, std::try_to_lock);
		return gameLock.owns_lock() && entry.state.lastActivity < threshold;
		};

	std::vector<std::pair<std::string, std::shared_ptr<Entry>>> snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		snapshot.assign(games_.begin(), games_.end());
	}

	std::vector<std::pair<std::string, std::shared_ptr<Entry>>> candidates;
	for (auto& item : snapshot) {
		if (isStale(*item.second)) candidates.push_back(std::move(item));
	}
	if (candidates.empty()) return 0;

	size_t removed = 0;
	size_t left = 0;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (const auto& [gameId, entry] : candidates) {
			auto it = games_.find(gameId);
			if (it == games_.end() || it->second != entry || !isStale(*entry)) continue;
			games_.erase(it);
			++removed;
		}
		left = games_.size();
	}

	if (removed > 0) {
		Log::info(std::format("[STORE] Reaped {} idle game(s), {} left.", removed, left));
	}
	return removed;
}
