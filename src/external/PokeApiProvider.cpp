#include "PokeApiProvider.hpp"
#include "../infra/Log.hpp"

#include <crow.h>
#include <httplib.h>

#include <cctype>
#include <chrono>
#include <format>
#include <initializer_list>
#include <optional>

using namespace MemoryDuel;

static std::optional<std::string> stringAt(const crow::json::rvalue& root, std::initializer_list<const char*> path) {
	const crow::json::rvalue* node = &root;
	for (const char* key : path) {
		if (node->t() != crow::json::type::Object || !node->has(key)) {
			return std::nullopt;
		}
		node = &(*node)[key];
	}
	if (node->t() != crow::json::type::String) {
		return std::nullopt;
	}
	std::string value = node->s();
	if (value.empty()) return std::nullopt;
	return value;
}

static std::string capitalize(std::string name) {
	if (!name.empty()) {
		name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
	}
	for (size_t i = 1; i < name.size(); ++i) {
		name[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
	}
	return name;
}

PokeApiProvider::PokeApiProvider(std::string baseUrl, int timeoutMs)
	: baseUrl_(std::move(baseUrl)), timeoutMs_(timeoutMs) {
}

Illustration PokeApiProvider::resolve(int identity) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = cache_.find(identity);
		if (it != cache_.end()) return it->second;
	}

	Illustration result = fetch(identity);

	std::lock_guard<std::mutex> lock(mutex_);
	return cache_.try_emplace(identity, std::move(result)).first->second;
}

size_t PokeApiProvider::cachedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return cache_.size();
}

Illustration PokeApiProvider::fetch(int identity) const {
	try {
		httplib::Client client(baseUrl_);
		if (!client.is_valid()) {
			Log::warn(std::format("[EXTERNAL] Illustration endpoint unusable: {}", baseUrl_));
			return fallback(identity);
		}

		client.set_connection_timeout(std::chrono::milliseconds(timeoutMs_));
		client.set_read_timeout(std::chrono::milliseconds(timeoutMs_));
		client.set_follow_location(true);
		client.set_default_headers({ { "User-Agent", "MemoryDuel/1.0" } });

		auto res = client.Get(std::format("/api/v2/pokemon/{}", identity));
		if (!res) {
			Log::warn(std::format("[EXTERNAL] Illustration {} unreachable: {}", identity, httplib::to_string(res.error())));
			return fallback(identity);
		}
		if (res->status != 200) {
			Log::warn(std::format("[EXTERNAL] Illustration {} answered HTTP {}", identity, res->status));
			return fallback(identity);
		}

		auto data = crow::json::load(res->body);
		if (!data) {
			Log::warn(std::format("[EXTERNAL] Illustration {} returned invalid JSON", identity));
			return fallback(identity);
		}

		Illustration result = fallback(identity);

		if (auto name = stringAt(data, { "name" })) {
			result.name = capitalize(*name);
		}

		if (auto art = stringAt(data, { "sprites", "other", "official-artwork", "front_default" })) {
			result.image = *art;
		}
		else if (auto front = stringAt(data, { "sprites", "front_default" })) {
			result.image = *front;
		}

		return result;
	}
	catch (const std::exception& e) {
		Log::warn(std::format("[EXTERNAL] Illustration {} failed: {}", identity, e.what()));
		return fallback(identity);
	}
}
