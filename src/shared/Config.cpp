#include "Config.hpp"
#include "../infra/Log.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace MemoryDuel;

static std::string getEnvVar(const char* key) {
	char* val = std::getenv(key);
	return val ? std::string(val) : std::string();
}

static int parseIntSetting(const char* key, const std::string& raw, int fallback, int minValue, int maxValue) {
	if (raw.empty()) return fallback;

	try {
		std::size_t consumed = 0;
		int value = std::stoi(raw, &consumed);
		if (consumed != raw.size() || value < minValue || value > maxValue) {
			throw std::out_of_range(raw);
		}
		return value;
	}
	catch (const std::exception&) {
		Log::warn(std::format("[CONFIG] Invalid value for {}: '{}'. Using {}.", key, raw, fallback));
		return fallback;
	}
}

ServerConfig ServerConfig::fromLookup(const std::function<std::string(const char*)>& lookup) {
	ServerConfig config;

	config.port = static_cast<uint16_t>(parseIntSetting("PORT", lookup("PORT"), config.port, 1, 65535));
	config.workerThreads = static_cast<std::size_t>(
		parseIntSetting("WORKER_THREADS", lookup("WORKER_THREADS"), static_cast<int>(config.workerThreads), 1, 64));
	config.providerTimeoutMs = parseIntSetting("PROVIDER_TIMEOUT_MS", lookup("PROVIDER_TIMEOUT_MS"),
		config.providerTimeoutMs, 100, 60000);
	config.gameTtlMinutes = parseIntSetting("GAME_TTL_MINUTES", lookup("GAME_TTL_MINUTES"),
		config.gameTtlMinutes, 0, 7 * 24 * 60);

	auto assign = [&](const char* key, std::string& target) {
		std::string value = lookup(key);
		if (!value.empty()) target = value;
		};

	assign("BIND_ADDRESS", config.bindAddress);
	assign("POKEAPI_URL", config.pokeApiUrl);
	assign("OLLAMA_URL", config.ollamaUrl);
	assign("OLLAMA_MODEL", config.ollamaModel);
	assign("LOG_LEVEL", config.logLevel);

	if (config.logLevel != "debug" && config.logLevel != "info" &&
		config.logLevel != "warning" && config.logLevel != "error") {
		Log::warn(std::format("[CONFIG] Unknown LOG_LEVEL '{}'. Using info.", config.logLevel));
		config.logLevel = "info";
	}

	return config;
}

ServerConfig ServerConfig::fromEnvironment() {
	return fromLookup(getEnvVar);
}
