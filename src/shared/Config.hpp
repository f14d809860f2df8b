#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace MemoryDuel {

	struct ServerConfig {
		uint16_t port{ 5000 };
		std::string bindAddress{ "0.0.0.0" };
		std::size_t workerThreads{ 4 };

		std::string pokeApiUrl{ "https://pokeapi.co" };
		std::string ollamaUrl{ "http://localhost:11434" };
		std::string ollamaModel{ "llama3.2" };
		int providerTimeoutMs{ 3000 };

		int gameTtlMinutes{ 120 };
		std::string logLevel{ "info" };

		// Reads every setting through `lookup`; unset keys keep their defaults.
		static ServerConfig fromLookup(const std::function<std::string(const char*)>& lookup);
		static ServerConfig fromEnvironment();
	};

}
