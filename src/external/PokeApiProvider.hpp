#pragma once

#include "IllustrationProvider.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace MemoryDuel {

	// PokeAPI-compatible lookup with a per-identity cache. Fallback answers are cached too,
	// the identity pool is small and a dead endpoint should only cost one timeout per id.
	class PokeApiProvider : public IllustrationProvider {
	public:
		PokeApiProvider(std::string baseUrl, int timeoutMs);

		Illustration resolve(int identity) override;

		size_t cachedCount() const;

	private:
		Illustration fetch(int identity) const;

		std::string baseUrl_;
		int timeoutMs_;

		mutable std::mutex mutex_;
		std::unordered_map<int, Illustration> cache_;
	};

}
