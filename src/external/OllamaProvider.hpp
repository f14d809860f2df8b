#pragma once

#include "CommentaryProvider.hpp"
#include <string>

namespace MemoryDuel {

	// Non-streaming call to an Ollama-compatible /api/generate endpoint.
	class OllamaProvider : public CommentaryProvider {
	public:
		OllamaProvider(std::string baseUrl, std::string model, int timeoutMs);

		std::string generate(const std::string& prompt) override;

	private:
		std::string baseUrl_;
		std::string model_;
		int timeoutMs_;
	};

}
