#pragma once

#include <string>

namespace MemoryDuel {

	struct Illustration {
		int id{ 0 };
		std::string name;
		std::string image;
	};

	// Resolves a collectible identity to display data. Implementations never throw:
	// when the backing service is unreachable they answer with fallback(id).
	class IllustrationProvider {
	public:
		virtual ~IllustrationProvider() = default;

		virtual Illustration resolve(int identity) = 0;

		static Illustration fallback(int identity);
		static std::string spriteUrl(int identity);
	};

}
