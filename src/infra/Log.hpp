#pragma once

#include <ctime>
#include <string>

namespace MemoryDuel {

	// Serialized console output with a wall-clock prefix.
	class Log {
	public:
		static void info(const std::string& message);
		static void warn(const std::string& message);
		static void error(const std::string& message);

		// Thread-safe local calendar time on both POSIX and Windows.
		static std::tm localTime(std::time_t t);
	};

}
