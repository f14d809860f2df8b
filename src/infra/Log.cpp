#include "Log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <print>

using namespace MemoryDuel;

namespace {

	std::mutex logMutex;

	void write(std::FILE* stream, const char* level, const std::string& message) {
		std::tm local = Log::localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));

		char stamp[16];
		std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

		std::lock_guard<std::mutex> lock(logMutex);
		std::println(stream, "{} {} {}", stamp, level, message);
	}

}

std::tm Log::localTime(std::time_t t) {
	std::tm local{};
#ifdef _WIN32
	localtime_s(&local, &t);
#else
	localtime_r(&t, &local);
#endif
	return local;
}

void Log::info(const std::string& message) {
	write(stdout, "INFO ", message);
}

void Log::warn(const std::string& message) {
	write(stderr, "WARN ", message);
}

void Log::error(const std::string& message) {
	write(stderr, "ERROR", message);
}
