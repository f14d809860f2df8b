#include "OllamaProvider.hpp"
#include "../infra/Log.hpp"

#include <crow.h>
#include <httplib.h>

#include <chrono>
#include <format>

using namespace MemoryDuel;

static std::string trim(const std::string& s) {
	const char* blanks = " \t\r\n";
	auto first = s.find_first_not_of(blanks);
	if (first == std::string::npos) return {};
	auto last = s.find_last_not_of(blanks);
	return s.substr(first, last - first + 1);
}

OllamaProvider::OllamaProvider(std::string baseUrl, std::string model, int timeoutMs)
	: baseUrl_(std::move(baseUrl)), model_(std::move(model)), timeoutMs_(timeoutMs) {
}

std::string OllamaProvider::generate(const std::string& prompt) {
	try {
		httplib::Client client(baseUrl_);
		if (!client.is_valid()) {
			Log::warn(std::format("[EXTERNAL] Text endpoint unusable: {}", baseUrl_));
			return fallbackTaunt();
		}

		client.set_connection_timeout(std::chrono::milliseconds(timeoutMs_));
		client.set_read_timeout(std::chrono::milliseconds(timeoutMs_));
		client.set_write_timeout(std::chrono::milliseconds(timeoutMs_));

		crow::json::wvalue request;
		request["model"] = model_;
		request["prompt"] = prompt;
		request["stream"] = false;

		auto res = client.Post("/api/generate", request.dump(), "application/json");
		if (!res) {
			Log::warn(std::format("[EXTERNAL] Ollama error: {}", httplib::to_string(res.error())));
			return fallbackTaunt();
		}
		if (res->status != 200) {
			Log::warn(std::format("[EXTERNAL] Ollama answered HTTP {}", res->status));
			return fallbackTaunt();
		}

		auto data = crow::json::load(res->body);
		if (!data || data.t() != crow::json::type::Object || !data.has("response") ||
			data["response"].t() != crow::json::type::String) {
			Log::warn("[EXTERNAL] Ollama reply without a response field");
			return fallbackTaunt();
		}

		std::string text = trim(data["response"].s());
		if (text.empty()) {
			Log::warn("[EXTERNAL] Empty Ollama response");
			return fallbackTaunt();
		}
		return text;
	}
	catch (const std::exception& e) {
		Log::warn(std::format("[EXTERNAL] Ollama error: {}", e.what()));
		return fallbackTaunt();
	}
}
