#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace MemoryDuel {

	// Randomness seam for the opponent; tests substitute a scripted source.
	class RandomSource {
	public:
		virtual ~RandomSource() = default;

		// Uniform in [0, 1).
		virtual double chance() = 0;

		// Uniform in [0, count). count is never zero.
		virtual std::size_t pick(std::size_t count) = 0;
	};

	// Shared between games, so draws are serialized.
	class MersenneRandomSource : public RandomSource {
	public:
		MersenneRandomSource() : gen_(std::random_device{}()) {}
		explicit MersenneRandomSource(uint64_t seed) : gen_(seed) {}

		double chance() override {
			std::lock_guard<std::mutex> lock(mutex_);
			return std::uniform_real_distribution<double>(0.0, 1.0)(gen_);
		}

		std::size_t pick(std::size_t count) override {
			std::lock_guard<std::mutex> lock(mutex_);
			return std::uniform_int_distribution<std::size_t>(0, count - 1)(gen_);
		}

	private:
		std::mutex mutex_;
		std::mt19937_64 gen_;
	};

}
