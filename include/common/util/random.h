#pragma once

#include <random>
#include <utility>
#include <cstdint>
#include <mutex>

namespace RDSH {
	// Shared between the loop thread and handler threads, so every draw is locked.
	class Random {
	public:
		int Int(int low, int high)
		{
			if (low > high)
				std::swap(low, high);
			std::lock_guard<std::mutex> lock(m_mutex);
			return int_dist(m_gen, int_param_t(low, high)); // [low, high]
		}

		uint64_t Nonce()
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			return m_nonce_dist(m_gen);
		}

		// example Roll(50) would have a 50% success rate
		bool Roll(const int required)
		{
			return Int(0, 99) < required;
		}

		void Reseed()
		{
			std::random_device rd;
			std::lock_guard<std::mutex> lock(m_mutex);
			m_gen.seed(rd());
		}

		Random()
		{
			Reseed();
		}

	private:
		typedef std::uniform_int_distribution<int>::param_type int_param_t;
		std::uniform_int_distribution<int> int_dist;
		std::uniform_int_distribution<uint64_t> m_nonce_dist;
		std::mt19937_64 m_gen;
		std::mutex m_mutex;
	};
}
