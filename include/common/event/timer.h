#pragma once

#include "common/event/event_loop.h"
#include <cstdint>
#include <functional>

namespace RDSH
{
	// Create before the loop starts or from the loop thread; Start/Stop follow
	// the same rule.
	class Timer
	{
	public:
		Timer(EventLoop &loop, std::function<void(Timer *)> cb);

		Timer(const Timer&) = delete;
		Timer& operator=(const Timer&) = delete;

		void Start(uint64_t duration_ms, bool repeats = true);
		void Stop();

	private:
		static void OnTimer(uv_timer_t *handle);

		uv_timer_t m_timer;
		bool m_initialized;
		std::function<void(Timer *)> m_callback;
	};
}
