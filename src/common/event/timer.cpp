#include "common/event/timer.h"
#include "common/logging.h"
#include <cstring>

RDSH::Timer::Timer(EventLoop &loop, std::function<void(Timer *)> cb)
	: m_initialized(false), m_callback(std::move(cb))
{
	memset(&m_timer, 0, sizeof(uv_timer_t));

	if (!loop.Valid()) {
		return;
	}

	int rc = uv_timer_init(loop.Handle(), &m_timer);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_timer_init failed: {}", uv_strerror(rc));
		return;
	}

	m_timer.data = this;
	m_initialized = true;
}

void RDSH::Timer::Start(uint64_t duration_ms, bool repeats)
{
	if (!m_initialized || uv_is_closing((uv_handle_t*)&m_timer)) {
		return;
	}

	uv_timer_start(&m_timer, &Timer::OnTimer, duration_ms, repeats ? duration_ms : 0);
}

void RDSH::Timer::Stop()
{
	if (!m_initialized || uv_is_closing((uv_handle_t*)&m_timer)) {
		return;
	}

	uv_timer_stop(&m_timer);
}

void RDSH::Timer::OnTimer(uv_timer_t *handle)
{
	Timer *t = (Timer*)handle->data;
	if (t->m_callback) {
		t->m_callback(t);
	}
}
