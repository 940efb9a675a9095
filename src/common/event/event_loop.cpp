#include "common/event/event_loop.h"
#include "common/logging.h"
#include <cstring>

RDSH::EventLoop::EventLoop()
{
	m_initialized = false;
	m_running = false;
	m_stopping = false;
	memset(&m_loop, 0, sizeof(uv_loop_t));
	memset(&m_async, 0, sizeof(uv_async_t));

	int rc = uv_loop_init(&m_loop);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_loop_init failed: {}", uv_strerror(rc));
		return;
	}

	rc = uv_async_init(&m_loop, &m_async, &EventLoop::OnAsync);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_async_init failed: {}", uv_strerror(rc));
		uv_loop_close(&m_loop);
		return;
	}

	m_async.data = this;
	m_initialized = true;
}

RDSH::EventLoop::~EventLoop()
{
	Stop();

	if (m_initialized) {
		int rc = uv_loop_close(&m_loop);
		if (rc != 0) {
			LOG_WARN(MOD_NET, "uv_loop_close returned {}", uv_strerror(rc));
		}
	}
}

bool RDSH::EventLoop::Start()
{
	if (!m_initialized || m_running) {
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_stopping) {
			return false;
		}
	}

	m_running = true;
	m_thread = std::thread([this]() {
		m_loop_thread_id = std::this_thread::get_id();
		LOG_TRACE(MOD_NET, "Event loop thread started");
		uv_run(&m_loop, UV_RUN_DEFAULT);
		LOG_TRACE(MOD_NET, "Event loop thread exiting");
		m_loop_thread_id = std::thread::id();
		m_running = false;
	});

	return true;
}

void RDSH::EventLoop::Stop()
{
	if (!m_initialized) {
		return;
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_stopping = true;
	}

	if (m_thread.joinable()) {
		uv_async_send(&m_async);
		m_thread.join();
	}

	// Never started, or handles created after the loop exited.
	CloseAllHandles();
	uv_run(&m_loop, UV_RUN_DEFAULT);
}

bool RDSH::EventLoop::Post(std::function<void()> task)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_initialized || !m_running || m_stopping) {
			return false;
		}
		m_tasks.push_back(std::move(task));
	}

	uv_async_send(&m_async);
	return true;
}

void RDSH::EventLoop::OnAsync(uv_async_t *handle)
{
	EventLoop *loop = (EventLoop*)handle->data;
	loop->RunTasks();
}

void RDSH::EventLoop::RunTasks()
{
	std::deque<std::function<void()>> tasks;
	bool stopping;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		tasks.swap(m_tasks);
		stopping = m_stopping;
	}

	for (auto &task : tasks) {
		try {
			task();
		}
		catch (std::exception &ex) {
			LOG_ERROR(MOD_NET, "Posted task threw: {}", ex.what());
		}
	}

	if (stopping) {
		CloseAllHandles();
	}
}

void RDSH::EventLoop::CloseAllHandles()
{
	uv_walk(&m_loop, [](uv_handle_t *handle, void *) {
		if (!uv_is_closing(handle)) {
			uv_close(handle, nullptr);
		}
	}, nullptr);
}
