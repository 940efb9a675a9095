#pragma once

#include <uv.h>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace RDSH
{
	// Owns one libuv loop and the thread that runs it.
	//
	// Handles (sockets, timers) are created on the loop before Start() and are
	// only touched from the loop thread afterwards. Every other thread talks to
	// the loop through Post(), which queues a task and wakes the loop through a
	// uv_async handle.
	class EventLoop
	{
	public:
		EventLoop();
		~EventLoop();

		EventLoop(const EventLoop&) = delete;
		EventLoop& operator=(const EventLoop&) = delete;

		uv_loop_t *Handle() { return &m_loop; }
		bool Valid() const { return m_initialized; }

		bool Start();

		// Runs queued tasks, closes every handle on the loop and joins the loop
		// thread. Must not be called from the loop thread.
		void Stop();

		// Thread-safe. Returns false when the loop is not accepting work.
		bool Post(std::function<void()> task);

		bool IsLoopThread() const { return m_loop_thread_id.load() == std::this_thread::get_id(); }
		bool Running() const { return m_running.load(); }

	private:
		static void OnAsync(uv_async_t *handle);
		void RunTasks();
		void CloseAllHandles();

		uv_loop_t m_loop;
		uv_async_t m_async;
		bool m_initialized;

		std::thread m_thread;
		std::atomic<std::thread::id> m_loop_thread_id;
		std::atomic<bool> m_running;

		std::mutex m_mutex;
		std::deque<std::function<void()>> m_tasks;
		bool m_stopping;
	};
}
