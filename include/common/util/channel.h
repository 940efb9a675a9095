#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace RDSH {

// Multi-producer queue with a blocking, time-bounded receive.
// Used for every hand-off between the loop thread and caller or handler threads.
template<typename T>
class Channel {
public:
	// Returns false once the channel is closed; the value is discarded.
	bool Push(T value)
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (m_closed) {
				return false;
			}
			m_items.push_back(std::move(value));
		}
		m_cv.notify_one();
		return true;
	}

	std::optional<T> PopFor(std::chrono::milliseconds timeout)
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		if (!m_cv.wait_for(lock, timeout, [this]() { return !m_items.empty() || m_closed; })) {
			return std::nullopt;
		}

		if (m_items.empty()) {
			return std::nullopt;
		}

		T value = std::move(m_items.front());
		m_items.pop_front();
		return value;
	}

	std::optional<T> TryPop()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_items.empty()) {
			return std::nullopt;
		}

		T value = std::move(m_items.front());
		m_items.pop_front();
		return value;
	}

	// Wakes every waiter; queued items are dropped.
	void Close()
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_closed = true;
			m_items.clear();
		}
		m_cv.notify_all();
	}

	bool Closed() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_closed;
	}

	size_t Size() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_items.size();
	}

	void Clear()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_items.clear();
	}

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_cv;
	std::deque<T> m_items;
	bool m_closed = false;
};

}
