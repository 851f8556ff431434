#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>


namespace shelfwatch {

/**
* MsgQueue
* - 용량 제한 FIFO. 가득 차면 push()가 false (호출자가 폐기/로그).
* - pop()은 항목이 생기거나 shutdown()될 때까지 블로킹.
*/
template<typename T>
class MsgQueue {
public:
	explicit MsgQueue(std::size_t capacity) : cap_(capacity ? capacity : 1) {}

	bool push(T v) {
		{
			std::lock_guard<std::mutex> lk(m_);
			if (stop_ || q_.size() >= cap_) return false;
			q_.push(std::move(v));
		}
		cv_.notify_one();
		return true;
	}
	bool pop(T& out) {
		std::unique_lock<std::mutex> lk(m_);
		cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
		if (q_.empty()) return false;
		out = std::move(q_.front()); q_.pop(); return true;
	}
	void shutdown() { { std::lock_guard<std::mutex> lk(m_); stop_ = true; } cv_.notify_all(); }
	std::size_t size() const { std::lock_guard<std::mutex> lk(m_); return q_.size(); }
	std::size_t capacity() const { return cap_; }
private:
	std::queue<T> q_;
	mutable std::mutex m_;
	std::condition_variable cv_;
	std::size_t cap_;
	bool stop_ = false;
};

} // namespace shelfwatch
