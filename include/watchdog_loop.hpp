#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

#include "common.hpp"


namespace shelfwatch {

/**
* CancelToken
* - 협조적 종료 토큰. request_stop() 후 wait_until()이 즉시 깨어난다.
* - 한 번 요청되면 되돌릴 수 없음 (reset()은 재시작 전용).
*/
class CancelToken {
public:
	void request_stop() { { std::lock_guard<std::mutex> lk(m_); stop_ = true; } cv_.notify_all(); }
	bool stop_requested() const { std::lock_guard<std::mutex> lk(m_); return stop_; }
	void reset() { std::lock_guard<std::mutex> lk(m_); stop_ = false; }

	/** @return deadline 전에 종료가 요청되면 true */
	bool wait_until(TimePoint deadline) {
		std::unique_lock<std::mutex> lk(m_);
		return cv_.wait_until(lk, deadline, [&] { return stop_; });
	}
private:
	mutable std::mutex m_;
	std::condition_variable cv_;
	bool stop_ = false;
};


/**
* WatchdogLoop
* - 고정 주기(기본 200ms) 스케줄러. 절대 시각 기준(next += cadence)이라 누적 지연이 없다.
* - 매 틱: 다음 경계까지 대기 → 종료 토큰 확인 → 틱 훅 실행.
* - stop()은 토큰만 세우고 join. 실행 중인 틱은 끝까지 수행된다.
*/
class WatchdogLoop {
public:
	using TickFn = std::function<void(TimePoint now)>;

	explicit WatchdogLoop(std::chrono::milliseconds cadence = std::chrono::milliseconds(SHELFWATCH_CADENCE_MS),
		TickFn on_tick = nullptr)
		: cadence_(cadence), on_tick_(std::move(on_tick)) {}
	~WatchdogLoop() { stop(); }

	WatchdogLoop(const WatchdogLoop&) = delete;
	WatchdogLoop& operator=(const WatchdogLoop&) = delete;

	bool start();      ///< 이미 실행 중이면 false
	void stop();       ///< 종료 요청 + 스레드 join
	bool running() const { return running_; }
	uint64_t ticks() const { return ticks_; }
	std::chrono::milliseconds cadence() const { return cadence_; }

private:
	void runLoop_();

	std::chrono::milliseconds cadence_;
	TickFn on_tick_;
	CancelToken token_;
	std::thread th_;
	std::atomic<bool> running_{ false };
	std::atomic<uint64_t> ticks_{ 0 };
};

} // namespace shelfwatch
