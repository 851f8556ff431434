#include "watchdog_loop.hpp"


namespace shelfwatch {

bool WatchdogLoop::start() {
	if (running_) return false;
	token_.reset();
	running_ = true;
	th_ = std::thread(&WatchdogLoop::runLoop_, this);
	return true;
}


void WatchdogLoop::stop() {
	token_.request_stop();
	if (th_.joinable()) th_.join();
	running_ = false;
}


void WatchdogLoop::runLoop_() {
	auto next = Clock::now();
	while (true) {
		next += cadence_;
		if (token_.wait_until(next)) break;
		ticks_++;
		if (on_tick_) on_tick_(Clock::now());
		auto now = Clock::now();
		if (now - next >= cadence_) next = now; // 틱이 한 주기 이상 걸렸으면 밀린 틱은 건너뜀
	}
}

} // namespace shelfwatch
