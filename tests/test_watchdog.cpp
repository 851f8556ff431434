// WatchdogLoop / CancelToken / MsgQueue 테스트
#include <atomic>
#include <chrono>
#include <thread>

#include "check.hpp"
#include "msg_queue.hpp"
#include "watchdog_loop.hpp"

using namespace shelfwatch;
using namespace std::chrono;

static void test_ticks_at_cadence() {
    std::atomic<int> hooks{ 0 };
    WatchdogLoop wd(milliseconds(20), [&](TimePoint) { hooks++; });
    check(wd.start(), __LINE__);
    check(!wd.start(), __LINE__); // 중복 시작 불가
    std::this_thread::sleep_for(milliseconds(210));
    wd.stop();
    check(!wd.running(), __LINE__);
    check(wd.ticks() >= 5 && wd.ticks() <= 12, __LINE__);
    check((uint64_t)hooks.load() == wd.ticks(), __LINE__);
}

static void test_stop_does_not_wait_for_cadence() {
    WatchdogLoop wd(milliseconds(5000));
    check(wd.start(), __LINE__);
    std::this_thread::sleep_for(milliseconds(20));
    auto t0 = steady_clock::now();
    wd.stop();
    check(steady_clock::now() - t0 < milliseconds(1000), __LINE__);
    check(wd.ticks() == 0, __LINE__);
}

static void test_inflight_tick_completes() {
    std::atomic<bool> finished{ false };
    std::atomic<bool> entered{ false };
    WatchdogLoop wd(milliseconds(10), [&](TimePoint) {
        if (entered.exchange(true)) return;
        std::this_thread::sleep_for(milliseconds(100));
        finished = true;
    });
    wd.start();
    while (!entered) std::this_thread::sleep_for(milliseconds(1));
    wd.stop();
    check(finished.load(), __LINE__);
}

static void test_cancel_token() {
    CancelToken tok;
    check(!tok.wait_until(Clock::now() + milliseconds(10)), __LINE__);
    std::thread th([&] { std::this_thread::sleep_for(milliseconds(20)); tok.request_stop(); });
    auto t0 = steady_clock::now();
    check(tok.wait_until(Clock::now() + milliseconds(5000)), __LINE__);
    check(steady_clock::now() - t0 < milliseconds(2000), __LINE__);
    th.join();
    check(tok.stop_requested(), __LINE__);
}

static void test_msg_queue_is_bounded() {
    MsgQueue<int> q(2);
    check(q.push(1), __LINE__);
    check(q.push(2), __LINE__);
    check(!q.push(3), __LINE__); // 가득 참
    check(q.size() == 2, __LINE__);
    q.shutdown();
    check(!q.push(4), __LINE__);
    int v = 0;
    check(q.pop(v) && v == 1, __LINE__); // shutdown 후에도 남은 항목은 꺼낸다
    check(q.pop(v) && v == 2, __LINE__);
    check(!q.pop(v), __LINE__);
}

int main() {
    run("test_ticks_at_cadence", test_ticks_at_cadence);
    run("test_stop_does_not_wait_for_cadence", test_stop_does_not_wait_for_cadence);
    run("test_inflight_tick_completes", test_inflight_tick_completes);
    run("test_cancel_token", test_cancel_token);
    run("test_msg_queue_is_bounded", test_msg_queue_is_bounded);
    return finish("test_watchdog");
}
