#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

#include "engine_config.hpp"
#include "log_sink.hpp"
#include "msg_queue.hpp"
#include "pubsub.hpp"
#include "shelf_registry.hpp"
#include "watchdog_loop.hpp"


namespace shelfwatch {

/**
* Orchestrator
* - `shelf/data`, `shelf/control` 토픽을 구독하고 작업을 **용량 제한 큐**에 적재.
* - **워커 스레드 1개**가 ShelfRegistry를 단독 소유 (데이터/제어/워치독 틱 모두 큐 경유).
* - 워치독은 cadence마다 Tick 작업만 넣는다 → 워커가 staleness 검사 후 `shelf/status` 발행.
* - 장바구니 콜백은 워커에서 인라인 실행되며 `cart/add`, `cart/remove`로 발행.
*/
class Orchestrator {
public:
	Orchestrator(const EngineConfig& cfg, PubSubClient& bus, LogSink* log = nullptr);
	~Orchestrator() { stop(); }

	Orchestrator(const Orchestrator&) = delete;
	Orchestrator& operator=(const Orchestrator&) = delete;

	bool start(); ///< 구독 등록 + 워커/워치독 시작
	void stop();  ///< 워치독 정지 → 큐에 남은 작업 처리 → 워커 join

	bool post_data(const nlohmann::json& payload);    ///< 큐가 가득 차면 false (폐기 + 로그)
	bool post_control(const nlohmann::json& payload);

	uint64_t dropped() const { return dropped_; }

	/** @brief stop() 이후에만 접근할 것 (워커 단독 소유) */
	const ShelfRegistry& registry() const { return registry_; }

private:
	enum class JobKind : uint8_t { Data, Control, Tick };
	struct Job {
		JobKind kind = JobKind::Data;
		nlohmann::json body;
		TimePoint at{};
	};

	bool post_(Job j);
	void workerLoop_();
	void handleControl_(const nlohmann::json& j);
	void handleTick_(TimePoint now);
	void publishCart_(const char* topic, const Item& item);
	void log_(const std::string& line) { if (log_sink_) log_sink_->write("ORC", line); }

	EngineConfig cfg_;
	PubSubClient& bus_;
	LogSink* log_sink_ = nullptr;

	ShelfRegistry registry_;
	MsgQueue<Job> q_;
	WatchdogLoop wd_;
	std::thread worker_;
	std::atomic<bool> running_{ false };
	std::atomic<uint64_t> dropped_{ 0 };
};

} // namespace shelfwatch
