#pragma once
#include <functional>
#include <string>
#include <nlohmann/json.hpp>


namespace shelfwatch {

/**
* PubSubClient
* - 엔진이 의존하는 전송 계층 인터페이스 (MQTT 등 외부 구현으로 교체 가능).
* - 핸들러는 수신 스레드에서 호출되므로 짧게 끝내야 한다.
*/
class PubSubClient {
public:
	using Handler = std::function<void(const std::string& topic, const nlohmann::json& payload)>;

	virtual ~PubSubClient() = default;
	virtual void subscribe(const std::string& topic, Handler h) = 0;
	virtual bool publish(const std::string& topic, const nlohmann::json& payload) = 0;
};

} // namespace shelfwatch
