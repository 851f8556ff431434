#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <utility>
#include <nlohmann/json.hpp>

#include "pubsub.hpp"


namespace shelfwatch {

/**
* EventBus
* - **UDS(Unix Domain Socket)** 기반 로컬 pub/sub. 선반 게이트웨이/앱과 같은 장치 내 통신.
* - 메시지 프레이밍: **[4바이트 길이(LE)] + JSON 텍스트**, JSON = `{"topic": "...", "payload": {...}}`.
* - 데몬은 listen()으로 **서버**를 열고, publish()는 peer 경로로 **클라이언트 전송**.
* - 파일 퍼미션(0660)으로 접근 주체 제어.
*/
class EventBus : public PubSubClient {
public:
	explicit EventBus(std::string peer_path = "") : peer_path_(std::move(peer_path)) {}
	~EventBus() override { close(); }

	EventBus(const EventBus&) = delete;
	EventBus& operator=(const EventBus&) = delete;

	/**
	* @brief UDS 서버 오픈
	* @param path 소켓 경로 (예: "/tmp/shelfwatch_uds")
	* @param mode 파일 퍼미션 (0660 권장: 소유자/그룹 RW)
	*/
	bool listen(const std::string& path, mode_t mode = 0660);
	void close();


	/**
	* @brief 수신: accept 1회 + 한 건 읽기
	* @param timeout_ms 접속 대기 한도 (-1 = 무한). 접속 후 프레임 읽기에도 같은 한도 적용 (<= 0이면 1초)
	* @return JSON 포인터 (타임아웃/파싱 실패/에러 시 nullptr)
	*/
	std::unique_ptr<nlohmann::json> receive(int timeout_ms = -1);


	/**
	* @brief 클라이언트 모드로 단건 전송
	* @param path 서버 소켓 경로
	* @param j 전송할 JSON
	*/
	static bool send(const std::string& path, const nlohmann::json& j);


	/** @brief 봉투(topic/payload)를 구독 핸들러로 전달. 핸들러가 없거나 형식 오류면 false */
	bool dispatch(const nlohmann::json& envelope);

	void subscribe(const std::string& topic, Handler h) override;
	bool publish(const std::string& topic, const nlohmann::json& payload) override; ///< peer_path_로 전송


private:
	int srv_fd_ = -1; ///< AF_UNIX 서버 소켓 fd (listen용)
	std::string srv_path_;
	std::string peer_path_; ///< publish 대상 UDS 경로 (비어 있으면 publish 안 함)
	std::mutex mu_;
	std::map<std::string, Handler> handlers_;
};

} // namespace shelfwatch
