#pragma once
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common.hpp"
#include "log_sink.hpp"
#include "shelf_aggregator.hpp"


namespace shelfwatch {

/// 선반 id → 초기 슬롯 배정 (최초 수신 시에만 참조)
using AssignmentTable = std::map<std::string, ShelfAssignment>;

/// 무게 변화 부호 → 장바구니 동작 매핑
enum class CartPolarity : uint8_t {
	DecreaseAdds = 0, ///< 감소(꺼냄) → add_to_cart, 증가(되돌림) → remove_from_cart
	IncreaseAdds = 1  ///< 반대 매핑
};

struct CartCallbacks {
	std::function<void(const Item&)> add_to_cart;
	std::function<void(const Item&)> remove_from_cart;
};

struct RegistryOptions {
	double known_tare_weight_g = SHELFWATCH_KNOWN_TARE_WEIGHT_G;
	CartPolarity polarity = CartPolarity::DecreaseAdds;
	DetectorParams detector{};
};


enum class RouteResult : uint8_t {
	Updated = 0,     ///< 기존 선반 갱신
	Created = 1,     ///< 최초 수신 → 선반 생성 + seed
	Malformed = 2,   ///< 형식 오류로 폐기
	UnknownShelf = 3 ///< 배정표에 없는 id → 폐기
};


struct LivenessChange {
	std::string id;
	bool stale = false; ///< true: 응답 끊김, false: 다시 수신됨
};

/// 연결된 선반 요약 (제어 토픽 `shelves` 응답용)
struct ShelfInfo {
	std::string id;
	bool stale = false;
	std::chrono::milliseconds age{ 0 }; ///< 마지막 수신 이후 경과 시간
};


/**
* @brief `{ "id": "<shelf>", "data": [<float|null> x4] }` 디코딩
* - 숫자 문자열은 변환, 변환 실패/비유한 값은 해당 슬롯만 null.
* - id 누락/비문자열, data 누락/비배열/개수 불일치, bool·object·array 원소 → false.
* @param why 실패 사유 (옵션)
*/
bool decode_shelf_message(const nlohmann::json& j, std::string& id, Readings& out, std::string* why = nullptr);


/**
* ShelfRegistry
* - 선반 id → ShelfAggregator 매핑의 단일 소유자.
* - **스레드 안전하지 않음**: 한 스레드(Orchestrator 워커)에서만 호출할 것.
* - 오류는 로그 후 폐기하며 호출자에게 예외를 던지지 않는다.
*/
class ShelfRegistry {
public:
	ShelfRegistry(AssignmentTable table, RegistryOptions opts, CartCallbacks cbs, LogSink* log = nullptr);

	/** @brief 수신 메시지 1건 처리 (디코딩 → 선반 조회/생성 → 갱신 → 콜백) */
	RouteResult route(const nlohmann::json& msg, TimePoint received);

	/** @brief 이미 디코딩된 측정 1건 처리 */
	RouteResult route(const std::string& id, const Readings& readings, TimePoint received);

	ShelfStatus set_conversion_factor(const std::string& id, std::size_t slot, double factor);

	/**
	* @brief 빈 상태/기지 무게 측정값으로 환산계수 재계산
	* @param factor_out 적용 중인 환산계수 (실패 시 기존 값)
	*/
	ShelfStatus tare(const std::string& id, std::size_t slot, double zero_weight, double loaded_weight,
		double& factor_out);

	std::optional<double> get_most_recent_raw_weight(const std::string& id, std::size_t slot) const;

	/**
	* @brief last_report_time이 max_age보다 오래된 선반을 stale로 표시
	* @return 이번 호출에서 상태가 바뀐 선반들 (stale 진입 / 복귀)
	*/
	std::vector<LivenessChange> check_staleness(TimePoint now, std::chrono::milliseconds max_age);

	/** @brief 배정표 교체. 거부했던 id 목록도 초기화 (기존 선반은 유지) */
	void replace_assignments(AssignmentTable table);

	const ShelfAggregator* find(const std::string& id) const;
	std::size_t shelf_count() const { return shelves_.size(); }
	/** @brief 연결된(한 번이라도 수신한) 선반 목록, id 순 */
	std::vector<ShelfInfo> list_shelves(TimePoint now) const;

private:
	struct ShelfRecord {
		ShelfAggregator agg;
		bool stale = false;
	};

	ShelfAggregator* lookup_(const std::string& id, std::size_t slot, ShelfStatus& st);
	void dispatch_(const std::string& id, const ItemDeltas& deltas);
	void log_(const std::string& line) const { if (log_sink_) log_sink_->write("REG", line); }

	AssignmentTable table_;
	RegistryOptions opts_;
	CartCallbacks cbs_;
	LogSink* log_sink_ = nullptr;

	std::map<std::string, ShelfRecord> shelves_;
	std::set<std::string> rejected_; ///< 배정표에 없어 거부한 id (최초 1회만 로그)
};

} // namespace shelfwatch
