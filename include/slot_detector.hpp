#pragma once
#include <cstdint>
#include <deque>
#include <optional>

#include "common.hpp"


namespace shelfwatch {

/// 검출기 파라미터 (모든 슬롯 공통)
struct DetectorParams {
	std::size_t window = SHELFWATCH_WINDOW_LEN;                 ///< 롤링 버퍼 길이 K (>= 1)
	double extraneous_limit_g = SHELFWATCH_EXTRANEOUS_LIMIT_G;  ///< 이보다 큰 변화는 글리치
	uint32_t debounce_cycles = SHELFWATCH_DEBOUNCE_CYCLES;      ///< 래치 해제 전 무변화 주기 수
};


/// 히스테리시스 래치 상태
enum class Latch : uint8_t {
	Idle = 0,
	PendingPositive = 1, ///< 증가 이벤트 발행됨, 같은 방향 재발행 억제
	PendingNegative = 2  ///< 감소 이벤트 발행됨, 같은 방향 재발행 억제
};

struct HysteresisState {
	Latch latch = Latch::Idle;
	int magnitude = 0;        ///< 마지막으로 발행한 수량(절대값)
	uint32_t quiet_cycles = 0; ///< 디바운스 카운터
};


/**
* SlotDetector
* - 로드셀 슬롯 1개. 원시값 → g 환산(conversion factor), K 길이 롤링 중앙값, 히스테리시스.
* - update() 1회 = 측정 1주기. 반환값은 부호 있는 개수 변화
*   (양수 = 무게 증가/되돌려 놓음, 음수 = 무게 감소/꺼냄).
* - 버퍼는 0으로 시작하므로 이미 물건이 올려진 슬롯은 처음 몇 주기 동안 오검출할 수 있다.
*   첫 측정값으로 seed()하면 이 시작 구간이 사라진다.
* - previous_smoothed는 버퍼에서 밀려난 값(K주기 전)으로 갱신된다 (지연으로 떨림 억제).
*/
class SlotDetector {
public:
	explicit SlotDetector(std::optional<Item> item = std::nullopt,
		double conversion_factor = SHELFWATCH_DEFAULT_FACTOR,
		const DetectorParams& params = DetectorParams{});

	/**
	* @brief 기지 무게로 환산계수 계산 및 적용
	* @return 새 환산계수. loaded == zero 이거나 결과가 양수가 아니면 nullopt (기존 계수 유지)
	*/
	std::optional<double> calibrate(double zero_weight, double loaded_weight, double known_weight);

	/** @brief 양수/유한 값만 적용. 그 외는 false (기존 계수 유지) */
	bool set_conversion_factor(double factor);

	/** @brief 첫 측정값으로 버퍼와 기준 무게를 채운다 (시작 구간 오검출 제거) */
	void seed(double raw_weight);

	/** @brief 원시 측정 1건 처리 → 개수 변화 */
	int update(double raw_weight);

	double conversion_factor() const { return factor_; }
	std::optional<double> previous_raw_weight() const { return prev_raw_; }
	double previous_smoothed_weight() const { return prev_smoothed_; }
	const std::optional<Item>& item() const { return item_; }
	const HysteresisState& state() const { return state_; }

	/** @brief 현재 롤링 버퍼의 중앙값 (짝수 길이는 가운데 두 값의 평균) */
	double rolling_median() const;

private:
	int classify_(double difference);

	std::optional<Item> item_;
	double factor_;
	DetectorParams params_;

	std::deque<double> buf_;       ///< front = 최신, back = 가장 오래된 값
	double prev_smoothed_ = 0.0;
	std::optional<double> prev_raw_;
	HysteresisState state_;
};

} // namespace shelfwatch
