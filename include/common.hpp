#pragma once
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "config/app_config.h"


namespace shelfwatch {

// 시간 타입 (last_report_time, 워치독 주기 계산에 사용)
using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

constexpr std::size_t kNumSlots = SHELFWATCH_NUM_SLOTS;

/// 슬롯 1개의 이번 주기 측정값 (비어 있으면 이번 주기 측정 없음)
using Reading = std::optional<double>;
using Readings = std::array<Reading, kNumSlots>;


/**
* Item
* - 카탈로그 엔티티. 카탈로그가 소유하고 슬롯에는 값으로 복사된다.
* - 동일성 판단은 **id만** 사용 (집계 맵의 키).
*/
struct Item {
	int64_t id = 0;
	std::string name;
	std::string upc;
	double price = 0.0;
	int units = 0;
	double avg_weight = 0.0; ///< 1개당 평균 무게(g)
	double std_weight = 0.0; ///< 정수 배수로 인정하는 허용 편차(g)
	std::string thumbnail;
	std::string vision_class;

	/// 개수 판정이 가능한 무게 정보인지 (avg_weight > 0, 0 <= std_weight < avg_weight)
	bool weights_valid() const {
		return std::isfinite(avg_weight) && avg_weight > 0.0 && std_weight >= 0.0 && std_weight < avg_weight;
	}
};


/// (shelf, slot) 대상 운영 제어 결과
enum class ShelfStatus : uint8_t {
	Ok = 0,
	UnknownShelf = 1,
	BadSlot = 2,
	CalibrationError = 3,
	InvalidFactor = 4
};

inline const char* to_string(ShelfStatus s) {
	switch (s) {
	case ShelfStatus::Ok: return "ok";
	case ShelfStatus::UnknownShelf: return "unknown_shelf";
	case ShelfStatus::BadSlot: return "bad_slot";
	case ShelfStatus::CalibrationError: return "calibration_error";
	case ShelfStatus::InvalidFactor: return "invalid_factor";
	}
	return "unknown";
}

} // namespace shelfwatch
