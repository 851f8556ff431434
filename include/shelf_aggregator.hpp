#pragma once
#include <array>
#include <map>
#include <optional>

#include "common.hpp"
#include "slot_detector.hpp"


namespace shelfwatch {

/// 슬롯 정적 배정 (아이템이 없으면 빈 슬롯)
struct SlotAssignment {
	std::optional<Item> item;
	double conversion_factor = SHELFWATCH_DEFAULT_FACTOR;
};
using ShelfAssignment = std::array<SlotAssignment, kNumSlots>;


struct ItemDelta {
	Item item;
	int delta = 0; ///< 부호 있는 개수 변화 합계
};
/// item id → 합산된 변화 (같은 아이템이 여러 슬롯에 있을 수 있음)
using ItemDeltas = std::map<int64_t, ItemDelta>;


/**
* ShelfAggregator
* - 선반(디바이스) 1개 = 정확히 kNumSlots개의 SlotDetector.
* - 한 주기의 슬롯별 측정 배열을 각 슬롯에 분배하고 결과를 아이템별로 합산.
*/
class ShelfAggregator {
public:
	ShelfAggregator(const ShelfAssignment& assignment, const DetectorParams& params, TimePoint created);

	/** @brief 첫 메시지로 각 슬롯의 기준 무게를 채운다 (null 슬롯은 건너뜀) */
	void seed(const Readings& raw_weights, TimePoint received);

	/**
	* @brief 한 주기 갱신. last_report_time은 측정 유무와 관계없이 항상 갱신.
	* @return 측정이 있던 아이템 슬롯의 아이템별 변화 합계 (0 포함)
	*/
	ItemDeltas update(const Readings& raw_weights, TimePoint received);

	SlotDetector& slot(std::size_t i) { return slots_[i]; }
	const SlotDetector& slot(std::size_t i) const { return slots_[i]; }
	TimePoint last_report_time() const { return last_report_; }

private:
	std::array<SlotDetector, kNumSlots> slots_;
	TimePoint last_report_;
};

} // namespace shelfwatch
