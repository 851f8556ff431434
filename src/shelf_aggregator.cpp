#include "shelf_aggregator.hpp"


namespace shelfwatch {

ShelfAggregator::ShelfAggregator(const ShelfAssignment& assignment, const DetectorParams& params, TimePoint created)
	: last_report_(created) {
	for (std::size_t i = 0; i < kNumSlots; ++i) {
		slots_[i] = SlotDetector(assignment[i].item, assignment[i].conversion_factor, params);
	}
}


void ShelfAggregator::seed(const Readings& raw_weights, TimePoint received) {
	last_report_ = received;
	for (std::size_t i = 0; i < kNumSlots; ++i) {
		if (raw_weights[i]) slots_[i].seed(*raw_weights[i]);
	}
}


ItemDeltas ShelfAggregator::update(const Readings& raw_weights, TimePoint received) {
	last_report_ = received;
	ItemDeltas out;
	for (std::size_t i = 0; i < kNumSlots; ++i) {
		if (!raw_weights[i]) continue;
		const int d = slots_[i].update(*raw_weights[i]);
		const auto& item = slots_[i].item();
		if (!item) continue;

		auto it = out.find(item->id);
		if (it == out.end()) out.emplace(item->id, ItemDelta{ *item, d });
		else it->second.delta += d;
	}
	return out;
}

} // namespace shelfwatch
