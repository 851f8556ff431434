#include "slot_detector.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>


namespace shelfwatch {

static constexpr double kMaxUnitsPerCycle = SHELFWATCH_MAX_UNITS_PER_CYCLE;


SlotDetector::SlotDetector(std::optional<Item> item, double conversion_factor, const DetectorParams& params)
	: item_(std::move(item)), factor_(SHELFWATCH_DEFAULT_FACTOR), params_(params) {
	if (params_.window == 0) params_.window = 1;
	buf_.assign(params_.window, 0.0);
	set_conversion_factor(conversion_factor);
}


std::optional<double> SlotDetector::calibrate(double zero_weight, double loaded_weight, double known_weight) {
	if (loaded_weight == zero_weight) return std::nullopt;
	const double f = known_weight / (loaded_weight - zero_weight);
	if (!set_conversion_factor(f)) return std::nullopt;
	return factor_;
}


bool SlotDetector::set_conversion_factor(double factor) {
	if (!std::isfinite(factor) || factor <= 0.0) return false;
	factor_ = factor;
	return true;
}


void SlotDetector::seed(double raw_weight) {
	prev_raw_ = raw_weight;
	const double g = raw_weight * factor_;
	std::fill(buf_.begin(), buf_.end(), g);
	prev_smoothed_ = g;
}


double SlotDetector::rolling_median() const {
	std::vector<double> v(buf_.begin(), buf_.end());
	std::sort(v.begin(), v.end());
	const std::size_t n = v.size();
	if (n % 2 == 1) return v[n / 2];
	return (v[n / 2 - 1] + v[n / 2]) / 2.0;
}


int SlotDetector::update(double raw_weight) {
	prev_raw_ = raw_weight;

	buf_.push_front(raw_weight * factor_);
	const double evicted = buf_.back();
	buf_.pop_back();

	const double difference = rolling_median() - prev_smoothed_;
	prev_smoothed_ = evicted;

	if (std::fabs(difference) > params_.extraneous_limit_g) return 0; // 글리치: 분류 상태 유지
	return classify_(difference);
}


int SlotDetector::classify_(double difference) {
	if (!item_ || !item_->weights_valid()) return 0;
	const double avg = item_->avg_weight;
	const double std_w = item_->std_weight;

	// 변화량이 1개 무게의 정수 배수 ± 표준편차 범위 안에 있어야 이벤트로 인정
	const double remainder = std::fabs(std::fmod(difference, avg));
	if (!(remainder >= avg - std_w || remainder <= std_w)) return 0;

	// 반올림은 짝수 쪽 (0.5 → 0, 2.5 → 2)
	const double units = std::nearbyint(difference / avg);
	if (std::fabs(units) > kMaxUnitsPerCycle) return 0; // 한 주기에 불가능한 개수는 글리치로 취급
	const int quantity = (int)units;
	if (quantity > 0) {
		if (state_.latch == Latch::PendingPositive) return 0;
		state_.latch = Latch::PendingPositive;
		state_.magnitude = quantity;
		state_.quiet_cycles = 0;
		return quantity;
	}
	if (quantity < 0) {
		if (state_.latch == Latch::PendingNegative) return 0;
		state_.latch = Latch::PendingNegative;
		state_.magnitude = -quantity;
		state_.quiet_cycles = 0;
		return quantity;
	}

	if (state_.quiet_cycles >= params_.debounce_cycles) {
		state_.latch = Latch::Idle;
		state_.magnitude = 0;
	} else {
		state_.quiet_cycles++;
	}
	return 0;
}

} // namespace shelfwatch
