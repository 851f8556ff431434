#include "shelf_registry.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

using json = nlohmann::json;


namespace shelfwatch {

// 숫자 문자열 변환 (앞뒤 공백 허용, 전체 소비 + 유한값일 때만 성공)
static std::optional<double> parse_number(const std::string& s) {
	const char* b = s.c_str();
	char* end = nullptr;
	double v = std::strtod(b, &end);
	if (end == b) return std::nullopt;
	while (*end && std::isspace((unsigned char)*end)) ++end;
	if (*end) return std::nullopt;
	if (!std::isfinite(v)) return std::nullopt;
	return v;
}


bool decode_shelf_message(const json& j, std::string& id, Readings& out, std::string* why) {
	auto fail = [why](const char* r) { if (why) *why = r; return false; };

	if (!j.is_object()) return fail("payload is not an object");
	auto it_id = j.find("id");
	auto it_data = j.find("data");
	if (it_id == j.end() || it_data == j.end()) return fail("missing 'id' or 'data' field");
	if (!it_id->is_string()) return fail("'id' is not a string");
	if (!it_data->is_array()) return fail("'data' is not an array");
	if (it_data->size() != kNumSlots) return fail("'data' has wrong number of entries");

	Readings r{};
	for (std::size_t i = 0; i < kNumSlots; ++i) {
		const json& e = (*it_data)[i];
		if (e.is_null()) continue;
		if (e.is_number()) { r[i] = e.get<double>(); continue; }
		if (e.is_string()) { r[i] = parse_number(e.get<std::string>()); continue; } // 변환 실패 → null
		return fail("'data' entry is not numeric or null");
	}
	id = it_id->get<std::string>();
	out = r;
	return true;
}


ShelfRegistry::ShelfRegistry(AssignmentTable table, RegistryOptions opts, CartCallbacks cbs, LogSink* log)
	: table_(std::move(table)), opts_(opts), cbs_(std::move(cbs)), log_sink_(log) {}


RouteResult ShelfRegistry::route(const json& msg, TimePoint received) {
	std::string id, why;
	Readings r{};
	if (!decode_shelf_message(msg, id, r, &why)) {
		log_("drop message: " + why);
		return RouteResult::Malformed;
	}
	for (std::size_t i = 0; i < kNumSlots; ++i) {
		const json& e = msg["data"][i];
		if (e.is_string() && !r[i]) log_("shelf " + id + " slot " + std::to_string(i) + ": '" + e.get<std::string>() + "' is not a number, using null");
	}
	return route(id, r, received);
}


RouteResult ShelfRegistry::route(const std::string& id, const Readings& readings, TimePoint received) {
	auto it = shelves_.find(id);
	if (it == shelves_.end()) {
		auto a = table_.find(id);
		if (a == table_.end()) {
			if (rejected_.insert(id).second) log_("shelf " + id + " not in assignment table, dropping its data");
			return RouteResult::UnknownShelf;
		}
		log_("new shelf connected (" + id + ")");
		ShelfRecord rec{ ShelfAggregator(a->second, opts_.detector, received), false };
		rec.agg.seed(readings, received);
		shelves_.emplace(id, std::move(rec));
		return RouteResult::Created;
	}

	dispatch_(id, it->second.agg.update(readings, received));
	return RouteResult::Updated;
}


void ShelfRegistry::dispatch_(const std::string& id, const ItemDeltas& deltas) {
	for (const auto& kv : deltas) {
		const ItemDelta& d = kv.second;
		if (d.delta == 0) continue;

		const bool decrease = d.delta < 0;
		const bool adds = (opts_.polarity == CartPolarity::DecreaseAdds) ? decrease : !decrease;
		const auto& cb = adds ? cbs_.add_to_cart : cbs_.remove_from_cart;
		const int n = decrease ? -d.delta : d.delta;

		log_("shelf " + id + " item " + std::to_string(d.item.id) + " (" + d.item.name + ") delta "
			+ std::to_string(d.delta) + " → " + (adds ? "add_to_cart" : "remove_from_cart") + " x" + std::to_string(n));
		if (!cb) continue;
		for (int k = 0; k < n; ++k) cb(d.item);
	}
}


ShelfAggregator* ShelfRegistry::lookup_(const std::string& id, std::size_t slot, ShelfStatus& st) {
	auto it = shelves_.find(id);
	if (it == shelves_.end()) { st = ShelfStatus::UnknownShelf; return nullptr; }
	if (slot >= kNumSlots) { st = ShelfStatus::BadSlot; return nullptr; }
	st = ShelfStatus::Ok;
	return &it->second.agg;
}


ShelfStatus ShelfRegistry::set_conversion_factor(const std::string& id, std::size_t slot, double factor) {
	ShelfStatus st;
	ShelfAggregator* s = lookup_(id, slot, st);
	if (!s) return st;
	if (!s->slot(slot).set_conversion_factor(factor)) {
		log_("shelf " + id + " slot " + std::to_string(slot) + ": rejected conversion factor " + std::to_string(factor));
		return ShelfStatus::InvalidFactor;
	}
	return ShelfStatus::Ok;
}


ShelfStatus ShelfRegistry::tare(const std::string& id, std::size_t slot, double zero_weight, double loaded_weight,
	double& factor_out) {
	ShelfStatus st;
	ShelfAggregator* s = lookup_(id, slot, st);
	if (!s) return st;

	SlotDetector& d = s->slot(slot);
	auto f = d.calibrate(zero_weight, loaded_weight, opts_.known_tare_weight_g);
	factor_out = d.conversion_factor();
	if (!f) {
		log_("shelf " + id + " slot " + std::to_string(slot) + ": calibration failed (zero="
			+ std::to_string(zero_weight) + " loaded=" + std::to_string(loaded_weight) + "), keeping factor "
			+ std::to_string(factor_out));
		return ShelfStatus::CalibrationError;
	}
	return ShelfStatus::Ok;
}


std::optional<double> ShelfRegistry::get_most_recent_raw_weight(const std::string& id, std::size_t slot) const {
	auto it = shelves_.find(id);
	if (it == shelves_.end() || slot >= kNumSlots) return std::nullopt;
	return it->second.agg.slot(slot).previous_raw_weight();
}


std::vector<LivenessChange> ShelfRegistry::check_staleness(TimePoint now, std::chrono::milliseconds max_age) {
	std::vector<LivenessChange> out;
	for (auto& kv : shelves_) {
		ShelfRecord& rec = kv.second;
		const bool old = (now - rec.agg.last_report_time()) > max_age;
		if (old == rec.stale) continue;
		rec.stale = old;
		out.push_back(LivenessChange{ kv.first, old });
		log_("shelf " + kv.first + (old ? " stopped reporting" : " reporting again"));
	}
	return out;
}


void ShelfRegistry::replace_assignments(AssignmentTable table) {
	table_ = std::move(table);
	rejected_.clear();
}


const ShelfAggregator* ShelfRegistry::find(const std::string& id) const {
	auto it = shelves_.find(id);
	return it == shelves_.end() ? nullptr : &it->second.agg;
}


std::vector<ShelfInfo> ShelfRegistry::list_shelves(TimePoint now) const {
	using std::chrono::duration_cast;
	using std::chrono::milliseconds;
	std::vector<ShelfInfo> out;
	for (const auto& kv : shelves_) {
		auto age = duration_cast<milliseconds>(now - kv.second.agg.last_report_time());
		out.push_back(ShelfInfo{ kv.first, kv.second.stale, age < milliseconds(0) ? milliseconds(0) : age });
	}
	return out;
}

} // namespace shelfwatch
