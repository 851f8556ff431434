#include "engine_config.hpp"
#include <cmath>
#include <fstream>
#include <iterator>

using json = nlohmann::json;


namespace shelfwatch {

static bool fail(std::string* err, const std::string& why) {
	if (err) *err = why;
	return false;
}


static bool read_json_file(const std::string& path, json& out, std::string* err) {
	std::ifstream f(path);
	if (!f) return fail(err, "cannot open " + path);
	std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
	out = json::parse(text, nullptr, false);
	if (out.is_discarded()) return fail(err, path + ": invalid JSON");
	return true;
}


// 키가 있으면 양의 정수로 읽기 (없으면 기본값 유지)
static bool read_positive_int(const json& j, const char* key, int& dst, std::string* err) {
	auto it = j.find(key);
	if (it == j.end()) return true;
	if (!it->is_number_integer() || it->get<int64_t>() <= 0) return fail(err, std::string("'") + key + "' must be a positive integer");
	dst = it->get<int>();
	return true;
}


static bool read_positive_double(const json& j, const char* key, double& dst, std::string* err) {
	auto it = j.find(key);
	if (it == j.end()) return true;
	if (!it->is_number() || !(it->get<double>() > 0.0) || !std::isfinite(it->get<double>()))
		return fail(err, std::string("'") + key + "' must be a positive number");
	dst = it->get<double>();
	return true;
}


static bool read_string(const json& j, const char* key, std::string& dst, std::string* err) {
	auto it = j.find(key);
	if (it == j.end()) return true;
	if (!it->is_string()) return fail(err, std::string("'") + key + "' must be a string");
	dst = it->get<std::string>();
	return true;
}


static bool parse_detector(const json& j, DetectorParams& d, std::string* err) {
	if (!j.is_object()) return fail(err, "'detector' must be an object");
	int window = (int)d.window;
	int debounce = (int)d.debounce_cycles;
	if (!read_positive_int(j, "window", window, err)) return false;
	if (!read_positive_double(j, "extraneous_limit_g", d.extraneous_limit_g, err)) return false;
	auto it = j.find("debounce_cycles");
	if (it != j.end()) {
		if (!it->is_number_integer() || it->get<int64_t>() < 0) return fail(err, "'debounce_cycles' must be >= 0");
		debounce = it->get<int>();
	}
	d.window = (std::size_t)window;
	d.debounce_cycles = (uint32_t)debounce;
	return true;
}


static bool parse_shelves(const json& j, const Catalog& catalog, double default_factor,
	AssignmentTable& out, std::string* err) {
	if (!j.is_object()) return fail(err, "'shelves' must be an object");
	AssignmentTable table;
	for (auto it = j.begin(); it != j.end(); ++it) {
		const std::string& id = it.key();
		const json& slots = it.value();
		if (!slots.is_array() || slots.size() != kNumSlots)
			return fail(err, "shelf " + id + ": expected " + std::to_string(kNumSlots) + " slot entries");

		ShelfAssignment a{};
		for (std::size_t i = 0; i < kNumSlots; ++i) {
			const json& s = slots[i];
			a[i].conversion_factor = default_factor;
			if (s.is_null()) continue; // 빈 슬롯
			if (!s.is_object()) return fail(err, "shelf " + id + " slot " + std::to_string(i) + ": expected object or null");

			auto item = s.find("item");
			if (item != s.end() && !item->is_null()) {
				if (!item->is_number_integer()) return fail(err, "shelf " + id + " slot " + std::to_string(i) + ": 'item' must be an id");
				auto found = catalog.get_item(item->get<int64_t>());
				if (!found) return fail(err, "shelf " + id + " slot " + std::to_string(i) + ": unknown item " + std::to_string(item->get<int64_t>()));
				a[i].item = *found;
			}
			if (!read_positive_double(s, "conversion_factor", a[i].conversion_factor, err)) return false;
		}
		table[id] = a;
	}
	out.swap(table);
	return true;
}


bool parse_engine_config(const json& j, const Catalog& catalog, EngineConfig& out, std::string* err) {
	if (!j.is_object()) return fail(err, "config root must be an object");
	EngineConfig c;

	if (!read_string(j, "uds_path", c.uds_path, err)) return false;
	if (!read_string(j, "peer_path", c.peer_path, err)) return false;
	if (!read_string(j, "log_path", c.log_path, err)) return false;
	if (!read_string(j, "catalog_path", c.catalog_path, err)) return false;
	if (c.uds_path.empty()) return fail(err, "'uds_path' must not be empty");

	int queue_capacity = (int)c.queue_capacity;
	if (!read_positive_int(j, "cadence_ms", c.cadence_ms, err)) return false;
	if (!read_positive_int(j, "stale_after_cadences", c.stale_after_cadences, err)) return false;
	if (!read_positive_int(j, "rx_timeout_ms", c.rx_timeout_ms, err)) return false;
	if (!read_positive_int(j, "queue_capacity", queue_capacity, err)) return false;
	c.queue_capacity = (std::size_t)queue_capacity;

	if (!read_positive_double(j, "known_tare_weight_g", c.registry.known_tare_weight_g, err)) return false;
	if (!read_positive_double(j, "default_conversion_factor", c.default_conversion_factor, err)) return false;

	auto pol = j.find("cart_polarity");
	if (pol != j.end()) {
		const std::string p = pol->is_string() ? pol->get<std::string>() : "";
		if (p == "decrease_adds") c.registry.polarity = CartPolarity::DecreaseAdds;
		else if (p == "increase_adds") c.registry.polarity = CartPolarity::IncreaseAdds;
		else return fail(err, "'cart_polarity' must be \"decrease_adds\" or \"increase_adds\"");
	}

	auto det = j.find("detector");
	if (det != j.end() && !parse_detector(*det, c.registry.detector, err)) return false;

	auto sh = j.find("shelves");
	if (sh != j.end() && !parse_shelves(*sh, catalog, c.default_conversion_factor, c.shelves, err)) return false;

	out = c;
	return true;
}


bool load_engine_config(const std::string& path, JsonCatalog& catalog, EngineConfig& out, std::string* err) {
	json j;
	if (!read_json_file(path, j, err)) return false;
	if (!j.is_object()) return fail(err, path + ": config root must be an object");

	auto cp = j.find("catalog_path");
	if (cp != j.end() && cp->is_string() && !cp->get<std::string>().empty()) {
		if (!catalog.load(cp->get<std::string>(), err)) return false;
	} else if (j.contains("items")) {
		if (!catalog.load(j["items"], err)) return false;
	}
	return parse_engine_config(j, catalog, out, err);
}

} // namespace shelfwatch
