#include "catalog.hpp"
#include <fstream>
#include <iterator>
#include <utility>

using json = nlohmann::json;


namespace shelfwatch {

bool item_from_json(const json& j, Item& out, std::string* why) {
	auto fail = [why](const std::string& r) { if (why) *why = r; return false; };
	if (!j.is_object()) return fail("not an object");

	auto num = [&](const char* k) { auto it = j.find(k); return it != j.end() && it->is_number(); };
	if (!num("id") || !num("avg_weight") || !num("std_weight")) return fail("missing id/avg_weight/std_weight");
	if (!j["id"].is_number_integer()) return fail("'id' must be an integer");

	// 선택 필드: 없으면 기본값, 있으면 타입이 맞아야 함
	auto opt_string = [&](const char* k, std::string& dst) {
		auto it = j.find(k);
		if (it == j.end() || it->is_null()) return true;
		if (!it->is_string()) return false;
		dst = it->get<std::string>();
		return true;
	};

	Item it;
	it.id = j["id"].get<int64_t>();
	it.avg_weight = j["avg_weight"].get<double>();
	it.std_weight = j["std_weight"].get<double>();
	if (!it.weights_valid()) return fail("item " + std::to_string(it.id) + ": need avg_weight > 0 and 0 <= std_weight < avg_weight");

	for (auto f : { std::make_pair("name", &it.name), std::make_pair("upc", &it.upc),
		std::make_pair("thumbnail", &it.thumbnail), std::make_pair("vision_class", &it.vision_class) }) {
		if (!opt_string(f.first, *f.second)) return fail("item " + std::to_string(it.id) + ": '" + f.first + "' must be a string");
	}

	auto price = j.find("price");
	if (price != j.end() && !price->is_null()) {
		if (!price->is_number()) return fail("item " + std::to_string(it.id) + ": 'price' must be a number");
		it.price = price->get<double>();
	}
	auto units = j.find("units");
	if (units != j.end() && !units->is_null()) {
		if (!units->is_number_integer()) return fail("item " + std::to_string(it.id) + ": 'units' must be an integer");
		it.units = units->get<int>();
	}

	out = it;
	return true;
}


bool JsonCatalog::load(const std::string& path, std::string* err) {
	std::ifstream f(path);
	if (!f) { if (err) *err = "cannot open " + path; return false; }
	std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
	json j = json::parse(text, nullptr, false);
	if (j.is_discarded()) { if (err) *err = path + ": invalid JSON"; return false; }
	return load(j, err);
}


bool JsonCatalog::load(const json& items, std::string* err) {
	if (!items.is_array()) { if (err) *err = "catalog is not an array"; return false; }
	std::map<int64_t, Item> m;
	for (size_t i = 0; i < items.size(); ++i) {
		Item it;
		std::string why;
		if (!item_from_json(items[i], it, &why)) {
			if (err) *err = "catalog entry " + std::to_string(i) + ": " + why;
			return false;
		}
		m[it.id] = it;
	}
	items_.swap(m);
	return true;
}


std::vector<Item> JsonCatalog::get_items() const {
	std::vector<Item> v;
	for (const auto& kv : items_) v.push_back(kv.second);
	return v;
}


std::optional<Item> JsonCatalog::get_item(int64_t id) const {
	auto it = items_.find(id);
	if (it == items_.end()) return std::nullopt;
	return it->second;
}

} // namespace shelfwatch
