#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common.hpp"


namespace shelfwatch {

/**
* Catalog
* - 아이템 조회 협력자 인터페이스 (REST 클라이언트 등 외부 구현).
*/
class Catalog {
public:
	virtual ~Catalog() = default;
	virtual std::vector<Item> get_items() const = 0;
	virtual std::optional<Item> get_item(int64_t id) const = 0;
};


/**
* @brief 아이템 JSON 1건 → Item
* - id/avg_weight/std_weight 필수, 무게는 Item::weights_valid()를 만족해야 함.
* - 선택 필드(name, upc, price, units, thumbnail, vision_class)는 타입이 틀리면 실패.
* @param why 실패 사유 (옵션)
*/
bool item_from_json(const nlohmann::json& j, Item& out, std::string* why = nullptr);


/**
* JsonCatalog
* - JSON 파일(아이템 배열)에서 읽은 고정 카탈로그. 오프라인/목업 운영용.
*/
class JsonCatalog : public Catalog {
public:
	bool load(const std::string& path, std::string* err = nullptr);
	bool load(const nlohmann::json& items, std::string* err = nullptr);

	std::vector<Item> get_items() const override;
	std::optional<Item> get_item(int64_t id) const override;

private:
	std::map<int64_t, Item> items_;
};

} // namespace shelfwatch
