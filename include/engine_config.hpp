#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

#include "catalog.hpp"
#include "shelf_registry.hpp"


namespace shelfwatch {

/**
* EngineConfig
* - 데몬 런타임 설정. 기본값은 config/app_config.h, JSON 파일로 덮어쓴다.
* - shelves: 선반 id → 슬롯 4개 배정 (item id는 카탈로그로 해석).
*
* 예)
* {
*   "uds_path": "/tmp/shelfwatch_uds", "peer_path": "/tmp/shelfwatch_app_uds",
*   "log_path": "", "catalog_path": "config/items.json",
*   "cadence_ms": 200, "stale_after_cadences": 10, "queue_capacity": 256,
*   "known_tare_weight_g": 226.0, "cart_polarity": "decrease_adds",
*   "detector": { "window": 2, "extraneous_limit_g": 5000, "debounce_cycles": 0 },
*   "shelves": { "80:65:99:49:EF:8E": [ {"item": 9, "conversion_factor": 0.44}, {"item": 14}, null, {"item": 6} ] }
* }
*/
struct EngineConfig {
	std::string uds_path = SHELFWATCH_UDS_PATH;
	std::string peer_path = SHELFWATCH_PEER_UDS_PATH;
	std::string log_path;     ///< 비어 있으면 stderr
	std::string catalog_path; ///< 비어 있으면 "items" 인라인 배열 사용

	int cadence_ms = SHELFWATCH_CADENCE_MS;
	int stale_after_cadences = SHELFWATCH_STALE_CADENCES;
	int rx_timeout_ms = SHELFWATCH_RX_TIMEOUT_MS;
	std::size_t queue_capacity = SHELFWATCH_QUEUE_CAPACITY;
	double default_conversion_factor = SHELFWATCH_DEFAULT_FACTOR;

	RegistryOptions registry{};
	AssignmentTable shelves;

	std::chrono::milliseconds cadence() const { return std::chrono::milliseconds(cadence_ms); }
	std::chrono::milliseconds stale_after() const { return std::chrono::milliseconds((int64_t)cadence_ms * stale_after_cadences); }
};


/**
* @brief JSON → EngineConfig (catalog_path는 해석하지 않음)
* @param catalog shelves의 item id 해석용
* @param err 실패 사유 (옵션)
*/
bool parse_engine_config(const nlohmann::json& j, const Catalog& catalog, EngineConfig& out, std::string* err = nullptr);


/**
* @brief 설정 파일 읽기 → 카탈로그 로드(catalog_path 또는 인라인 "items") → parse_engine_config
*/
bool load_engine_config(const std::string& path, JsonCatalog& catalog, EngineConfig& out, std::string* err = nullptr);

} // namespace shelfwatch
