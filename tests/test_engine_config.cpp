// EngineConfig / JsonCatalog 테스트
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "check.hpp"
#include "engine_config.hpp"

using namespace shelfwatch;
using json = nlohmann::json;

static json items() {
    return json::array({
        { {"id", 1}, {"name", "Little Bites Chocolate"}, {"price", 2.10}, {"avg_weight", 47}, {"std_weight", 10} },
        { {"id", 9}, {"name", "Sour Patch Kids"}, {"price", 3.50}, {"avg_weight", 226}, {"std_weight", 20} }
    });
}

static json base_config() {
    return json{
        {"uds_path", "/tmp/sw_test_uds"},
        {"cadence_ms", 100},
        {"stale_after_cadences", 5},
        {"queue_capacity", 16},
        {"cart_polarity", "increase_adds"},
        {"detector", { {"window", 3}, {"extraneous_limit_g", 2500.0}, {"debounce_cycles", 2} }},
        {"shelves", {
            {"AA:BB", { { {"item", 1}, {"conversion_factor", 0.5} }, { {"item", 9} }, nullptr, { {"item", 1} } }}
        }}
    };
}

static void test_catalog_lookup() {
    JsonCatalog cat;
    std::string err;
    check(cat.load(items(), &err), __LINE__);
    check(cat.get_items().size() == 2, __LINE__);
    auto it = cat.get_item(9);
    check(it && it->name == "Sour Patch Kids" && it->avg_weight == 226, __LINE__);
    check(!cat.get_item(42), __LINE__);
}

static void test_catalog_rejects_incomplete_item() {
    JsonCatalog cat;
    std::string err;
    json bad = json::array({ { {"id", 3}, {"name", "no weight"} } });
    check(!cat.load(bad, &err), __LINE__);
    check(!err.empty(), __LINE__);
    Item out;
    check(!item_from_json(json{ {"id", "x"}, {"avg_weight", 1}, {"std_weight", 1} }, out), __LINE__);
}

static json one_item(const char* key, const json& value) {
    json it = { {"id", 1}, {"name", "a"}, {"price", 2.10}, {"avg_weight", 47}, {"std_weight", 10} };
    it[key] = value;
    return json::array({ it });
}

static void test_catalog_rejects_wrong_field_types() {
    JsonCatalog cat;
    std::string err;
    check(!cat.load(one_item("price", "2.10"), &err), __LINE__);
    check(err.find("price") != std::string::npos, __LINE__);
    check(!cat.load(one_item("name", 12), &err), __LINE__);
    check(!cat.load(one_item("units", "100"), &err), __LINE__);
    check(!cat.load(one_item("id", 1.5), &err), __LINE__);
    check(cat.load(one_item("thumbnail", nullptr), &err), __LINE__); // null은 기본값

    // 설정 파일 경로에서도 예외 없이 거부
    const std::string path = "/tmp/shelfwatch_badcfg_" + std::to_string(getpid()) + ".json";
    json j = base_config();
    j["items"] = one_item("price", "2.10");
    { std::ofstream f(path); f << j.dump(); }
    EngineConfig c;
    err.clear();
    check(!load_engine_config(path, cat, c, &err), __LINE__);
    check(err.find("price") != std::string::npos, __LINE__);
    std::remove(path.c_str());
}

static void test_catalog_rejects_unusable_weights() {
    JsonCatalog cat;
    std::string err;
    json bad = one_item("avg_weight", 0);
    bad[0]["std_weight"] = -5;
    check(!cat.load(bad, &err), __LINE__);
    check(!cat.load(one_item("avg_weight", -47), &err), __LINE__);
    check(!cat.load(one_item("std_weight", -1), &err), __LINE__);
    check(!cat.load(one_item("std_weight", 47), &err), __LINE__); // std >= avg
    check(cat.load(one_item("std_weight", 0), &err), __LINE__);
}

static void test_parse_full_config() {
    JsonCatalog cat; cat.load(items());
    EngineConfig c;
    std::string err;
    check(parse_engine_config(base_config(), cat, c, &err), __LINE__);
    check(c.uds_path == "/tmp/sw_test_uds", __LINE__);
    check(c.peer_path == SHELFWATCH_PEER_UDS_PATH, __LINE__); // 기본값 유지
    check(c.cadence().count() == 100, __LINE__);
    check(c.stale_after().count() == 500, __LINE__);
    check(c.queue_capacity == 16, __LINE__);
    check(c.registry.polarity == CartPolarity::IncreaseAdds, __LINE__);
    check(c.registry.detector.window == 3, __LINE__);
    check(c.registry.detector.extraneous_limit_g == 2500.0, __LINE__);
    check(c.registry.detector.debounce_cycles == 2, __LINE__);

    check(c.shelves.size() == 1, __LINE__);
    const ShelfAssignment& a = c.shelves.at("AA:BB");
    check(a[0].item && a[0].item->id == 1 && a[0].conversion_factor == 0.5, __LINE__);
    check(a[1].item && a[1].item->id == 9 && a[1].conversion_factor == SHELFWATCH_DEFAULT_FACTOR, __LINE__);
    check(!a[2].item, __LINE__);
    check(a[3].item && a[3].item->id == 1, __LINE__);
}

static void test_parse_errors() {
    JsonCatalog cat; cat.load(items());
    EngineConfig c;
    std::string err;

    json j = base_config();
    j["shelves"]["AA:BB"] = json::array({ nullptr, nullptr, nullptr });
    check(!parse_engine_config(j, cat, c, &err), __LINE__);

    j = base_config();
    j["shelves"]["AA:BB"][1] = json{ {"item", 77} };
    check(!parse_engine_config(j, cat, c, &err), __LINE__);
    check(err.find("unknown item") != std::string::npos, __LINE__);

    j = base_config();
    j["cart_polarity"] = "sideways";
    check(!parse_engine_config(j, cat, c, &err), __LINE__);

    j = base_config();
    j["cadence_ms"] = 0;
    check(!parse_engine_config(j, cat, c, &err), __LINE__);

    j = base_config();
    j["shelves"]["AA:BB"][0]["conversion_factor"] = -1.0;
    check(!parse_engine_config(j, cat, c, &err), __LINE__);
}

static void test_load_from_file_with_inline_items() {
    const std::string path = "/tmp/shelfwatch_cfg_" + std::to_string(getpid()) + ".json";
    json j = base_config();
    j["items"] = items();
    { std::ofstream f(path); f << j.dump(2); }

    JsonCatalog cat;
    EngineConfig c;
    std::string err;
    check(load_engine_config(path, cat, c, &err), __LINE__);
    check(cat.get_items().size() == 2, __LINE__);
    check(c.shelves.count("AA:BB") == 1, __LINE__);
    std::remove(path.c_str());

    check(!load_engine_config("/nonexistent/shelfwatch.json", cat, c, &err), __LINE__);
    check(!err.empty(), __LINE__);
}

int main() {
    run("test_catalog_lookup", test_catalog_lookup);
    run("test_catalog_rejects_incomplete_item", test_catalog_rejects_incomplete_item);
    run("test_catalog_rejects_wrong_field_types", test_catalog_rejects_wrong_field_types);
    run("test_catalog_rejects_unusable_weights", test_catalog_rejects_unusable_weights);
    run("test_parse_full_config", test_parse_full_config);
    run("test_parse_errors", test_parse_errors);
    run("test_load_from_file_with_inline_items", test_load_from_file_with_inline_items);
    return finish("test_engine_config");
}
