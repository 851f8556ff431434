#include "orchestrator.hpp"
#include <utility>

using json = nlohmann::json;


namespace shelfwatch {

Orchestrator::Orchestrator(const EngineConfig& cfg, PubSubClient& bus, LogSink* log)
	: cfg_(cfg), bus_(bus), log_sink_(log),
	registry_(cfg.shelves, cfg.registry,
		CartCallbacks{
			[this](const Item& it) { publishCart_(SHELFWATCH_TOPIC_CART_ADD, it); },
			[this](const Item& it) { publishCart_(SHELFWATCH_TOPIC_CART_REMOVE, it); } },
		log),
	q_(cfg.queue_capacity),
	wd_(cfg.cadence(), [this](TimePoint now) { post_(Job{ JobKind::Tick, json(), now }); }) {}


bool Orchestrator::start() {
	if (running_) return false;
	bus_.subscribe(SHELFWATCH_TOPIC_DATA, [this](const std::string&, const json& p) { post_data(p); });
	bus_.subscribe(SHELFWATCH_TOPIC_CONTROL, [this](const std::string&, const json& p) { post_control(p); });

	running_ = true;
	worker_ = std::thread(&Orchestrator::workerLoop_, this);
	wd_.start();
	log_("started: " + std::to_string(cfg_.shelves.size()) + " shelves configured, cadence "
		+ std::to_string(cfg_.cadence_ms) + "ms, stale after " + std::to_string(cfg_.stale_after().count()) + "ms");
	return true;
}


void Orchestrator::stop() {
	if (!running_) return;
	wd_.stop();
	q_.shutdown();
	if (worker_.joinable()) worker_.join();
	running_ = false;
	log_("stopped (" + std::to_string(dropped_.load()) + " jobs dropped)");
}


bool Orchestrator::post_data(const json& payload) {
	return post_(Job{ JobKind::Data, payload, Clock::now() });
}


bool Orchestrator::post_control(const json& payload) {
	return post_(Job{ JobKind::Control, payload, Clock::now() });
}


bool Orchestrator::post_(Job j) {
	if (q_.push(std::move(j))) return true;
	// 백프레셔 정책: 가득 차면 새 작업 폐기
	if ((dropped_++ % 100) == 0) log_("work queue full (" + std::to_string(q_.capacity()) + "), dropping");
	return false;
}


void Orchestrator::workerLoop_() {
	Job j;
	while (q_.pop(j)) {
		switch (j.kind) {
		case JobKind::Data: registry_.route(j.body, j.at); break;
		case JobKind::Control: handleControl_(j.body); break;
		case JobKind::Tick: handleTick_(j.at); break;
		}
	}
}


void Orchestrator::handleTick_(TimePoint now) {
	for (const auto& c : registry_.check_staleness(now, cfg_.stale_after())) {
		bus_.publish(SHELFWATCH_TOPIC_STATUS, json{ {"id", c.id}, {"state", c.stale ? "stale" : "alive"} });
	}
}


void Orchestrator::handleControl_(const json& j) {
	json reply = json::object();
	const std::string cmd = (j.is_object() && j.contains("cmd") && j["cmd"].is_string()) ? j["cmd"].get<std::string>() : "";
	reply["cmd"] = cmd;

	if (cmd == "shelves") { // 선반 목록은 id/slot 불필요
		json list = json::array();
		for (const auto& s : registry_.list_shelves(Clock::now())) {
			list.push_back(json{ {"id", s.id}, {"state", s.stale ? "stale" : "alive"}, {"age_ms", s.age.count()} });
		}
		reply["status"] = "ok";
		reply["shelves"] = list;
		bus_.publish(SHELFWATCH_TOPIC_CONTROL_REPLY, reply);
		return;
	}

	if (!j.is_object() || !j.contains("id") || !j["id"].is_string()
		|| !j.contains("slot") || !j["slot"].is_number_unsigned()) {
		log_("control: missing 'id' or 'slot'");
		reply["status"] = "malformed";
		bus_.publish(SHELFWATCH_TOPIC_CONTROL_REPLY, reply);
		return;
	}
	const std::string id = j["id"].get<std::string>();
	const std::size_t slot = j["slot"].get<std::size_t>();
	reply["id"] = id;
	reply["slot"] = slot;

	auto number = [&](const char* k, double& v) {
		if (!j.contains(k) || !j[k].is_number()) return false;
		v = j[k].get<double>();
		return true;
	};

	if (cmd == "set_factor") {
		double f = 0.0;
		if (!number("factor", f)) reply["status"] = "malformed";
		else reply["status"] = to_string(registry_.set_conversion_factor(id, slot, f));
	}
	else if (cmd == "tare") {
		double zero = 0.0, loaded = 0.0, factor = 0.0;
		if (!number("zero", zero) || !number("loaded", loaded)) reply["status"] = "malformed";
		else {
			ShelfStatus st = registry_.tare(id, slot, zero, loaded, factor);
			reply["status"] = to_string(st);
			if (st == ShelfStatus::Ok || st == ShelfStatus::CalibrationError) reply["factor"] = factor;
		}
	}
	else if (cmd == "raw") {
		auto v = registry_.get_most_recent_raw_weight(id, slot);
		reply["status"] = v ? "ok" : (registry_.find(id) ? (slot < kNumSlots ? "no_reading" : "bad_slot") : "unknown_shelf");
		if (v) reply["raw"] = *v;
	}
	else {
		log_("control: unknown cmd '" + cmd + "'");
		reply["status"] = "unknown_cmd";
	}
	bus_.publish(SHELFWATCH_TOPIC_CONTROL_REPLY, reply);
}


void Orchestrator::publishCart_(const char* topic, const Item& item) {
	json ev{ {"item_id", item.id}, {"name", item.name}, {"price", item.price} };
	if (!bus_.publish(topic, ev)) log_(std::string("publish ") + topic + " failed (item " + std::to_string(item.id) + ")");
}

} // namespace shelfwatch
