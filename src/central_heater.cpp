#include <algorithm>

#include "central_heater.h"
#include "logger.h"

CentralHeater::CentralHeater(const std::string & name, const Clock & clock, Schalter::Output output)
    : name(name), burner(name, output), on_timer(clock), off_timer(clock) {
}

CentralHeater::~CentralHeater() {
    shutdown();
}

void CentralHeater::attach(const std::string & zone, const Delays & delays) {
    std::lock_guard<std::mutex> lock(mutex);

    for (const auto & kv : zones) {
        if (kv.first == zone) {
            continue;
        }
        if (kv.second.on_millis != delays.on_millis || kv.second.off_millis != delays.off_millis) {
            get_logger().printf("Warning: zones sharing central heater %s have different delays (%s: %lu/%lu ms, %s: %lu/%lu ms), "
                                "using the longest ones.\n",
                                name.c_str(),
                                kv.first.c_str(), kv.second.on_millis, kv.second.off_millis,
                                zone.c_str(), delays.on_millis, delays.off_millis);
            break;
        }
    }

    zones[zone] = delays;
}

void CentralHeater::detach(const std::string & zone) {
    std::lock_guard<std::mutex> lock(mutex);

    if (demand.erase(zone) && demand.empty()) {
        demand_ended();
    }
    zones.erase(zone);
}

void CentralHeater::set_request(const std::string & zone, bool requesting) {
    std::lock_guard<std::mutex> lock(mutex);

    if (requesting) {
        const bool was_empty = demand.empty();
        if (demand.insert(zone).second) {
            get_logger().printf("Zone %s requests heat from %s.\n", zone.c_str(), name.c_str());
        }
        if (was_empty && !demand.empty()) {
            demand_started();
        }
    } else {
        if (demand.erase(zone)) {
            get_logger().printf("Zone %s no longer requests heat from %s.\n", zone.c_str(), name.c_str());
            if (demand.empty()) {
                demand_ended();
            }
        }
    }
}

// caller holds the mutex
void CentralHeater::demand_started() {
    if (off_timer.cancel()) {
        get_logger().printf("Central heater %s: demand returned, turn off cancelled.\n", name.c_str());
    }

    if (burner.is_active() || on_timer.pending()) {
        return;
    }

    const unsigned long delay = effective_delays().on_millis;
    get_logger().printf("Central heater %s: turning on in %lu ms.\n", name.c_str(), delay);
    on_timer.start(delay, [this] {
        if (demand.empty()) {
            return;
        }
        get_logger().printf("Turning central heater %s on.\n", name.c_str());
        burner.command(true);
    });

    // a zero delay fires right away
    on_timer.tick();
}

// caller holds the mutex
void CentralHeater::demand_ended() {
    if (on_timer.cancel()) {
        get_logger().printf("Central heater %s: demand gone, turn on cancelled.\n", name.c_str());
    }

    if (!burner.is_active() || off_timer.pending()) {
        return;
    }

    const unsigned long delay = effective_delays().off_millis;
    get_logger().printf("Central heater %s: turning off in %lu ms.\n", name.c_str(), delay);
    off_timer.start(delay, [this] {
        if (!demand.empty()) {
            return;
        }
        get_logger().printf("Turning central heater %s off.\n", name.c_str());
        burner.command(false);
    });

    off_timer.tick();
}

// caller holds the mutex
CentralHeater::Delays CentralHeater::effective_delays() const {
    Delays ret = {0, 0};
    for (const auto & kv : zones) {
        ret.on_millis = std::max(ret.on_millis, kv.second.on_millis);
        ret.off_millis = std::max(ret.off_millis, kv.second.off_millis);
    }
    return ret;
}

void CentralHeater::tick() {
    std::lock_guard<std::mutex> lock(mutex);
    on_timer.tick();
    off_timer.tick();
}

void CentralHeater::shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    on_timer.cancel();
    off_timer.cancel();
}

bool CentralHeater::is_active() const {
    return burner.is_active();
}

bool CentralHeater::is_idle() const {
    std::lock_guard<std::mutex> lock(mutex);
    return !burner.is_active() && !on_timer.pending() && !off_timer.pending();
}

bool CentralHeater::has_demand() const {
    std::lock_guard<std::mutex> lock(mutex);
    return !demand.empty();
}

bool CentralHeater::on_pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return on_timer.pending();
}

bool CentralHeater::off_pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return off_timer.pending();
}

std::set<std::string> CentralHeater::get_demand() const {
    std::lock_guard<std::mutex> lock(mutex);
    return demand;
}

CentralHeater::Delays CentralHeater::get_delays() const {
    std::lock_guard<std::mutex> lock(mutex);
    return effective_delays();
}

size_t CentralHeater::get_command_count() const {
    return burner.get_command_count();
}

JsonDocument CentralHeater::get_status() const {
    std::lock_guard<std::mutex> lock(mutex);

    JsonDocument json;
    json["state"] = to_c_str(burner.get_state());
    JsonArray zones_json = json["demand"].to<JsonArray>();
    for (const auto & zone : demand) {
        zones_json.add(zone);
    }
    if (on_timer.pending()) {
        json["on_in"] = on_timer.remaining_millis() / 1000.0;
    }
    if (off_timer.pending()) {
        json["off_in"] = off_timer.remaining_millis() / 1000.0;
    }
    const Delays delays = effective_delays();
    json["on_delay"] = delays.on_millis / 1000.0;
    json["off_delay"] = delays.off_millis / 1000.0;
    return json;
}

std::shared_ptr<CentralHeater> CentralHeaterRegistry::acquire(const std::string & name) {
    std::lock_guard<std::mutex> lock(mutex);

    std::shared_ptr<CentralHeater> & heater = heaters[name];
    if (!heater) {
        heater = std::make_shared<CentralHeater>(name, clock, output);
    }
    return heater;
}

std::shared_ptr<CentralHeater> CentralHeaterRegistry::find(const std::string & name) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = heaters.find(name);
    return it == heaters.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<CentralHeater>> CentralHeaterRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<CentralHeater>> ret;
    for (const auto & kv : heaters) {
        ret.push_back(kv.second);
    }
    return ret;
}

void CentralHeaterRegistry::tick() {
    for (auto & heater : all()) {
        heater->tick();
    }
    collect();
}

void CentralHeaterRegistry::shutdown() {
    for (auto & heater : all()) {
        heater->shutdown();
    }
}

void CentralHeaterRegistry::collect() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = heaters.begin(); it != heaters.end();) {
        // the registry holds the only reference
        if (it->second.use_count() == 1 && it->second->is_idle()) {
            get_logger().printf("Central heater %s no longer used.\n", it->first.c_str());
            it = heaters.erase(it);
        } else {
            ++it;
        }
    }
}
