#include <cmath>
#include <set>
#include <utility>

#include "heating.h"
#include "logger.h"

namespace {

typedef std::vector<std::pair<std::string, SensorRegistry::Kind>> SensorList;

const char * kind_name(SensorRegistry::Kind kind) {
    switch (kind) {
        case SensorRegistry::Kind::binary:
            return "binary_sensor";
        case SensorRegistry::Kind::weather:
            return "weather";
        default:
            return "sensor";
    }
}

SensorList get_sensors(const ZoneConfig & config) {
    SensorList ret;
    const auto add = [&ret](const std::string & address, SensorRegistry::Kind kind) {
        if (!address.empty()) {
            ret.push_back(std::make_pair(address, kind));
        }
    };
    add(config.temp_sensor, SensorRegistry::Kind::numeric);
    add(config.outdoor_sensor, SensorRegistry::Kind::numeric);
    add(config.backup_outdoor_sensor, SensorRegistry::Kind::numeric);
    add(config.weather, SensorRegistry::Kind::weather);
    add(config.humidity_sensor, SensorRegistry::Kind::numeric);
    add(config.door_window_sensor, SensorRegistry::Kind::binary);
    add(config.motion_sensor, SensorRegistry::Kind::binary);
    return ret;
}

}

Heating::Heating(const Clock & clock, Schalter::Output output, unsigned long poll_interval_millis)
    : clock(clock),
      poll_interval_millis(poll_interval_millis),
      schalters(output),
      central_heaters(clock, output),
      stopped(false),
      structure_revision(0) {
}

bool Heating::validate(const std::vector<ZoneConfig> & configs, const std::string & replaced, std::string & error) const {
    std::map<std::string, std::string> kinds;
    std::set<std::string> ids;
    std::set<std::string> heaters;
    std::set<std::string> burners;

    const auto collect = [&](const ZoneConfig & config) -> bool {
        if (!ids.insert(config.id).second) {
            error = "duplicate zone " + config.id;
            return false;
        }

        for (const auto & kv : get_sensors(config)) {
            const std::string kind = kind_name(kv.second);

            const Sensor * existing = sensors.find(kv.first);
            if (existing && kind != existing->kind()) {
                error = "zone " + config.id + ": " + kv.first + " is already used as " + existing->kind();
                return false;
            }

            auto it = kinds.find(kv.first);
            if (it != kinds.end() && it->second != kind) {
                error = "zone " + config.id + ": " + kv.first + " is already used as " + it->second;
                return false;
            }
            kinds[kv.first] = kind;
        }

        for (const auto & heater : config.heaters) {
            if (burners.count(heater)) {
                error = "zone " + config.id + ": heater " + heater + " is a central heater of another zone";
                return false;
            }
            heaters.insert(heater);
        }

        if (!config.central_heater.empty()) {
            if (heaters.count(config.central_heater)) {
                error = "zone " + config.id + ": central heater " + config.central_heater + " is a heater of another zone";
                return false;
            }
            burners.insert(config.central_heater);
        }

        return true;
    };

    for (const auto & kv : zones) {
        if (kv.first != replaced && !collect(kv.second->config)) {
            return false;
        }
    }

    for (const auto & config : configs) {
        if (!collect(config)) {
            return false;
        }
    }

    return true;
}

std::shared_ptr<Zone> Heating::create_zone(const ZoneConfig & config) {
    ++structure_revision;
    return std::make_shared<Zone>(config, clock, poll_interval_millis, sensors, schalters, central_heaters);
}

bool Heating::configure(const JsonVariantConst & json, std::string & error) {
    std::lock_guard<std::mutex> lock(mutex);

    const JsonVariantConst poll_interval = json["poll_interval"];
    if (!poll_interval.isNull()) {
        if (!poll_interval.is<double>() || !(poll_interval.as<double>() > 0)) {
            error = "poll_interval must be a positive number";
            return false;
        }
    }

    std::vector<ZoneConfig> configs;
    for (JsonPairConst kv : json["zones"].as<JsonObjectConst>()) {
        ZoneConfig config;
        if (!ZoneConfig::parse(kv.key().c_str(), kv.value(), config, error)) {
            get_logger().printf("Configuration error: %s\n", error.c_str());
            return false;
        }
        configs.push_back(config);
    }

    if (!validate(configs, "", error)) {
        get_logger().printf("Configuration error: %s\n", error.c_str());
        return false;
    }

    if (!poll_interval.isNull()) {
        poll_interval_millis = seconds_to_millis(poll_interval.as<double>());
    }

    for (const auto & config : configs) {
        zones[config.id] = create_zone(config);
    }

    get_logger().printf("Configured %u zones.\n", static_cast<unsigned int>(configs.size()));
    return true;
}

bool Heating::add_zone(const std::string & id, const JsonVariantConst & json, std::string & error) {
    std::lock_guard<std::mutex> lock(mutex);

    ZoneConfig config;
    if (!ZoneConfig::parse(id, json, config, error) || !validate({config}, "", error)) {
        get_logger().printf("Configuration error: %s\n", error.c_str());
        return false;
    }

    zones[id] = create_zone(config);
    return true;
}

bool Heating::reconfigure_zone(const std::string & id, const JsonVariantConst & json, std::string & error) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = zones.find(id);
    if (it == zones.end()) {
        error = "unknown zone " + id;
        return false;
    }

    ZoneConfig config;
    if (!ZoneConfig::parse(id, json, config, error) || !validate({config}, id, error)) {
        get_logger().printf("Configuration error: %s\n", error.c_str());
        return false;
    }

    const JsonDocument runtime_state = it->second->get_runtime_state();

    // drop the old zone first, so that it releases its heaters, a running
    // central heater stays registered and is picked up by the new zone
    it->second.reset();
    it->second = create_zone(config);
    it->second->restore_runtime_state(runtime_state.as<JsonVariantConst>());
    central_heaters.collect();
    get_logger().printf("Zone '%s' reconfigured.\n", id.c_str());
    return true;
}

bool Heating::remove_zone(const std::string & id) {
    std::shared_ptr<Zone> zone;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = zones.find(id);
        if (it == zones.end()) {
            return false;
        }
        zone = it->second;
        zones.erase(it);
        ++structure_revision;
    }
    // the zone detaches from its heaters once the last reference is gone,
    // a running central heater is switched off later by tick()
    zone.reset();
    central_heaters.collect();
    return true;
}

bool Heating::is_stopped() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stopped;
}

void Heating::handle_event(const std::string & entity, const std::string & payload, unsigned long timestamp) {
    if (is_stopped()) {
        return;
    }

    if (!sensors.update(entity, payload, timestamp)) {
        return;
    }

    for (auto & zone : get_zones()) {
        if (zone->uses(entity)) {
            zone->evaluate();
        }
    }

    central_heaters.tick();
}

void Heating::handle_event(const std::string & entity, const std::string & payload) {
    handle_event(entity, payload, clock.millis());
}

void Heating::tick() {
    if (is_stopped()) {
        return;
    }

    for (auto & zone : get_zones()) {
        zone->tick();
    }

    central_heaters.tick();
}

void Heating::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return;
        }
        stopped = true;
    }

    get_logger().println("Shutting down heating.");
    central_heaters.shutdown();
    schalters.shutdown();
}

CommandResult Heating::set_target(const std::string & id, double temperature) {
    auto zone = get(id);
    return zone ? zone->set_target(temperature) : CommandResult::unknown_zone;
}

CommandResult Heating::set_preset(const std::string & id, const std::string & preset) {
    auto zone = get(id);
    return zone ? zone->set_preset(preset) : CommandResult::unknown_zone;
}

CommandResult Heating::set_power(const std::string & id, bool on) {
    auto zone = get(id);
    if (!zone) {
        return CommandResult::unknown_zone;
    }
    zone->set_power(on);
    return CommandResult::ok;
}

CommandResult Heating::reset_manual_override(const std::string & id) {
    auto zone = get(id);
    if (!zone) {
        return CommandResult::unknown_zone;
    }
    zone->reset_manual_override();
    return CommandResult::ok;
}

std::shared_ptr<Zone> Heating::get(const std::string & id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = zones.find(id);
    if (it == zones.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<Zone>> Heating::get_zones() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<Zone>> ret;
    for (const auto & kv : zones) {
        ret.push_back(kv.second);
    }
    return ret;
}

std::vector<std::shared_ptr<CentralHeater>> Heating::get_central_heaters() const {
    return central_heaters.all();
}

std::vector<std::string> Heating::get_entities() const {
    std::set<std::string> entities;
    for (const auto & zone : get_zones()) {
        for (const auto & entity : zone->get_entities()) {
            entities.insert(entity);
        }
    }
    return std::vector<std::string>(entities.begin(), entities.end());
}

JsonDocument Heating::get_config() const {
    JsonDocument json;
    json["poll_interval"] = poll_interval_millis / 1000.0;
    auto zone_config = json["zones"].to<JsonObject>();
    for (const auto & zone : get_zones()) {
        zone_config[zone->config.id] = zone->get_config();
    }
    return json;
}

JsonDocument Heating::get_status() const {
    JsonDocument json;
    auto zone_status = json["zones"].to<JsonObject>();
    for (const auto & zone : get_zones()) {
        zone_status[zone->config.id] = zone->get_status();
    }
    auto heater_status = json["central_heaters"].to<JsonObject>();
    for (const auto & heater : get_central_heaters()) {
        heater_status[heater->name] = heater->get_status();
    }
    json["healthy"] = healthcheck();
    return json;
}

JsonDocument Heating::get_runtime_state() const {
    JsonDocument json;
    auto zone_state = json["zones"].to<JsonObject>();
    for (const auto & zone : get_zones()) {
        zone_state[zone->config.id] = zone->get_runtime_state();
    }
    return json;
}

void Heating::restore_runtime_state(const JsonVariantConst & json) {
    for (JsonPairConst kv : json["zones"].as<JsonObjectConst>()) {
        auto zone = get(kv.key().c_str());
        if (zone) {
            zone->restore_runtime_state(kv.value());
        } else {
            get_logger().printf("Ignoring stored state of unknown zone '%s'.\n", kv.key().c_str());
        }
    }
}

unsigned long Heating::get_revision() const {
    unsigned long revision;
    {
        std::lock_guard<std::mutex> lock(mutex);
        revision = structure_revision;
    }
    for (const auto & zone : get_zones()) {
        revision += zone->get_revision();
    }
    return revision;
}

bool Heating::healthcheck() const {
    for (const auto & zone : get_zones()) {
        if (!zone->healthcheck()) {
            return false;
        }
    }
    return true;
}
