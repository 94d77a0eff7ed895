#include <cmath>
#include <initializer_list>
#include <limits>

#include "central_heater.h"
#include "logger.h"
#include "schalter.h"
#include "zone.h"

namespace {

std::list<Sensor *> outdoor_sensors(const ZoneConfig & config, SensorRegistry & sensors) {
    std::list<Sensor *> ret;
    ret.push_back(sensors.get(config.outdoor_sensor, SensorRegistry::Kind::numeric));
    if (!config.backup_outdoor_sensor.empty()) {
        ret.push_back(sensors.get(config.backup_outdoor_sensor, SensorRegistry::Kind::numeric));
    }
    if (!config.weather.empty()) {
        ret.push_back(sensors.get(config.weather, SensorRegistry::Kind::weather));
    }
    ret.remove(nullptr);
    return ret;
}

Sensor * optional_sensor(const std::string & address, SensorRegistry & sensors, SensorRegistry::Kind kind) {
    return address.empty() ? nullptr : sensors.get(address, kind);
}

}

const char * to_c_str(const Zone::State & s) {
    switch (s) {
        case Zone::State::heat:
            return "heat";
        case Zone::State::idle:
            return "idle";
        default:
            return "off";
    }
}

const char * to_c_str(const CommandResult & r) {
    switch (r) {
        case CommandResult::ok:
            return "ok";
        case CommandResult::unknown_zone:
            return "unknown zone";
        case CommandResult::invalid_preset:
            return "invalid preset";
        default:
            return "invalid temperature";
    }
}

Zone::Zone(const ZoneConfig & config, const Clock & clock, unsigned long poll_interval_millis,
           SensorRegistry & sensors, SchalterRegistry & schalters, CentralHeaterRegistry & central_heaters)
    : config(config),
      name(this->config.name),
      clock(clock),
      poll_interval_millis(poll_interval_millis),
      temp_sensor(sensors.get(config.temp_sensor, SensorRegistry::Kind::numeric)),
      humidity_sensor(optional_sensor(config.humidity_sensor, sensors, SensorRegistry::Kind::numeric)),
      door_window_sensor(static_cast<BinarySensor *>(optional_sensor(config.door_window_sensor, sensors,
                         SensorRegistry::Kind::binary))),
      motion_sensor(static_cast<BinarySensor *>(optional_sensor(config.motion_sensor, sensors, SensorRegistry::Kind::binary))),
      outdoor(outdoor_sensors(config, sensors)),
      valve_timer(clock),
      valves_open(false),
      auto_onoff(config.auto_on_off, config.auto_on_temp, config.auto_off_temp),
      manual_override(seconds_to_millis(config.manual_override_timeout)),
      state(State::off),
      power(false),
      target(config.presets.home),
      preset("home"),
      reading(std::numeric_limits<double>::quiet_NaN()),
      degraded(false),
      outdoor_known(false),
      outdoor_temperature(std::numeric_limits<double>::quiet_NaN()),
      auto_decision(AutoOnOff::Decision::none),
      evaluated(false),
      last_evaluation(0),
      revision(0) {

    for (const auto & heater_name : config.heaters) {
        Schalter * heater = schalters.get(heater_name);
        heater->attach(this);
        heaters.push_back(heater);
    }

    if (!config.central_heater.empty()) {
        central_heater = central_heaters.acquire(config.central_heater);
        const CentralHeater::Delays delays = {
            seconds_to_millis(config.on_delay),
            seconds_to_millis(config.off_delay),
        };
        central_heater->attach(config.id, delays);
    }

    get_logger().printf("Zone '%s' created, target %.2f ºC.\n", name.c_str(), target);
}

Zone::~Zone() {
    if (central_heater) {
        central_heater->detach(config.id);
    }
    for (Schalter * heater : heaters) {
        heater->detach(this);
    }
    get_logger().printf("Zone '%s' removed.\n", name.c_str());
}

void Zone::tick() {
    std::lock_guard<std::mutex> lock(mutex);
    valve_timer.tick();
    const unsigned long now = clock.millis();
    if (!evaluated || now - last_evaluation >= poll_interval_millis) {
        evaluate_locked(now);
    }
}

void Zone::evaluate() {
    std::lock_guard<std::mutex> lock(mutex);
    evaluate_locked(clock.millis());
}

// caller holds the mutex
void Zone::set_state(State new_state) {
    if (new_state == state) {
        return;
    }
    get_logger().printf("Zone '%s' changing state from %s to %s.\n", name.c_str(), to_c_str(state), to_c_str(new_state));
    state = new_state;
}

// caller holds the mutex
void Zone::set_degraded(bool new_degraded, const char * reason) {
    if (new_degraded == degraded) {
        return;
    }
    if (new_degraded) {
        get_logger().printf("Zone '%s' degraded: %s.\n", name.c_str(), reason);
    } else {
        get_logger().printf("Zone '%s' recovered.\n", name.c_str());
    }
    degraded = new_degraded;
}

// caller holds the mutex
bool Zone::blocked(unsigned long now, const char * & reason) const {
    bool value;

    if (config.window_gating && door_window_sensor && door_window_sensor->get_value(value) && value) {
        reason = "window open";
        return true;
    }

    if (config.motion_gating && motion_sensor && motion_sensor->get_value(value) && !value) {
        Sensor::Sample sample;
        if (motion_sensor->get_sample(sample)
                && age_millis(now, sample.changed) >= seconds_to_millis(config.motion_timeout)) {
            reason = "no motion";
            return true;
        }
    }

    return false;
}

// caller holds the mutex
void Zone::set_valves(bool open) {
    valves_open = open;
    for (Schalter * heater : heaters) {
        heater->set_request(this, open);
    }
}

// caller holds the mutex
void Zone::evaluate_locked(unsigned long now) {
    evaluated = true;
    last_evaluation = now;

    if (manual_override.expire(now)) {
        get_logger().printf("Zone '%s' manual override expired.\n", name.c_str());
        ++revision;
    }

    const unsigned long sensor_timeout = seconds_to_millis(config.sensor_timeout);

    // outdoor temperature and automatic power switching
    outdoor_known = outdoor.resolve(now, sensor_timeout, outdoor_temperature);
    if (!outdoor_known) {
        outdoor_temperature = std::numeric_limits<double>::quiet_NaN();
    }

    auto_decision = auto_onoff.evaluate(outdoor_known, outdoor_temperature);
    if (auto_decision != AutoOnOff::Decision::none && !manual_override.is_active()) {
        const bool forced_power = (auto_decision == AutoOnOff::Decision::force_on);
        if (forced_power != power) {
            get_logger().printf("Zone '%s' auto turning %s (outdoor %.2f ºC, thresholds %.2f / %.2f ºC).\n",
                                name.c_str(), forced_power ? "on" : "off", outdoor_temperature,
                                auto_onoff.on_temp, auto_onoff.off_temp);
            power = forced_power;
            ++revision;
        }
    }

    // room temperature
    Sensor::Sample sample;
    const bool temperature_ok = temp_sensor->is_available() && temp_sensor->get_sample(sample)
                                && (!sensor_timeout || age_millis(now, sample.timestamp) < sensor_timeout);
    if (temperature_ok) {
        reading = sample.value;
    }

    if (!temperature_ok) {
        set_degraded(true, "temperature unavailable");
    } else if (!outdoor_known) {
        set_degraded(true, "outdoor temperature unavailable");
    } else {
        set_degraded(false, nullptr);
    }

    const char * reason = nullptr;
    const bool is_blocked = blocked(now, reason);
    if (is_blocked && blocked_by != reason) {
        get_logger().printf("Zone '%s' heating blocked: %s.\n", name.c_str(), reason);
    }
    blocked_by = is_blocked ? reason : "";

    // FSM inputs
    const bool warm = reading >= target + config.hysteresis_high;
    const bool cold = reading <= target - config.hysteresis_low;

    if (!power) {
        set_state(State::off);
    } else if (!temperature_ok) {
        // fail safe
        set_state(State::idle);
    } else {
        switch (state) {
            case State::heat:
                set_state((warm || is_blocked) ? State::idle : State::heat);
                break;
            default:
                set_state((cold && !is_blocked) ? State::heat : State::idle);
        }
    }

    if (state == State::heat) {
        if (valve_timer.cancel()) {
            get_logger().printf("Zone '%s' heating again, valves stay open.\n", name.c_str());
        }
        set_valves(true);
        if (central_heater) {
            central_heater->set_request(config.id, true);
        }
        return;
    }

    if (central_heater) {
        central_heater->set_request(config.id, false);
    }

    if (valves_open && central_heater && central_heater->off_pending()) {
        // the burner is still firing, keep a path for the water
        if (!valve_timer.pending()) {
            const unsigned long delay = central_heater->get_delays().off_millis;
            get_logger().printf("Zone '%s' closing valves in %lu ms.\n", name.c_str(), delay);
            valve_timer.start(delay, [this] {
                get_logger().printf("Zone '%s' closing valves.\n", name.c_str());
                set_valves(false);
            });
        }
    } else if (!valve_timer.pending()) {
        set_valves(false);
    }
}

bool Zone::uses(const std::string & entity) const {
    for (const auto & e : get_entities()) {
        if (e == entity) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Zone::get_entities() const {
    std::vector<std::string> ret;
    for (const std::string * entity : {
                &config.temp_sensor, &config.outdoor_sensor, &config.backup_outdoor_sensor, &config.weather,
                &config.humidity_sensor, &config.door_window_sensor, &config.motion_sensor,
            }) {
        if (!entity->empty()) {
            ret.push_back(*entity);
        }
    }
    return ret;
}

CommandResult Zone::set_target(double temperature) {
    std::lock_guard<std::mutex> lock(mutex);

    if (!std::isfinite(temperature) || temperature < config.min_temp || temperature > config.max_temp) {
        get_logger().printf("Zone '%s' rejected target %.2f ºC, allowed range is %.2f - %.2f ºC.\n",
                            name.c_str(), temperature, config.min_temp, config.max_temp);
        return CommandResult::invalid_temperature;
    }

    const unsigned long now = clock.millis();
    get_logger().printf("Zone '%s' target set to %.2f ºC.\n", name.c_str(), temperature);
    target = temperature;
    preset.clear();
    manual_override.set(now);
    ++revision;
    evaluate_locked(now);
    return CommandResult::ok;
}

CommandResult Zone::set_preset(const std::string & new_preset) {
    std::lock_guard<std::mutex> lock(mutex);

    double temperature;
    if (!config.presets.lookup(new_preset, temperature)) {
        get_logger().printf("Zone '%s' rejected unknown preset '%s'.\n", name.c_str(), new_preset.c_str());
        return CommandResult::invalid_preset;
    }

    const unsigned long now = clock.millis();
    get_logger().printf("Zone '%s' preset set to %s (%.2f ºC).\n", name.c_str(), new_preset.c_str(), temperature);
    target = temperature;
    preset = new_preset;
    manual_override.set(now);
    ++revision;
    evaluate_locked(now);
    return CommandResult::ok;
}

void Zone::set_power(bool on) {
    std::lock_guard<std::mutex> lock(mutex);

    const unsigned long now = clock.millis();
    get_logger().printf("Zone '%s' turned %s by user.\n", name.c_str(), on ? "on" : "off");
    power = on;
    manual_override.set(now);
    ++revision;
    evaluate_locked(now);
}

void Zone::reset_manual_override() {
    std::lock_guard<std::mutex> lock(mutex);

    get_logger().printf("Zone '%s' manual override cleared.\n", name.c_str());
    manual_override.reset();
    ++revision;
    evaluate_locked(clock.millis());
}

Zone::State Zone::get_state() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

bool Zone::get_power() const {
    std::lock_guard<std::mutex> lock(mutex);
    return power;
}

double Zone::get_target() const {
    std::lock_guard<std::mutex> lock(mutex);
    return target;
}

std::string Zone::get_preset() const {
    std::lock_guard<std::mutex> lock(mutex);
    return preset;
}

double Zone::get_reading() const {
    std::lock_guard<std::mutex> lock(mutex);
    return reading;
}

double Zone::get_humidity() const {
    if (!humidity_sensor || !humidity_sensor->is_available()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return humidity_sensor->get_reading();
}

bool Zone::is_degraded() const {
    std::lock_guard<std::mutex> lock(mutex);
    return degraded;
}

bool Zone::manual_override_active() const {
    std::lock_guard<std::mutex> lock(mutex);
    return manual_override.is_active();
}

AutoOnOff::Decision Zone::get_auto_decision() const {
    std::lock_guard<std::mutex> lock(mutex);
    return auto_decision;
}

unsigned long Zone::get_revision() const {
    std::lock_guard<std::mutex> lock(mutex);
    return revision;
}

JsonDocument Zone::get_config() const {
    return config.to_json();
}

JsonDocument Zone::get_status() const {
    std::lock_guard<std::mutex> lock(mutex);
    const unsigned long now = clock.millis();

    JsonDocument json;

    json["name"] = name;
    json["power"] = power ? "on" : "off";
    json["state"] = to_c_str(state);
    json["action"] = state == State::heat ? "heating" : "idle";
    if (std::isfinite(reading)) {
        json["reading"] = reading;
    } else {
        json["reading"] = nullptr;
    }
    json["target"] = target;
    if (preset.empty()) {
        json["preset"] = nullptr;
    } else {
        json["preset"] = preset;
    }
    json["manual_override"] = manual_override.is_active();
    if (manual_override.is_active()) {
        json["manual_override_age"] = (now - manual_override.get_since()) / 1000;
    }
    json["degraded"] = degraded;
    if (!blocked_by.empty()) {
        json["blocked"] = blocked_by;
    }
    if (valve_timer.pending()) {
        json["valves_close_in"] = valve_timer.remaining_millis() / 1000.0;
    }

    auto outdoor_json = json["outdoor"];
    if (outdoor_known) {
        outdoor_json["temperature"] = outdoor_temperature;
        const Sensor * source = outdoor.get_source();
        if (source) {
            outdoor_json["source"] = source->address;
        }
    } else {
        outdoor_json["temperature"] = nullptr;
    }

    auto auto_json = json["auto_on_off"];
    auto_json["enabled"] = auto_onoff.enabled;
    auto_json["decision"] = to_c_str(auto_decision);
    auto_json["suppressed"] = auto_decision != AutoOnOff::Decision::none && manual_override.is_active();

    auto sensors_json = json["sensors"];
    {
        Sensor::Sample sample;
        auto temperature_json = sensors_json["temperature"];
        temperature_json["state"] = to_c_str(temp_sensor->get_state());
        if (temp_sensor->get_sample(sample)) {
            temperature_json["age"] = age_millis(now, sample.timestamp) / 1000;
        }
    }
    if (humidity_sensor) {
        const double humidity = humidity_sensor->get_reading();
        if (humidity_sensor->is_available() && std::isfinite(humidity)) {
            sensors_json["humidity"] = humidity;
        } else {
            sensors_json["humidity"] = nullptr;
        }
    }
    bool value;
    if (door_window_sensor) {
        sensors_json["door_window"] = door_window_sensor->get_value(value) ? (value ? "open" : "closed") : "unknown";
    }
    if (motion_sensor) {
        sensors_json["motion"] = motion_sensor->get_value(value) ? (value ? "detected" : "clear") : "unknown";
    }

    for (const Schalter * heater : heaters) {
        json["heaters"][heater->name] = to_c_str(heater->get_state());
    }

    if (central_heater) {
        auto central_json = json["central_heater"];
        central_json["name"] = central_heater->name;
        central_json["state"] = central_heater->is_active() ? "on" : "off";
    }

    return json;
}

JsonDocument Zone::get_runtime_state() const {
    std::lock_guard<std::mutex> lock(mutex);

    JsonDocument json;
    json["power"] = power;
    json["target"] = target;
    if (preset.empty()) {
        json["preset"] = nullptr;
    } else {
        json["preset"] = preset;
    }
    json["manual_override"] = manual_override.is_active();
    if (manual_override.is_active()) {
        json["manual_override_age"] = (clock.millis() - manual_override.get_since()) / 1000.0;
    }
    return json;
}

void Zone::restore_runtime_state(const JsonVariantConst & json) {
    std::lock_guard<std::mutex> lock(mutex);

    if (json["power"].is<bool>()) {
        power = json["power"].as<bool>();
    }

    const JsonVariantConst target_json = json["target"];
    if (target_json.is<double>()) {
        const double value = target_json.as<double>();
        if (std::isfinite(value) && value >= config.min_temp && value <= config.max_temp) {
            target = value;
            preset.clear();
        } else {
            get_logger().printf("Zone '%s' ignoring stored target %.2f ºC.\n", name.c_str(), value);
        }
    }

    const JsonVariantConst preset_json = json["preset"];
    if (preset_json.is<const char *>()) {
        double value;
        const std::string stored = preset_json.as<const char *>();
        if (config.presets.lookup(stored, value)) {
            preset = stored;
            target = value;
        }
    }

    if (json["manual_override"] | false) {
        // keep counting towards the timeout across restarts
        const double age = json["manual_override_age"] | 0.0;
        manual_override.set(clock.millis() - (age > 0 ? seconds_to_millis(age) : 0));
    } else {
        manual_override.reset();
    }

    get_logger().printf("Zone '%s' restored: power %s, target %.2f ºC, preset %s, manual override %s.\n",
                        name.c_str(), power ? "on" : "off", target, preset.empty() ? "none" : preset.c_str(),
                        manual_override.is_active() ? "yes" : "no");
}
