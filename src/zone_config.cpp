#include <cmath>

#include "zone_config.h"

namespace {

std::string get_string(const JsonVariantConst & json) {
    return json.is<const char *>() ? std::string(json.as<const char *>()) : std::string();
}

bool get_number(const JsonVariantConst & json, const char * key, double fallback, double & value, std::string & error) {
    const JsonVariantConst field = json[key];
    if (field.isNull()) {
        value = fallback;
        return true;
    }
    if (!field.is<double>() || !std::isfinite(field.as<double>())) {
        error = std::string("field '") + key + "' must be a number";
        return false;
    }
    value = field.as<double>();
    return true;
}

bool get_non_negative(const JsonVariantConst & json, const char * key, double fallback, double & value, std::string & error) {
    if (!get_number(json, key, fallback, value, error)) {
        return false;
    }
    if (value < 0) {
        error = std::string("field '") + key + "' must not be negative";
        return false;
    }
    return true;
}

}

bool ZoneConfig::parse(const std::string & id, const JsonVariantConst & json, ZoneConfig & config, std::string & error) {
    ZoneConfig ret;

    if (id.empty()) {
        error = "zone id must not be empty";
        return false;
    }

    if (!json.is<JsonObjectConst>()) {
        error = "zone " + id + ": configuration must be an object";
        return false;
    }

    ret.id = id;
    ret.name = get_string(json["name"]);
    if (ret.name.empty()) {
        ret.name = id;
    }

    const JsonVariantConst heater = json["heater"];
    if (heater.is<JsonArrayConst>()) {
        for (JsonVariantConst element : heater.as<JsonArrayConst>()) {
            const std::string name = get_string(element);
            if (!name.empty()) {
                ret.heaters.push_back(name);
            }
        }
    } else {
        const std::string name = get_string(heater);
        if (!name.empty()) {
            ret.heaters.push_back(name);
        }
    }

    ret.central_heater = get_string(json["central_heater"]);
    ret.temp_sensor = get_string(json["temp_sensor"]);
    ret.outdoor_sensor = get_string(json["outdoor_sensor"]);
    ret.backup_outdoor_sensor = get_string(json["backup_outdoor_sensor"]);
    ret.weather = get_string(json["weather"]);
    ret.humidity_sensor = get_string(json["humidity_sensor"]);
    ret.door_window_sensor = get_string(json["door_window_sensor"]);
    ret.motion_sensor = get_string(json["motion_sensor"]);

    if (ret.heaters.empty()) {
        error = "zone " + id + ": missing heater";
        return false;
    }
    if (ret.temp_sensor.empty()) {
        error = "zone " + id + ": missing temp_sensor";
        return false;
    }
    if (ret.outdoor_sensor.empty()) {
        error = "zone " + id + ": missing outdoor_sensor";
        return false;
    }
    for (const auto & name : ret.heaters) {
        if (name == ret.central_heater) {
            error = "zone " + id + ": heater " + name + " is also the central heater";
            return false;
        }
    }

    const JsonVariantConst presets = json["presets"];
    const JsonVariantConst auto_on_off = json["auto_on_off"];

    if (!get_number(json, "min_temp", 5.0, ret.min_temp, error)
            || !get_number(json, "max_temp", 30.0, ret.max_temp, error)
            || !get_non_negative(json, "hysteresis_low", 0.3, ret.hysteresis_low, error)
            || !get_non_negative(json, "hysteresis_high", 0.3, ret.hysteresis_high, error)
            || !get_number(presets, "home", 23.0, ret.presets.home, error)
            || !get_number(presets, "sleep", 21.0, ret.presets.sleep, error)
            || !get_number(presets, "away", 18.0, ret.presets.away, error)
            || !get_number(auto_on_off, "on_temp", 10.0, ret.auto_on_temp, error)
            || !get_number(auto_on_off, "off_temp", 18.0, ret.auto_off_temp, error)
            || !get_non_negative(json, "central_heater_on_delay", 0, ret.on_delay, error)
            || !get_non_negative(json, "central_heater_off_delay", 0, ret.off_delay, error)
            || !get_non_negative(json, "sensor_timeout", 600, ret.sensor_timeout, error)
            || !get_non_negative(json, "motion_timeout", 1800, ret.motion_timeout, error)
            || !get_non_negative(json, "manual_override_timeout", 0, ret.manual_override_timeout, error)) {
        error = "zone " + id + ": " + error;
        return false;
    }

    ret.auto_on_off = auto_on_off["enabled"] | false;
    ret.window_gating = json["window_gating"] | true;
    ret.motion_gating = json["motion_gating"] | false;

    if (ret.min_temp >= ret.max_temp) {
        error = "zone " + id + ": min_temp must be lower than max_temp";
        return false;
    }

    for (const char * preset : Presets::names) {
        double temperature = 0;
        ret.presets.lookup(preset, temperature);
        if (temperature < ret.min_temp || temperature > ret.max_temp) {
            error = "zone " + id + ": preset " + preset + " outside of allowed range";
            return false;
        }
    }

    if (ret.auto_on_off && ret.auto_on_temp >= ret.auto_off_temp) {
        error = "zone " + id + ": auto on temperature must be lower than auto off temperature";
        return false;
    }

    config = ret;
    return true;
}

JsonDocument ZoneConfig::to_json() const {
    JsonDocument json;

    json["name"] = name;
    if (heaters.size() == 1) {
        json["heater"] = heaters.front();
    } else {
        for (const auto & heater : heaters) {
            json["heater"].add(heater);
        }
    }

    const struct {
        const char * key;
        const std::string & value;
    } entities[] = {
        {"central_heater", central_heater},
        {"temp_sensor", temp_sensor},
        {"outdoor_sensor", outdoor_sensor},
        {"backup_outdoor_sensor", backup_outdoor_sensor},
        {"weather", weather},
        {"humidity_sensor", humidity_sensor},
        {"door_window_sensor", door_window_sensor},
        {"motion_sensor", motion_sensor},
    };

    for (const auto & entity : entities) {
        if (!entity.value.empty()) {
            json[entity.key] = entity.value;
        }
    }

    json["presets"] = presets.get_config();
    json["min_temp"] = min_temp;
    json["max_temp"] = max_temp;
    json["hysteresis_low"] = hysteresis_low;
    json["hysteresis_high"] = hysteresis_high;

    auto auto_json = json["auto_on_off"];
    auto_json["enabled"] = auto_on_off;
    auto_json["on_temp"] = auto_on_temp;
    auto_json["off_temp"] = auto_off_temp;

    json["central_heater_on_delay"] = on_delay;
    json["central_heater_off_delay"] = off_delay;
    json["sensor_timeout"] = sensor_timeout;
    json["window_gating"] = window_gating;
    json["motion_gating"] = motion_gating;
    json["motion_timeout"] = motion_timeout;
    json["manual_override_timeout"] = manual_override_timeout;

    return json;
}
