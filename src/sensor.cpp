#include <cmath>
#include <cstdlib>
#include <initializer_list>

#include "clock.h"
#include "logger.h"
#include "sensor.h"

bool parse_number(const std::string & payload, double & value) {
    if (payload.empty()) {
        return false;
    }
    char * end = nullptr;
    const double result = strtod(payload.c_str(), &end);
    if (end == payload.c_str()) {
        return false;
    }
    // allow trailing whitespace only
    while (end && (*end == ' ' || *end == '\n' || *end == '\r' || *end == '\t')) {
        ++end;
    }
    if (!end || *end != '\0' || !std::isfinite(result)) {
        return false;
    }
    value = result;
    return true;
}

const char * to_c_str(const AbstractSensor::State & s) {
    switch (s) {
        case AbstractSensor::State::init:
            return "init";
        case AbstractSensor::State::ok:
            return "ok";
        default:
            return "error";
    }
}

AbstractSensor::State AbstractSensor::get_state() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

// caller holds the mutex
void AbstractSensor::set_state(State new_state) {
    if (state == new_state) {
        return;
    }
    get_logger().printf("Sensor %s changing state from %s to %s.\n", str().c_str(), to_c_str(state), to_c_str(new_state));
    state = new_state;
}

Sensor::Sensor(const std::string & address)
    : address(address), updated(false), last_update(0), valid(false) {
    sample.value = std::numeric_limits<double>::quiet_NaN();
    sample.timestamp = 0;
    sample.changed = 0;
}

bool Sensor::update(const std::string & payload, unsigned long timestamp) {
    std::lock_guard<std::mutex> lock(mutex);

    if (updated && static_cast<long>(timestamp - last_update) < 0) {
        get_logger().printf("Discarding out of order sample for sensor %s: %s\n", address.c_str(), payload.c_str());
        return false;
    }

    updated = true;
    last_update = timestamp;

    double value;
    if (payload == "unavailable" || payload == "unknown" || !parse(payload, value)) {
        set_state(State::error);
        return true;
    }

    if (!valid || value != sample.value) {
        sample.changed = timestamp;
    }
    sample.value = value;
    sample.timestamp = timestamp;
    valid = true;
    set_state(State::ok);
    return true;
}

bool Sensor::parse(const std::string & payload, double & value) const {
    return parse_number(payload, value);
}

double Sensor::get_reading() const {
    std::lock_guard<std::mutex> lock(mutex);
    return valid ? sample.value : std::numeric_limits<double>::quiet_NaN();
}

bool Sensor::get_sample(Sample & sample) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!valid) {
        return false;
    }
    sample = this->sample;
    return true;
}

JsonDocument Sensor::get_config() const {
    JsonDocument json;
    json.set(address);
    return json;
}

bool BinarySensor::parse(const std::string & payload, double & value) const {
    if (payload == "on" || payload == "ON" || payload == "open" || payload == "true" || payload == "1") {
        value = 1;
        return true;
    }
    if (payload == "off" || payload == "OFF" || payload == "closed" || payload == "false" || payload == "0") {
        value = 0;
        return true;
    }
    return false;
}

bool BinarySensor::get_value(bool & value) const {
    if (!is_available()) {
        return false;
    }
    Sample sample;
    if (!get_sample(sample)) {
        return false;
    }
    value = sample.value != 0;
    return true;
}

bool WeatherSensor::parse(const std::string & payload, double & value) const {
    if (parse_number(payload, value)) {
        return true;
    }

    JsonDocument doc;
    if (deserializeJson(doc, payload)) {
        return false;
    }

    JsonObjectConst attributes = doc.as<JsonObjectConst>();
    for (const char * key : {"temperature", "current_temperature", "forecast_temperature"}) {
        JsonVariantConst attribute = attributes[key];
        if (attribute.is<double>() && std::isfinite(attribute.as<double>())) {
            value = attribute.as<double>();
            return true;
        }
    }

    return false;
}

SensorChain::SensorChain(const std::list<Sensor *> sensors)
    : sensors(sensors), source(nullptr), reading(std::numeric_limits<double>::quiet_NaN()) {
}

bool SensorChain::resolve(unsigned long now, unsigned long max_age_millis, double & value) {
    std::lock_guard<std::mutex> lock(mutex);

    for (Sensor * sensor : sensors) {
        Sensor::Sample sample;
        if (!sensor->is_available() || !sensor->get_sample(sample)) {
            continue;
        }
        if (max_age_millis && (age_millis(now, sample.timestamp) >= max_age_millis)) {
            continue;
        }
        if (source != sensor) {
            get_logger().printf("Sensor chain %s now using %s.\n", str().c_str(), sensor->str().c_str());
        }
        source = sensor;
        reading = sample.value;
        value = reading;
        set_state(State::ok);
        return true;
    }

    source = nullptr;
    reading = std::numeric_limits<double>::quiet_NaN();
    set_state(State::error);
    return false;
}

double SensorChain::get_reading() const {
    std::lock_guard<std::mutex> lock(mutex);
    return reading;
}

const Sensor * SensorChain::get_source() const {
    std::lock_guard<std::mutex> lock(mutex);
    return source;
}

std::string SensorChain::str() const {
    std::string ret;
    bool first = true;
    for (Sensor * sensor : sensors) {
        if (first) {
            ret = sensor->str();
            first = false;
        } else {
            ret = ret + ", " + sensor->str();
        }
    };
    return "[" + ret + "]";
}

JsonDocument SensorChain::get_config() const {
    JsonDocument json;
    unsigned int idx = 0;
    for (Sensor * sensor : sensors) {
        json[idx++] = sensor->get_config();
    }
    return json;
}

Sensor * SensorRegistry::get(const std::string & address, Kind kind) {
    std::lock_guard<std::mutex> lock(mutex);

    const char * expected = kind == Kind::binary ? "binary_sensor" : (kind == Kind::weather ? "weather" : "sensor");

    auto it = sensors.find(address);
    if (it != sensors.end()) {
        Sensor * sensor = it->second.get();
        return std::string(sensor->kind()) == expected ? sensor : nullptr;
    }

    Sensor * sensor;
    switch (kind) {
        case Kind::binary:
            sensor = new BinarySensor(address);
            break;
        case Kind::weather:
            sensor = new WeatherSensor(address);
            break;
        default:
            sensor = new Sensor(address);
    }
    sensors[address].reset(sensor);
    return sensor;
}

Sensor * SensorRegistry::find(const std::string & address) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = sensors.find(address);
    return it == sensors.end() ? nullptr : it->second.get();
}

bool SensorRegistry::update(const std::string & address, const std::string & payload, unsigned long timestamp) {
    Sensor * sensor = find(address);
    if (!sensor) {
        return false;
    }
    return sensor->update(payload, timestamp);
}

std::vector<std::string> SensorRegistry::addresses() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ret;
    for (const auto & kv : sensors) {
        ret.push_back(kv.first);
    }
    return ret;
}
