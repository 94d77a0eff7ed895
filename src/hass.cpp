#include <cmath>
#include <list>
#include <memory>
#include <vector>

#include <Arduino.h>
#include <WiFi.h>
#include <PicoMQTT.h>
#include <PicoUtils.h>
#include <ArduinoJson.h>

#include "hass.h"
#include "heating.h"
#include "logger.h"
#include "presets.h"
#include "sensor.h"

extern bool healthy;

namespace {

const String board_id = String((uint32_t)(ESP.getEfuseMac() >> 24), HEX);
const String board_unique_id = "tepor-" + board_id;

std::list<PicoUtils::WatchInterface *> watches;

String topic_base(const Zone & zone) {
    return "tepor/" + board_id + "/" + zone.config.id.c_str();
}

void publish_json(const String & topic, const JsonDocument & json) {
    auto publish = HomeAssistant::mqtt.begin_publish(topic, measureJson(json), 0, true);
    serializeJson(json, publish);
    publish.send();
}

void report(const Zone & zone, const char * command, CommandResult result) {
    if (result != CommandResult::ok) {
        get_logger().printf("Zone '%s' rejected %s command: %s\n", zone.name.c_str(), command, to_c_str(result));
    }
}

void autodiscovery(Heating & heating) {
    if (HomeAssistant::autodiscovery_topic.length() == 0) {
        get_logger().println("Home Assistant autodiscovery disabled.");
        return;
    }

    get_logger().println("Sending Home Assistant autodiscovery messages...");

    for (const auto & zone_ptr : heating.get_zones()) {
        const auto & zone = *zone_ptr;
        const String unique_id = board_unique_id + "-" + zone.config.id.c_str();
        const String base = topic_base(zone);

        {
            JsonDocument json;

            json["unique_id"] = unique_id;
            json["name"] = nullptr;
            json["availability_topic"] = HomeAssistant::mqtt.will.topic;

            json["temperature_unit"] = "C";
            json["min_temp"] = zone.config.min_temp;
            json["max_temp"] = zone.config.max_temp;
            json["temp_step"] = 0.1;

            json["current_temperature_topic"] = base + "/current_temperature";
            json["temperature_command_topic"] = base + "/target/set";
            json["temperature_state_topic"] = base + "/target";
            json["action_topic"] = base + "/action";
            json["mode_state_topic"] = base + "/mode";
            json["mode_command_topic"] = base + "/mode/set";
            json["modes"][0] = "heat";
            json["modes"][1] = "off";
            json["preset_mode_state_topic"] = base + "/preset";
            json["preset_mode_command_topic"] = base + "/preset/set";
            for (const char * preset : Presets::names) {
                json["preset_modes"].add(preset);
            }
            if (!zone.config.humidity_sensor.empty()) {
                json["current_humidity_topic"] = base + "/humidity";
            }
            json["retain"] = true;

            auto device = json["device"];
            device["name"] = zone.name;
            device["suggested_area"] = zone.name;
            device["identifiers"][0] = unique_id;
            device["via_device"] = board_unique_id;

            publish_json(HomeAssistant::autodiscovery_topic + "/climate/" + unique_id + "/config", json);
        }

        {
            JsonDocument json;
            json["unique_id"] = unique_id + "-reset";
            json["name"] = "Reset manual override";
            json["icon"] = "mdi:restore";
            json["availability_topic"] = HomeAssistant::mqtt.will.topic;
            json["command_topic"] = base + "/reset/set";

            auto device = json["device"];
            device["identifiers"][0] = unique_id;

            publish_json(HomeAssistant::autodiscovery_topic + "/button/" + unique_id + "-reset/config", json);
        }
    }

    struct BinarySensor {
        String name;
        String friendly_name;
        const char * device_class;
        const char * icon;
    };

    std::vector<BinarySensor> binary_sensors = {
        {"problem", "Healthcheck", "problem", nullptr},
    };

    for (const auto & central_heater : heating.get_central_heaters()) {
        binary_sensors.push_back({
            String("central_heater_") + central_heater->name.c_str(),
            central_heater->name.c_str(),
            "power",
            "mdi:fire"});
    }

    for (const auto & binary_sensor : binary_sensors) {
        const auto unique_id = board_unique_id + "-" + binary_sensor.name;
        JsonDocument json;
        json["unique_id"] = unique_id;
        json["object_id"] = "tepor_" + binary_sensor.name;
        json["name"] = binary_sensor.friendly_name;
        json["device_class"] = binary_sensor.device_class;
        json["entity_category"] = "diagnostic";
        json["availability_topic"] = HomeAssistant::mqtt.will.topic;
        json["state_topic"] = "tepor/" + board_id + "/" + binary_sensor.name;
        if (binary_sensor.icon) {
            json["icon"] = binary_sensor.icon;
        }

        auto device = json["device"];
        device["name"] = "Tepor";
        device["identifiers"][0] = board_unique_id;
        device["configuration_url"] = "http://" + WiFi.localIP().toString();
        device["manufacturer"] = "tepor";
        device["model"] = "Tepor";
        device["sw_version"] = __DATE__ " " __TIME__;

        publish_json(HomeAssistant::autodiscovery_topic + "/binary_sensor/" + unique_id + "/config", json);
    }
}

String format_reading(double value) {
    return std::isnan(value) ? String("None") : String(value);
}

void bind_zone(const std::shared_ptr<Zone> & zone_ptr) {
    using HomeAssistant::mqtt;
    const String base = topic_base(*zone_ptr);

    mqtt.subscribe(base + "/target/set", [zone_ptr](String payload) {
        double value;
        if (!parse_number(payload.c_str(), value)) {
            value = NAN;
        }
        report(*zone_ptr, "target", zone_ptr->set_target(value));
    });

    mqtt.subscribe(base + "/mode/set", [zone_ptr](String payload) {
        if (payload == "heat") {
            zone_ptr->set_power(true);
        } else if (payload == "off") {
            zone_ptr->set_power(false);
        }
    });

    mqtt.subscribe(base + "/preset/set", [zone_ptr](String payload) {
        report(*zone_ptr, "preset", zone_ptr->set_preset(payload.c_str()));
    });

    mqtt.subscribe(base + "/reset/set", [zone_ptr](String payload) {
        zone_ptr->reset_manual_override();
    });

    watches.push_back(
        new PicoUtils::Watch<String>(
            [zone_ptr] { return format_reading(zone_ptr->get_reading()); },
    [base](const String & reading) {
        mqtt.publish(base + "/current_temperature", reading, 0, true);
    }));

    if (!zone_ptr->config.humidity_sensor.empty()) {
        watches.push_back(
            new PicoUtils::Watch<String>(
                [zone_ptr] { return format_reading(zone_ptr->get_humidity()); },
        [base](const String & humidity) {
            mqtt.publish(base + "/humidity", humidity, 0, true);
        }));
    }

    watches.push_back(
        new PicoUtils::Watch<double>(
            [zone_ptr] { return zone_ptr->get_target(); },
    [base](double target) {
        mqtt.publish(base + "/target", String(target), 0, true);
    }));

    watches.push_back(
        new PicoUtils::Watch<std::string>(
            [zone_ptr] { return zone_ptr->get_preset(); },
    [base](const std::string & preset) {
        mqtt.publish(base + "/preset", preset.empty() ? "None" : preset.c_str(), 0, true);
    }));

    watches.push_back(
        new PicoUtils::Watch<bool>(
            [zone_ptr] { return zone_ptr->heat(); },
    [base](bool heat) {
        mqtt.publish(base + "/action", heat ? "heating" : "idle", 0, true);
    }));

    watches.push_back(
        new PicoUtils::Watch<bool>(
            [zone_ptr] { return zone_ptr->get_power(); },
    [base](bool power) {
        mqtt.publish(base + "/mode", power ? "heat" : "off", 0, true);
    }));
}

}

namespace HomeAssistant {

PicoMQTT::Client mqtt;
String autodiscovery_topic = "homeassistant";

void init(Heating & heating) {
    mqtt.client_id = board_unique_id;
    mqtt.will.topic = "tepor/" + board_id + "/availability";
    mqtt.will.payload = "offline";
    mqtt.will.retain = true;

    mqtt.connected_callback = [&heating] {
        // send autodiscovery messages
        autodiscovery(heating);

        // notify about the current state
        for (auto & watch : watches) { watch->fire(); }

        // notify about availability
        mqtt.publish(mqtt.will.topic, "online", 0, true);
    };

    for (auto & zone : heating.get_zones()) {
        bind_zone(zone);
    }

    for (auto & central_heater : heating.get_central_heaters()) {
        const String topic = "tepor/" + board_id + "/central_heater_" + central_heater->name.c_str();
        watches.push_back(
            new PicoUtils::Watch<bool>(
                [central_heater] { return central_heater->is_active(); },
        [topic](bool active) {
            mqtt.publish(topic, active ? "ON" : "OFF", 0, true);
        }));
    }

    watches.push_back(
        new PicoUtils::Watch<bool>(
            [] { return healthy; },
    [](const bool healthy) {
        mqtt.publish("tepor/" + board_id + "/problem",
                     !healthy ? "ON" : "OFF",
                     0, true);
    }
        ));
}

void tick() {
    mqtt.loop();
    for (auto & watch : watches) { watch->tick(); }
}

bool healthcheck() {
    return !mqtt.host.length() || !mqtt.port || mqtt.connected();
}

}
