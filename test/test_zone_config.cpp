#include <catch2/catch.hpp>

#include "helpers.h"
#include "zone_config.h"

namespace {

bool parse(const std::string & text, ZoneConfig & config, std::string & error) {
    const JsonDocument json = parse_json(text);
    return ZoneConfig::parse("living", json.as<JsonVariantConst>(), config, error);
}

}

TEST_CASE("Zone config defaults", "[zone_config]") {
    ZoneConfig config;
    std::string error;

    REQUIRE(parse(R"({"heater": "valve_living", "temp_sensor": "sensor.living", "outdoor_sensor": "sensor.outdoor"})",
                  config, error));

    REQUIRE(config.id == "living");
    REQUIRE(config.name == "living");
    REQUIRE(config.heaters == std::vector<std::string>({"valve_living"}));
    REQUIRE(config.central_heater.empty());
    REQUIRE(config.presets.home == Approx(23));
    REQUIRE(config.presets.sleep == Approx(21));
    REQUIRE(config.presets.away == Approx(18));
    REQUIRE(config.min_temp == Approx(5));
    REQUIRE(config.max_temp == Approx(30));
    REQUIRE(config.hysteresis_low == Approx(0.3));
    REQUIRE(config.hysteresis_high == Approx(0.3));
    REQUIRE_FALSE(config.auto_on_off);
    REQUIRE(config.auto_on_temp == Approx(10));
    REQUIRE(config.auto_off_temp == Approx(18));
    REQUIRE(config.on_delay == 0);
    REQUIRE(config.off_delay == 0);
    REQUIRE(config.sensor_timeout == Approx(600));
    REQUIRE(config.window_gating);
    REQUIRE_FALSE(config.motion_gating);
    REQUIRE(config.motion_timeout == Approx(1800));
    REQUIRE(config.manual_override_timeout == 0);
}

TEST_CASE("Zone config with all fields", "[zone_config]") {
    ZoneConfig config;
    std::string error;

    REQUIRE(parse(R"({
        "name": "Living room",
        "heater": ["valve_1", "valve_2"],
        "central_heater": "boiler",
        "temp_sensor": "sensor.living",
        "outdoor_sensor": "sensor.outdoor",
        "backup_outdoor_sensor": "sensor.outdoor_2",
        "weather": "weather.home",
        "humidity_sensor": "sensor.living_humidity",
        "door_window_sensor": "binary_sensor.living_window",
        "motion_sensor": "binary_sensor.living_motion",
        "presets": {"home": 21, "sleep": 19.5, "away": 16},
        "min_temp": 7,
        "max_temp": 25,
        "hysteresis_low": 0.5,
        "hysteresis_high": 0.2,
        "auto_on_off": {"enabled": true, "on_temp": 12, "off_temp": 16},
        "central_heater_on_delay": 30,
        "central_heater_off_delay": 60,
        "sensor_timeout": 300,
        "window_gating": false,
        "motion_gating": true,
        "motion_timeout": 900,
        "manual_override_timeout": 7200
    })", config, error));

    REQUIRE(config.name == "Living room");
    REQUIRE(config.heaters == std::vector<std::string>({"valve_1", "valve_2"}));
    REQUIRE(config.central_heater == "boiler");
    REQUIRE(config.weather == "weather.home");
    REQUIRE(config.presets.sleep == Approx(19.5));
    REQUIRE(config.auto_on_off);
    REQUIRE(config.auto_on_temp == Approx(12));
    REQUIRE(config.on_delay == Approx(30));
    REQUIRE(config.off_delay == Approx(60));
    REQUIRE_FALSE(config.window_gating);
    REQUIRE(config.motion_gating);
    REQUIRE(config.manual_override_timeout == Approx(7200));

    SECTION("serialized config parses back") {
        const JsonDocument json = config.to_json();
        ZoneConfig copy;
        REQUIRE(ZoneConfig::parse("living", json.as<JsonVariantConst>(), copy, error));
        REQUIRE(copy.heaters == config.heaters);
        REQUIRE(copy.motion_sensor == config.motion_sensor);
        REQUIRE(copy.hysteresis_low == Approx(config.hysteresis_low));
        REQUIRE(copy.auto_off_temp == Approx(config.auto_off_temp));
    }
}

TEST_CASE("Invalid zone configs are rejected", "[zone_config]") {
    ZoneConfig config;
    std::string error;

    const char * const required = R"("heater": "valve", "temp_sensor": "sensor.t", "outdoor_sensor": "sensor.o")";

    SECTION("missing heater") {
        REQUIRE_FALSE(parse(R"({"temp_sensor": "sensor.t", "outdoor_sensor": "sensor.o"})", config, error));
        REQUIRE(error.find("heater") != std::string::npos);
    }

    SECTION("missing temperature sensor") {
        REQUIRE_FALSE(parse(R"({"heater": "valve", "outdoor_sensor": "sensor.o"})", config, error));
        REQUIRE(error.find("temp_sensor") != std::string::npos);
    }

    SECTION("missing outdoor sensor") {
        REQUIRE_FALSE(parse(R"({"heater": "valve", "temp_sensor": "sensor.t"})", config, error));
        REQUIRE(error.find("outdoor_sensor") != std::string::npos);
    }

    SECTION("not an object") {
        REQUIRE_FALSE(parse(R"("valve")", config, error));
    }

    SECTION("heater is the central heater") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "central_heater": "valve"})", config, error));
    }

    SECTION("min not below max") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "min_temp": 25, "max_temp": 25})", config, error));
    }

    SECTION("preset out of range") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "presets": {"home": 35}})", config, error));
        REQUIRE(error.find("home") != std::string::npos);
    }

    SECTION("non numeric field") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "hysteresis_low": "low"})", config, error));
        REQUIRE(error.find("hysteresis_low") != std::string::npos);
    }

    SECTION("negative delay") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "central_heater_off_delay": -5})", config, error));
    }

    SECTION("auto on above auto off") {
        REQUIRE_FALSE(parse(std::string("{") + required + R"(, "auto_on_off": {"enabled": true, "on_temp": 18, "off_temp": 10}})",
                            config, error));
    }

    SECTION("auto thresholds are not checked when disabled") {
        REQUIRE(parse(std::string("{") + required + R"(, "auto_on_off": {"enabled": false, "on_temp": 18, "off_temp": 10}})",
                      config, error));
    }
}
