#pragma once

#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "presets.h"

struct ZoneConfig {
    std::string id;
    std::string name;

    std::vector<std::string> heaters;
    std::string central_heater;

    std::string temp_sensor;
    std::string outdoor_sensor;
    std::string backup_outdoor_sensor;
    std::string weather;
    std::string humidity_sensor;
    std::string door_window_sensor;
    std::string motion_sensor;

    Presets presets;
    double min_temp;
    double max_temp;
    double hysteresis_low;
    double hysteresis_high;

    bool auto_on_off;
    double auto_on_temp;
    double auto_off_temp;

    double on_delay;
    double off_delay;

    double sensor_timeout;
    bool window_gating;
    bool motion_gating;
    double motion_timeout;
    double manual_override_timeout;

    // Fills in the config from JSON.  On failure returns false and describes
    // the problem in error.
    static bool parse(const std::string & id, const JsonVariantConst & json, ZoneConfig & config, std::string & error);

    JsonDocument to_json() const;
};
