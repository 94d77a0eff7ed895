#pragma once

#include <string>

#include <ArduinoJson.h>

struct Presets {
    double home;
    double sleep;
    double away;

    // Returns false for unknown preset names.
    bool lookup(const std::string & name, double & temperature) const;

    JsonDocument get_config() const;

    static const char * const names[3];
};
