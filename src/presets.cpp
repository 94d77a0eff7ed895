#include "presets.h"

const char * const Presets::names[3] = {"home", "sleep", "away"};

bool Presets::lookup(const std::string & name, double & temperature) const {
    if (name == "home") {
        temperature = home;
    } else if (name == "sleep") {
        temperature = sleep;
    } else if (name == "away") {
        temperature = away;
    } else {
        return false;
    }
    return true;
}

JsonDocument Presets::get_config() const {
    JsonDocument json;
    json["home"] = home;
    json["sleep"] = sleep;
    json["away"] = away;
    return json;
}
