#include "auto_onoff.h"

const char * to_c_str(const AutoOnOff::Decision & d) {
    switch (d) {
        case AutoOnOff::Decision::force_on:
            return "on";
        case AutoOnOff::Decision::force_off:
            return "off";
        default:
            return "none";
    }
}

AutoOnOff::Decision AutoOnOff::evaluate(bool outdoor_known, double outdoor) const {
    // never force anything based on missing data
    if (!enabled || !outdoor_known) {
        return Decision::none;
    }

    if (outdoor > off_temp) {
        return Decision::force_off;
    }

    if (outdoor < on_temp) {
        return Decision::force_on;
    }

    return Decision::none;
}
