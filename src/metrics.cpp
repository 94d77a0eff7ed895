#include <cmath>

#include "heating.h"
#include "metrics.h"

PicoPrometheus::Registry prometheus;

void register_metrics(Heating & heating) {
    static PicoPrometheus::Gauge zone_state(prometheus, "zone_state", "Zone state enum");
    static PicoPrometheus::Gauge zone_power(prometheus, "zone_power", "Zone power flag");
    static PicoPrometheus::Gauge zone_temperature_target(prometheus, "zone_temperature_target",
            "Zone's target temperature");
    static PicoPrometheus::Gauge zone_temperature_reading(prometheus, "zone_temperature_reading",
            "Zone's current temperature");
    static PicoPrometheus::Gauge zone_manual_override(prometheus, "zone_manual_override", "Zone manual override flag");
    static PicoPrometheus::Gauge zone_degraded(prometheus, "zone_degraded", "Zone degraded flag");
    static PicoPrometheus::Gauge central_heater_state(prometheus, "central_heater_state", "Central heater state");
    static PicoPrometheus::Gauge central_heater_demand(prometheus, "central_heater_demand",
            "Number of zones requesting heat from the central heater");

    for (const auto & zone : heating.get_zones()) {
        const PicoPrometheus::Labels labels = {{"zone", zone->config.id.c_str()}};
        zone_state[labels].bind([zone] {
            return static_cast<int>(zone->get_state());
        });
        zone_power[labels].bind([zone] {
            return zone->get_power() ? 1 : 0;
        });
        zone_temperature_target[labels].bind([zone] {
            return zone->get_target();
        });
        zone_temperature_reading[labels].bind([zone] {
            return zone->get_reading();
        });
        zone_manual_override[labels].bind([zone] {
            return zone->manual_override_active() ? 1 : 0;
        });
        zone_degraded[labels].bind([zone] {
            return zone->is_degraded() ? 1 : 0;
        });
    }

    for (const auto & central_heater : heating.get_central_heaters()) {
        const PicoPrometheus::Labels labels = {{"central_heater", central_heater->name.c_str()}};
        central_heater_state[labels].bind([central_heater] {
            return central_heater->is_active() ? 1 : 0;
        });
        central_heater_demand[labels].bind([central_heater] {
            return central_heater->get_demand().size();
        });
    }
}
