#pragma once

#include <PicoPrometheus.h>

class Heating;

extern PicoPrometheus::Registry prometheus;

// Binds zone and central heater gauges to the engine's getters.
void register_metrics(Heating & heating);
