#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "auto_onoff.h"
#include "clock.h"
#include "manual_override.h"
#include "sensor.h"
#include "timer.h"
#include "zone_config.h"

class CentralHeater;
class CentralHeaterRegistry;
class Schalter;
class SchalterRegistry;

enum class CommandResult {
    ok = 0,
    unknown_zone = 1,
    invalid_preset = 2,
    invalid_temperature = 3,
};

const char * to_c_str(const CommandResult & r);

class Zone {
    public:
        enum class State {
            off = 0,
            idle = 1,
            heat = 2,
        };

        // Sensors must already exist in the registry with matching kinds.
        Zone(const ZoneConfig & config, const Clock & clock, unsigned long poll_interval_millis,
             SensorRegistry & sensors, SchalterRegistry & schalters, CentralHeaterRegistry & central_heaters);
        ~Zone();
        Zone(const Zone &) = delete;
        Zone & operator=(const Zone &) = delete;

        // Evaluates the zone if the poll interval elapsed.
        void tick();
        void evaluate();

        bool uses(const std::string & entity) const;
        std::vector<std::string> get_entities() const;

        CommandResult set_target(double temperature);
        CommandResult set_preset(const std::string & preset);
        void set_power(bool on);
        void reset_manual_override();

        State get_state() const;
        bool heat() const { return get_state() == State::heat; }
        bool get_power() const;
        double get_target() const;
        std::string get_preset() const;
        double get_reading() const;
        // NaN without a humidity sensor or a current sample
        double get_humidity() const;
        bool is_degraded() const;
        bool manual_override_active() const;
        AutoOnOff::Decision get_auto_decision() const;

        // Incremented on every change which should be persisted.
        unsigned long get_revision() const;

        JsonDocument get_config() const;
        JsonDocument get_status() const;

        JsonDocument get_runtime_state() const;
        void restore_runtime_state(const JsonVariantConst & json);

        bool healthcheck() const { return !is_degraded(); }

        const ZoneConfig config;
        const std::string & name;

    private:
        void evaluate_locked(unsigned long now);
        void set_state(State new_state);
        void set_degraded(bool new_degraded, const char * reason);
        bool blocked(unsigned long now, const char * & reason) const;
        void set_valves(bool open);

        mutable std::mutex mutex;
        const Clock & clock;
        const unsigned long poll_interval_millis;

        Sensor * temp_sensor;
        Sensor * humidity_sensor;
        BinarySensor * door_window_sensor;
        BinarySensor * motion_sensor;
        SensorChain outdoor;

        std::vector<Schalter *> heaters;
        std::shared_ptr<CentralHeater> central_heater;

        // Holds the valves open while the central heater runs out its off delay.
        Timer valve_timer;
        bool valves_open;

        const AutoOnOff auto_onoff;
        ManualOverride manual_override;

        State state;
        bool power;
        double target;
        std::string preset;
        double reading;
        bool degraded;
        std::string blocked_by;

        bool outdoor_known;
        double outdoor_temperature;
        AutoOnOff::Decision auto_decision;

        bool evaluated;
        unsigned long last_evaluation;
        unsigned long revision;
};

const char * to_c_str(const Zone::State & s);
