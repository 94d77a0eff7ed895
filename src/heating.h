#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "central_heater.h"
#include "clock.h"
#include "schalter.h"
#include "sensor.h"
#include "zone.h"

// The control engine: zones, their sensors, heaters and shared central heaters.
class Heating {
    public:
        Heating(const Clock & clock, Schalter::Output output, unsigned long poll_interval_millis = 30 * 1000);
        Heating(const Heating &) = delete;
        Heating & operator=(const Heating &) = delete;

        // Adds all zones from a config document.  Nothing is added unless the
        // whole document is valid.
        bool configure(const JsonVariantConst & json, std::string & error);
        bool add_zone(const std::string & id, const JsonVariantConst & json, std::string & error);
        // Replaces the zone's configuration, keeping its runtime state where still valid.
        bool reconfigure_zone(const std::string & id, const JsonVariantConst & json, std::string & error);
        bool remove_zone(const std::string & id);

        void handle_event(const std::string & entity, const std::string & payload, unsigned long timestamp);
        void handle_event(const std::string & entity, const std::string & payload);
        void tick();

        // Cancels pending timers and turns off heaters owned by a single zone.
        // Central heaters keep their state.
        void shutdown();

        CommandResult set_target(const std::string & zone, double temperature);
        CommandResult set_preset(const std::string & zone, const std::string & preset);
        CommandResult set_power(const std::string & zone, bool on);
        CommandResult reset_manual_override(const std::string & zone);

        std::shared_ptr<Zone> get(const std::string & id) const;
        std::vector<std::shared_ptr<Zone>> get_zones() const;
        std::vector<std::shared_ptr<CentralHeater>> get_central_heaters() const;
        std::vector<std::string> get_entities() const;

        JsonDocument get_config() const;
        JsonDocument get_status() const;

        JsonDocument get_runtime_state() const;
        void restore_runtime_state(const JsonVariantConst & json);
        unsigned long get_revision() const;

        bool healthcheck() const;
        bool is_stopped() const;

        unsigned long get_poll_interval_millis() const { return poll_interval_millis; }

    private:
        bool validate(const std::vector<ZoneConfig> & configs, const std::string & replaced, std::string & error) const;
        std::shared_ptr<Zone> create_zone(const ZoneConfig & config);

        const Clock & clock;
        unsigned long poll_interval_millis;

        SensorRegistry sensors;
        SchalterRegistry schalters;
        CentralHeaterRegistry central_heaters;

        mutable std::mutex mutex;
        bool stopped;
        unsigned long structure_revision;
        std::map<std::string, std::shared_ptr<Zone>> zones;
};
