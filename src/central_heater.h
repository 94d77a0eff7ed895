#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <ArduinoJson.h>

#include "clock.h"
#include "schalter.h"
#include "timer.h"

// Shared heat source.  Collects heat requests from zones and switches the
// burner on and off with protective delays.  All methods are thread safe.
class CentralHeater {
    public:
        struct Delays {
            unsigned long on_millis;
            unsigned long off_millis;
        };

        CentralHeater(const std::string & name, const Clock & clock, Schalter::Output output);
        ~CentralHeater();
        CentralHeater(const CentralHeater &) = delete;
        CentralHeater & operator=(const CentralHeater &) = delete;

        const std::string name;

        // Zones sharing this heater contribute their delays while attached.
        void attach(const std::string & zone, const Delays & delays);
        void detach(const std::string & zone);

        void set_request(const std::string & zone, bool requesting);

        void tick();

        // Cancels pending timers, the burner keeps its last commanded state.
        void shutdown();

        bool is_active() const;
        // Burner off and no timer pending.
        bool is_idle() const;
        bool has_demand() const;
        bool on_pending() const;
        bool off_pending() const;
        std::set<std::string> get_demand() const;
        Delays get_delays() const;
        size_t get_command_count() const;

        JsonDocument get_status() const;

    private:
        Delays effective_delays() const;
        void demand_started();
        void demand_ended();

        mutable std::mutex mutex;
        Schalter burner;
        Timer on_timer;
        Timer off_timer;
        std::set<std::string> demand;
        std::map<std::string, Delays> zones;
};

// Central heaters by name.  A heater stays registered while a zone uses it
// and afterwards until its burner is switched off.
class CentralHeaterRegistry {
    public:
        CentralHeaterRegistry(const Clock & clock, Schalter::Output output): clock(clock), output(output) {}

        std::shared_ptr<CentralHeater> acquire(const std::string & name);
        std::shared_ptr<CentralHeater> find(const std::string & name) const;
        std::vector<std::shared_ptr<CentralHeater>> all() const;

        void tick();
        void shutdown();

        // Drops idle heaters no zone refers to.
        void collect();

    private:
        const Clock & clock;
        const Schalter::Output output;
        mutable std::mutex mutex;
        std::map<std::string, std::shared_ptr<CentralHeater>> heaters;
};
