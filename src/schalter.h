#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <ArduinoJson.h>

// Commanded on/off actuator.  Stays active while any requester asks for it.
class Schalter {
    public:
        typedef std::function<void(const std::string & name, bool active)> Output;

        enum class State {
            init = 0,
            inactive = 1,
            active = 2,
        };

        Schalter(const std::string & name, Output output);
        Schalter(const Schalter &) = delete;
        Schalter & operator=(const Schalter &) = delete;

        const std::string name;

        void set_request(const void * requester, bool requesting);

        // Sends a command regardless of requests.  Repeated commands are suppressed.
        void command(bool active);

        void attach(const void * owner);
        void detach(const void * owner);
        bool exclusive() const;

        State get_state() const;
        bool is_active() const { return get_state() == State::active; }
        size_t get_command_count() const;

        JsonDocument get_config() const;

    private:
        void command_locked(bool active);

        mutable std::mutex mutex;
        const Output output;
        State state;
        size_t commands;
        std::set<const void *> requesters;
        std::set<const void *> owners;
};

class SchalterRegistry {
    public:
        SchalterRegistry(Schalter::Output output): output(output) {}

        Schalter * get(const std::string & name);
        Schalter * find(const std::string & name) const;

        // Turns off every schalter used by a single owner.
        void shutdown();

        std::vector<Schalter *> all() const;

    private:
        mutable std::mutex mutex;
        const Schalter::Output output;
        std::map<std::string, std::unique_ptr<Schalter>> schalters;
};

const char * to_c_str(const Schalter::State & s);
