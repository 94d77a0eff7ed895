#pragma once

#include <string>
#include <utility>
#include <vector>

#include <ArduinoJson.h>
#include <catch2/catch.hpp>

#include "clock.h"
#include "schalter.h"

class ManualClock: public Clock {
    public:
        ManualClock(unsigned long start = 0): now(start) {}

        unsigned long millis() const override { return now; }

        void advance(double seconds) { now += seconds_to_millis(seconds); }
        void set(double seconds) { now = seconds_to_millis(seconds); }

        unsigned long now;
};

// Records actuator commands in the order they were sent.
class Recorder {
    public:
        Schalter::Output output() {
            return [this](const std::string & name, bool active) {
                commands.push_back(std::make_pair(name, active));
            };
        }

        size_t count(const std::string & name) const {
            size_t ret = 0;
            for (const auto & command : commands) {
                if (command.first == name) {
                    ++ret;
                }
            }
            return ret;
        }

        size_t count(const std::string & name, bool active) const {
            size_t ret = 0;
            for (const auto & command : commands) {
                if (command.first == name && command.second == active) {
                    ++ret;
                }
            }
            return ret;
        }

        // Last command sent to the actuator, false if there was none.
        bool last(const std::string & name) const {
            for (auto it = commands.rbegin(); it != commands.rend(); ++it) {
                if (it->first == name) {
                    return it->second;
                }
            }
            return false;
        }

        std::vector<std::pair<std::string, bool>> commands;
};

inline JsonDocument parse_json(const std::string & text) {
    JsonDocument json;
    const DeserializationError error = deserializeJson(json, text);
    INFO(text);
    REQUIRE_FALSE(error);
    return json;
}
