#pragma once

#include <string>

#include "heating.h"
#include "helpers.h"

// Heating engine driven by a manual clock with recorded actuator commands.
struct HeatingFixture {
    HeatingFixture(): clock(1000 * 1000), heating(clock, recorder.output()) {}

    void configure(const std::string & zones) {
        const JsonDocument json = parse_json("{\"zones\": " + zones + "}");
        std::string error;
        const bool ok = heating.configure(json.as<JsonVariantConst>(), error);
        INFO(error);
        REQUIRE(ok);
    }

    void send(const std::string & entity, const std::string & payload) {
        heating.handle_event(entity, payload);
    }

    // Advances the clock in one second steps, ticking the engine.
    void run(double seconds) {
        const unsigned long end = clock.now + seconds_to_millis(seconds);
        while (clock.now < end) {
            clock.now += 1000;
            heating.tick();
        }
    }

    Zone & zone(const std::string & id) {
        auto ptr = heating.get(id);
        REQUIRE(ptr != nullptr);
        return *ptr;
    }

    JsonDocument status(const std::string & id) {
        return zone(id).get_status();
    }

    ManualClock clock;
    Recorder recorder;
    Heating heating;
};
