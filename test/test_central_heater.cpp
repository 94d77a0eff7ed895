#include <catch2/catch.hpp>

#include "central_heater.h"
#include "helpers.h"

namespace {

// Ticks the heater every second until the given time.
void run_until(ManualClock & clock, CentralHeater & heater, double seconds) {
    while (clock.now < seconds_to_millis(seconds)) {
        clock.advance(1);
        heater.tick();
    }
}

}

TEST_CASE("Central heater waits for the on delay", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("living", {30 * 1000, 60 * 1000});

    heater.set_request("living", true);
    REQUIRE(heater.has_demand());
    REQUIRE(heater.on_pending());
    REQUIRE_FALSE(heater.is_active());

    run_until(clock, heater, 29);
    REQUIRE_FALSE(heater.is_active());
    REQUIRE(recorder.count("boiler") == 0);

    run_until(clock, heater, 30);
    REQUIRE(heater.is_active());
    REQUIRE(recorder.count("boiler", true) == 1);
    REQUIRE_FALSE(heater.on_pending());
}

TEST_CASE("Central heater turns on at once without delays", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("living", {0, 0});

    heater.set_request("living", true);
    REQUIRE(heater.is_active());

    heater.set_request("living", false);
    REQUIRE_FALSE(heater.is_active());
    REQUIRE(recorder.commands.size() == 2);
}

TEST_CASE("Returning demand cancels the off delay", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("living", {0, 60 * 1000});

    heater.set_request("living", true);
    REQUIRE(heater.is_active());

    clock.set(100);
    heater.set_request("living", false);
    REQUIRE(heater.off_pending());
    REQUIRE(heater.is_active());

    run_until(clock, heater, 130);
    heater.set_request("living", true);
    REQUIRE_FALSE(heater.off_pending());

    run_until(clock, heater, 300);
    REQUIRE(heater.is_active());
    REQUIRE(recorder.count("boiler", false) == 0);
    REQUIRE(heater.get_command_count() == 1);
}

TEST_CASE("Demand ending before the burner starts cancels the start", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("living", {30 * 1000, 60 * 1000});

    heater.set_request("living", true);
    run_until(clock, heater, 10);
    heater.set_request("living", false);
    REQUIRE_FALSE(heater.on_pending());
    REQUIRE_FALSE(heater.off_pending());

    run_until(clock, heater, 200);
    REQUIRE(recorder.commands.empty());
}

TEST_CASE("Two zones sharing a central heater", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {30 * 1000, 60 * 1000});
    heater.attach("b", {30 * 1000, 60 * 1000});

    // A starts heating at t=0, B joins at t=10
    heater.set_request("a", true);
    run_until(clock, heater, 10);
    heater.set_request("b", true);

    // the on delay counts from the first request
    run_until(clock, heater, 29);
    REQUIRE_FALSE(heater.is_active());
    run_until(clock, heater, 30);
    REQUIRE(heater.is_active());

    // A satisfied at t=40, B still demands heat
    run_until(clock, heater, 40);
    heater.set_request("a", false);
    REQUIRE_FALSE(heater.off_pending());
    REQUIRE(heater.get_demand() == std::set<std::string>({"b"}));

    // B satisfied at t=50, the off delay starts
    run_until(clock, heater, 50);
    heater.set_request("b", false);
    REQUIRE(heater.off_pending());

    SECTION("burner turns off after the off delay") {
        run_until(clock, heater, 109);
        REQUIRE(heater.is_active());
        run_until(clock, heater, 110);
        REQUIRE_FALSE(heater.is_active());

        REQUIRE(recorder.commands == std::vector<std::pair<std::string, bool>>({{"boiler", true}, {"boiler", false}}));
    }

    SECTION("demand returning at t=90 keeps the burner on") {
        run_until(clock, heater, 90);
        heater.set_request("a", true);
        REQUIRE_FALSE(heater.off_pending());
        REQUIRE_FALSE(heater.on_pending());

        run_until(clock, heater, 300);
        REQUIRE(heater.is_active());
        REQUIRE(recorder.commands == std::vector<std::pair<std::string, bool>>({{"boiler", true}}));
    }
}

TEST_CASE("Central heater never turns off while zones demand heat", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {5 * 1000, 20 * 1000});
    heater.attach("b", {5 * 1000, 20 * 1000});

    // zones flapping in overlapping patterns
    for (int t = 0; t < 600; ++t) {
        clock.set(t);
        heater.set_request("a", (t / 7) % 2 == 0);
        heater.set_request("b", (t / 11) % 3 != 0);
        heater.tick();

        if (heater.has_demand()) {
            REQUIRE_FALSE(heater.off_pending());
            REQUIRE((heater.is_active() || heater.on_pending()));
        } else {
            REQUIRE_FALSE(heater.on_pending());
        }
    }

    // commands alternate, never repeated
    for (size_t i = 1; i < recorder.commands.size(); ++i) {
        REQUIRE(recorder.commands[i].second != recorder.commands[i - 1].second);
    }
}

TEST_CASE("Differing delays use the longest ones", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {10 * 1000, 60 * 1000});
    heater.attach("b", {30 * 1000, 20 * 1000});

    const CentralHeater::Delays delays = heater.get_delays();
    REQUIRE(delays.on_millis == 30 * 1000);
    REQUIRE(delays.off_millis == 60 * 1000);

    heater.set_request("a", true);
    run_until(clock, heater, 29);
    REQUIRE_FALSE(heater.is_active());
    run_until(clock, heater, 30);
    REQUIRE(heater.is_active());

    SECTION("detached zone stops contributing") {
        heater.detach("a");
        REQUIRE(heater.get_delays().off_millis == 20 * 1000);
    }
}

TEST_CASE("Detaching a zone drops its demand", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {0, 10 * 1000});

    heater.set_request("a", true);
    REQUIRE(heater.is_active());

    heater.detach("a");
    REQUIRE_FALSE(heater.has_demand());
    REQUIRE(heater.off_pending());

    run_until(clock, heater, 10);
    REQUIRE_FALSE(heater.is_active());
}

TEST_CASE("Shutdown cancels timers and keeps the burner state", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {0, 10 * 1000});

    heater.set_request("a", true);
    heater.set_request("a", false);
    REQUIRE(heater.off_pending());

    heater.shutdown();
    REQUIRE_FALSE(heater.off_pending());

    run_until(clock, heater, 60);
    REQUIRE(heater.is_active());
    REQUIRE(recorder.count("boiler", false) == 0);
}

TEST_CASE("Central heater status", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeater heater("boiler", clock, recorder.output());
    heater.attach("a", {30 * 1000, 60 * 1000});

    JsonDocument status = heater.get_status();
    REQUIRE(status["demand"].as<JsonArrayConst>().size() == 0);
    REQUIRE(status["on_delay"].as<double>() == Approx(30));

    heater.set_request("a", true);
    clock.advance(10);
    status = heater.get_status();
    REQUIRE(status["demand"][0].as<std::string>() == "a");
    REQUIRE(status["on_in"].as<double>() == Approx(20));
}

TEST_CASE("Central heater registry shares heaters by name", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeaterRegistry registry(clock, recorder.output());

    auto first = registry.acquire("boiler");
    auto second = registry.acquire("boiler");
    REQUIRE(first == second);
    REQUIRE(registry.all().size() == 1);

    first.reset();
    second.reset();
    registry.collect();
    REQUIRE(registry.find("boiler") == nullptr);
    REQUIRE(registry.all().empty());
}

TEST_CASE("Unused central heater is kept until its burner is off", "[central_heater]") {
    ManualClock clock;
    Recorder recorder;
    CentralHeaterRegistry registry(clock, recorder.output());

    auto heater = registry.acquire("boiler");
    heater->attach("a", {0, 60 * 1000});
    heater->set_request("a", true);
    REQUIRE(recorder.last("boiler"));

    heater->set_request("a", false);
    heater->detach("a");
    heater.reset();

    registry.collect();
    REQUIRE(registry.find("boiler") != nullptr);

    clock.advance(59);
    registry.tick();
    REQUIRE(recorder.last("boiler"));
    REQUIRE(registry.find("boiler") != nullptr);

    clock.advance(1);
    registry.tick();
    REQUIRE_FALSE(recorder.last("boiler"));
    REQUIRE(registry.find("boiler") == nullptr);
}
