#include <climits>

#include <catch2/catch.hpp>

#include "helpers.h"
#include "timer.h"

TEST_CASE("Timer fires once after the delay", "[timer]") {
    ManualClock clock(1000);
    Timer timer(clock);
    int fired = 0;

    timer.start(5000, [&fired] { ++fired; });
    REQUIRE(timer.pending());
    REQUIRE(timer.remaining_millis() == 5000);

    clock.now += 4999;
    REQUIRE_FALSE(timer.tick());
    REQUIRE(fired == 0);
    REQUIRE(timer.remaining_millis() == 1);

    clock.now += 1;
    REQUIRE(timer.tick());
    REQUIRE(fired == 1);
    REQUIRE(timer.get_state() == Timer::State::fired);

    clock.now += 10000;
    REQUIRE_FALSE(timer.tick());
    REQUIRE(fired == 1);
}

TEST_CASE("Cancelled timer never fires", "[timer]") {
    ManualClock clock;
    Timer timer(clock);
    int fired = 0;

    REQUIRE_FALSE(timer.cancel());

    timer.start(1000, [&fired] { ++fired; });
    REQUIRE(timer.cancel());
    REQUIRE(timer.get_state() == Timer::State::cancelled);
    REQUIRE_FALSE(timer.cancel());

    clock.now += 2000;
    REQUIRE_FALSE(timer.tick());
    REQUIRE(fired == 0);
    REQUIRE(timer.remaining_millis() == 0);
}

TEST_CASE("Restarting a timer replaces the pending action", "[timer]") {
    ManualClock clock;
    Timer timer(clock);
    int first = 0;
    int second = 0;

    timer.start(1000, [&first] { ++first; });
    clock.now += 500;
    timer.start(1000, [&second] { ++second; });

    clock.now += 600;
    REQUIRE_FALSE(timer.tick());

    clock.now += 400;
    REQUIRE(timer.tick());
    REQUIRE(first == 0);
    REQUIRE(second == 1);
}

TEST_CASE("Zero delay timer fires on the next tick", "[timer]") {
    ManualClock clock(42);
    Timer timer(clock);
    bool fired = false;

    timer.start(0, [&fired] { fired = true; });
    REQUIRE(timer.tick());
    REQUIRE(fired);
}

TEST_CASE("Timer survives a millis() wrap", "[timer]") {
    ManualClock clock(ULONG_MAX - 500);
    Timer timer(clock);
    bool fired = false;

    timer.start(1000, [&fired] { fired = true; });

    clock.now += 999;
    REQUIRE_FALSE(timer.tick());

    clock.now += 1;
    REQUIRE(timer.tick());
    REQUIRE(fired);
}

TEST_CASE("Timer action may restart the timer", "[timer]") {
    ManualClock clock;
    Timer timer(clock);
    int fired = 0;

    std::function<void()> action = [&] {
        ++fired;
        if (fired < 3) {
            timer.start(100, action);
        }
    };

    timer.start(100, action);
    for (int i = 0; i < 10; ++i) {
        clock.now += 100;
        timer.tick();
    }

    REQUIRE(fired == 3);
    REQUIRE_FALSE(timer.pending());
}
