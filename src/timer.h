#pragma once

#include <functional>

#include "clock.h"

// One-shot delayed action.  Not thread safe, the owner serializes access.
class Timer {
    public:
        enum class State {
            idle = 0,
            pending = 1,
            fired = 2,
            cancelled = 3,
        };

        Timer(const Clock & clock);
        Timer(const Timer &) = delete;
        Timer & operator=(const Timer &) = delete;

        // Replaces any pending action.
        void start(unsigned long delay_millis, std::function<void()> action);

        // Returns true if a pending action was dropped.
        bool cancel();

        // Runs the action if it is due.  Returns true if it ran.
        bool tick();

        bool pending() const { return state == State::pending; }
        State get_state() const { return state; }
        unsigned long get_delay() const { return delay; }
        unsigned long remaining_millis() const;

    private:
        const Clock & clock;
        State state;
        unsigned long started;
        unsigned long delay;
        std::function<void()> action;
};

const char * to_c_str(const Timer::State & s);
