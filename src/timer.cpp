#include "timer.h"

const char * to_c_str(const Timer::State & s) {
    switch (s) {
        case Timer::State::idle:
            return "idle";
        case Timer::State::pending:
            return "pending";
        case Timer::State::fired:
            return "fired";
        default:
            return "cancelled";
    }
}

Timer::Timer(const Clock & clock)
    : clock(clock), state(State::idle), started(0), delay(0) {
}

void Timer::start(unsigned long delay_millis, std::function<void()> action) {
    this->action = action;
    delay = delay_millis;
    started = clock.millis();
    state = State::pending;
}

bool Timer::cancel() {
    if (state != State::pending) {
        return false;
    }
    state = State::cancelled;
    action = nullptr;
    return true;
}

bool Timer::tick() {
    if (state != State::pending || elapsed_millis(clock, started) < delay) {
        return false;
    }

    // switch state before running, so that the action may restart the timer
    state = State::fired;
    std::function<void()> fn;
    fn.swap(action);
    if (fn) {
        fn();
    }
    return true;
}

unsigned long Timer::remaining_millis() const {
    if (state != State::pending) {
        return 0;
    }
    const unsigned long elapsed = elapsed_millis(clock, started);
    return elapsed >= delay ? 0 : delay - elapsed;
}
