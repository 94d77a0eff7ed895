#include <chrono>

#include "clock.h"

namespace {

unsigned long long steady_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

}

SteadyClock::SteadyClock(): start(steady_millis()) {}

unsigned long SteadyClock::millis() const {
    return static_cast<unsigned long>(steady_millis() - start);
}
