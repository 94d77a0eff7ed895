#pragma once

class Clock {
    public:
        virtual ~Clock() {}
        virtual unsigned long millis() const = 0;
};

class SteadyClock: public Clock {
    public:
        SteadyClock();
        unsigned long millis() const override;

    private:
        const unsigned long long start;
};

inline unsigned long elapsed_millis(const Clock & clock, unsigned long since) {
    // unsigned subtraction stays correct across a millis() wrap
    return clock.millis() - since;
}

// Age of a timestamp, timestamps from the future count as fresh.
inline unsigned long age_millis(unsigned long now, unsigned long timestamp) {
    return static_cast<long>(now - timestamp) < 0 ? 0 : now - timestamp;
}

inline unsigned long seconds_to_millis(double seconds) {
    return static_cast<unsigned long>(seconds * 1000.0 + 0.5);
}
