#pragma once

// Forces zone power based on the outdoor temperature.
class AutoOnOff {
    public:
        enum class Decision {
            none = 0,
            force_on = 1,
            force_off = 2,
        };

        AutoOnOff(bool enabled, double on_temp, double off_temp)
            : enabled(enabled), on_temp(on_temp), off_temp(off_temp) {}

        // The decision doesn't depend on the current power state or the
        // manual override, the zone decides whether to apply it.
        Decision evaluate(bool outdoor_known, double outdoor) const;

        const bool enabled;
        const double on_temp;
        const double off_temp;
};

const char * to_c_str(const AutoOnOff::Decision & d);
