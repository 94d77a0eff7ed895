#pragma once

// Tracks user actions which suspend automatic power switching.  Owned by a
// zone and accessed under the zone's lock.
class ManualOverride {
    public:
        // timeout_millis == 0 disables expiry
        ManualOverride(unsigned long timeout_millis = 0)
            : timeout_millis(timeout_millis), active(false), since(0) {}

        void set(unsigned long now);
        void reset();

        // Clears the flag if it expired.  Returns true if it did.
        bool expire(unsigned long now);

        bool is_active() const { return active; }
        unsigned long get_since() const { return since; }

        const unsigned long timeout_millis;

    private:
        bool active;
        unsigned long since;
};
