#include "manual_override.h"

void ManualOverride::set(unsigned long now) {
    active = true;
    since = now;
}

void ManualOverride::reset() {
    active = false;
}

bool ManualOverride::expire(unsigned long now) {
    if (!active || !timeout_millis || now - since < timeout_millis) {
        return false;
    }
    active = false;
    return true;
}
