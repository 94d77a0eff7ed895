#include "logger.h"
#include "schalter.h"

const char * to_c_str(const Schalter::State & s) {
    switch (s) {
        case Schalter::State::init:
            return "init";
        case Schalter::State::active:
            return "active";
        default:
            return "inactive";
    }
}

Schalter::Schalter(const std::string & name, Output output)
    : name(name), output(output), state(State::init), commands(0) {
}

void Schalter::set_request(const void * requester, bool requesting) {
    std::lock_guard<std::mutex> lock(mutex);
    if (requesting) { requesters.insert(requester); } else { requesters.erase(requester); }
    command_locked(!requesters.empty());
}

void Schalter::command(bool active) {
    std::lock_guard<std::mutex> lock(mutex);
    command_locked(active);
}

void Schalter::command_locked(bool active) {
    const State new_state = active ? State::active : State::inactive;
    if (state == new_state) {
        return;
    }
    get_logger().printf("Schalter %s changing state from %s to %s.\n", name.c_str(), to_c_str(state), to_c_str(new_state));
    state = new_state;
    ++commands;
    if (output) {
        output(name, active);
    }
}

void Schalter::attach(const void * owner) {
    std::lock_guard<std::mutex> lock(mutex);
    owners.insert(owner);
}

void Schalter::detach(const void * owner) {
    std::lock_guard<std::mutex> lock(mutex);
    owners.erase(owner);
    if (requesters.erase(owner)) {
        command_locked(!requesters.empty());
    }
}

bool Schalter::exclusive() const {
    std::lock_guard<std::mutex> lock(mutex);
    return owners.size() == 1;
}

Schalter::State Schalter::get_state() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

size_t Schalter::get_command_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return commands;
}

JsonDocument Schalter::get_config() const {
    JsonDocument json;
    json.set(name);
    return json;
}

Schalter * SchalterRegistry::get(const std::string & name) {
    if (name.empty()) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex);
    std::unique_ptr<Schalter> & schalter = schalters[name];
    if (!schalter) {
        schalter.reset(new Schalter(name, output));
    }
    return schalter.get();
}

Schalter * SchalterRegistry::find(const std::string & name) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = schalters.find(name);
    return it == schalters.end() ? nullptr : it->second.get();
}

void SchalterRegistry::shutdown() {
    for (Schalter * schalter : all()) {
        if (schalter->exclusive()) {
            get_logger().printf("Shutdown: turning off %s.\n", schalter->name.c_str());
            schalter->command(false);
        }
    }
}

std::vector<Schalter *> SchalterRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Schalter *> ret;
    for (const auto & kv : schalters) {
        ret.push_back(kv.second.get());
    }
    return ret;
}
