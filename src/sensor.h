#pragma once

#include <limits>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <ArduinoJson.h>

class AbstractSensor {
    public:
        enum class State {
            init = 0,
            ok = 1,
            error = -1,
        };

        AbstractSensor(): state(State::init) {}
        virtual ~AbstractSensor() {}

        virtual std::string str() const = 0;
        virtual double get_reading() const { return std::numeric_limits<double>::quiet_NaN(); }
        State get_state() const;
        virtual JsonDocument get_config() const = 0;

    protected:
        void set_state(State new_state);
        mutable std::mutex mutex;

    private:
        State state;
};

// Sensor fed with point samples of a single entity.
class Sensor: public AbstractSensor {
    public:
        struct Sample {
            double value;
            // when the sample was taken
            unsigned long timestamp;
            // when the value last changed
            unsigned long changed;
        };

        Sensor(const std::string & address);

        // Returns false if the sample was discarded as out of order.
        bool update(const std::string & payload, unsigned long timestamp);

        std::string str() const override { return address; }
        double get_reading() const override;
        JsonDocument get_config() const override;
        virtual const char * kind() const { return "sensor"; }

        // Last valid sample, even if the current state is error.
        bool get_sample(Sample & sample) const;
        bool is_available() const { return get_state() == State::ok; }

        const std::string address;

    protected:
        virtual bool parse(const std::string & payload, double & value) const;

    private:
        bool updated;
        unsigned long last_update;

        bool valid;
        Sample sample;
};

class BinarySensor: public Sensor {
    public:
        BinarySensor(const std::string & address): Sensor(address) {}
        const char * kind() const override { return "binary_sensor"; }

        // Returns false if unknown.
        bool get_value(bool & value) const;

    protected:
        bool parse(const std::string & payload, double & value) const override;
};

// Accepts either a plain number or a JSON object carrying a temperature attribute.
class WeatherSensor: public Sensor {
    public:
        WeatherSensor(const std::string & address): Sensor(address) {}
        const char * kind() const override { return "weather"; }

    protected:
        bool parse(const std::string & payload, double & value) const override;
};

// Resolves the first usable reading from a list of sensors, in order.
class SensorChain: public AbstractSensor {
    public:
        SensorChain(const std::list<Sensor *> sensors);

        // Samples older than max_age_millis are skipped, 0 accepts any age.
        bool resolve(unsigned long now, unsigned long max_age_millis, double & value);

        std::string str() const override;
        double get_reading() const override;
        JsonDocument get_config() const override;

        // Sensor which provided the last resolved reading or nullptr.
        const Sensor * get_source() const;

    protected:
        const std::list<Sensor *> sensors;

    private:
        const Sensor * source;
        double reading;
};

class SensorRegistry {
    public:
        enum class Kind {
            numeric,
            binary,
            weather,
        };

        // Returns nullptr if the address is already used by a sensor of a different kind.
        Sensor * get(const std::string & address, Kind kind);
        Sensor * find(const std::string & address) const;

        // Returns false if the address is unknown or the sample was rejected.
        bool update(const std::string & address, const std::string & payload, unsigned long timestamp);

        std::vector<std::string> addresses() const;

    private:
        mutable std::mutex mutex;
        std::map<std::string, std::unique_ptr<Sensor>> sensors;
};

// Strict decimal parsing, rejects trailing garbage and non finite values.
bool parse_number(const std::string & payload, double & value);

const char * to_c_str(const AbstractSensor::State & s);
