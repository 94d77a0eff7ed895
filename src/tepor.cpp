#include <string>

#include <Arduino.h>
#include <ArduinoOTA.h>
#include <LittleFS.h>
#include <WebServer.h>
#include <WiFi.h>
#include <uri/UriRegex.h>

#include <ArduinoJson.h>
#include <PicoMQTT.h>
#include <PicoPrometheus.h>
#include <PicoSyslog.h>
#include <PicoUtils.h>

#include "hass.h"
#include "heating.h"
#include "logger.h"
#include "metrics.h"

namespace {

class ArduinoClock: public Clock {
    public:
        unsigned long millis() const override { return ::millis(); }
};

// Forwards engine log lines to syslog and the serial port.
class SyslogLogger: public Logger {
    public:
        SyslogLogger(PicoSyslog::Logger & syslog): syslog(syslog) {}

    protected:
        void write(const char * line) override { syslog.print(line); }

    private:
        PicoSyslog::Logger & syslog;
};

}

PicoMQTT::Server mqtt;

PicoSyslog::Logger remote_log("tepor");
SyslogLogger logger(remote_log);

PicoUtils::PinInput button(0, true);
PicoUtils::ResetButton reset_button(button);

PicoUtils::PinOutput wifi_led(2, false);
PicoUtils::Blink led_blinker(wifi_led, 0, 91);

ArduinoClock arduino_clock;

Heating heating(arduino_clock, [](const std::string & name, bool active) {
    mqtt.publish(String("schalter/") + name.c_str() + "/set", active ? "ON" : "OFF", 0, true);
});

String hostname = "tepor";

PicoUtils::RestfulServer<WebServer> server(80);

const char CONFIG_FILE[] = "/config.json";
const char STATE_FILE[] = "/state.json";

JsonDocument get_config() {
    JsonDocument json = heating.get_config();

    {
        auto hass = json["hass"];
        hass["server"] = HomeAssistant::mqtt.host;
        hass["port"] = HomeAssistant::mqtt.port;
        hass["username"] = HomeAssistant::mqtt.username;
        hass["password"] = HomeAssistant::mqtt.password;
        hass["autodiscovery_topic"] = HomeAssistant::autodiscovery_topic;
    }

    json["syslog"] = remote_log.server;
    json["hostname"] = hostname;

    return json;
}

bool healthy = false;
PicoPrometheus::Gauge health_gauge(prometheus, "health", "Board healthcheck", [] { return healthy ? 1 : 0; });

PicoUtils::PeriodicRun healthcheck(5, [] {
    static PicoUtils::Stopwatch last_healthy;

    healthy = (WiFi.status() == WL_CONNECTED) && HomeAssistant::healthcheck() && heating.healthcheck();

    if (healthy)
        last_healthy.reset();

    if (last_healthy.elapsed() >= 15 * 60) {
        logger.println("Healthcheck failing for too long.  Reset...");
        heating.shutdown();
        ESP.restart();
    }

    if (healthy) {
        led_blinker.set_pattern(uint64_t(1) << 60);
    } else {
        led_blinker.set_pattern(0b1100);
    }
});

void load_state() {
    File file = LittleFS.open(STATE_FILE, "r");
    if (!file) {
        logger.println("No stored zone state.");
        return;
    }

    JsonDocument json;
    const auto error = deserializeJson(json, file);
    file.close();

    if (error) {
        logger.printf("Failed to parse stored zone state: %s\n", error.c_str());
        return;
    }

    heating.restore_runtime_state(json.as<JsonVariantConst>());
}

PicoUtils::PeriodicRun save_state(10, [] {
    static unsigned long saved_revision = 0;

    const unsigned long revision = heating.get_revision();
    if (revision == saved_revision) {
        return;
    }

    File file = LittleFS.open(STATE_FILE, "w");
    if (!file) {
        logger.println("Failed to open state file for writing.");
        return;
    }

    serializeJson(heating.get_runtime_state(), file);
    file.close();
    saved_revision = revision;
});

PicoUtils::PeriodicRun control_loop(1, [] {
    heating.tick();
});

void setup_wifi() {
    WiFi.setHostname(hostname.c_str());
    WiFi.setAutoReconnect(true);

    Serial.println("Press button now to enter SmartConfig.");
    led_blinker.set_pattern(1);
    const PicoUtils::Stopwatch stopwatch;
    bool smart_config = false;
    {
        while (!smart_config && (stopwatch.elapsed_millis() < 5 * 1000)) {
            smart_config = button;
            delay(100);
        }
    }

    if (smart_config) {
        led_blinker.set_pattern(0b100100100 << 9);

        Serial.println("Entering SmartConfig mode.");
        WiFi.beginSmartConfig();
        while (!WiFi.smartConfigDone() && (stopwatch.elapsed_millis() < 5 * 60 * 1000)) {
            delay(100);
        }

        if (WiFi.smartConfigDone()) {
            Serial.println("SmartConfig success.");
        } else {
            Serial.println("SmartConfig failed.  Reboot.");
            ESP.restart();
        }
    } else {
        WiFi.softAPdisconnect(true);
        WiFi.begin();
    }

    led_blinker.set_pattern(0b10);
}

void setup_server() {

    server.on("/zones", HTTP_GET, [] {
        server.sendJson(heating.get_status());
    });

    server.on("/config", HTTP_GET, [] {
        server.sendJson(get_config());
    });

    server.on(UriRegex("/zones/([^/]+)"), HTTP_GET, [] {
        const auto zone = heating.get(server.decodedPathArg(0).c_str());

        if (!zone) {
            server.send(404);
        } else {
            server.sendJson(zone->get_status());
        }
    });

    server.on(UriRegex("/zones/([^/]+)/reset_override"), HTTP_POST, [] {
        const CommandResult result = heating.reset_manual_override(server.decodedPathArg(0).c_str());
        server.send(result == CommandResult::ok ? 200 : 404);
    });

    prometheus.labels["module"] = "tepor";

    prometheus.register_metrics_endpoint(server);

    server.begin();
}

void setup_mqtt() {
    for (const auto & entity : heating.get_entities()) {
        mqtt.subscribe(entity.c_str(), [](const char * topic, const char * payload) {
            heating.handle_event(topic, payload);
        });
    }

    mqtt.begin();
}

void setup() {
    wifi_led.init();
    led_blinker.set_pattern(0b10);
    PicoUtils::BackgroundBlinker bb(led_blinker);

    Serial.begin(115200);

    Serial.println("\n\n"
                   " _____\n"
                   "|_   _|__ _ __   ___  _ __\n"
                   "  | |/ _ \\ '_ \\ / _ \\| '__|\n"
                   "  | |  __/ |_) | (_) | |\n"
                   "  |_|\\___| .__/ \\___/|_|\n"
                   "         |_|\n"
                   "\n"
                   "Tepor " __DATE__ " " __TIME__ "\n"
                   "\n\n"
                   "Press and hold button now to enter WiFi setup.\n"
                  );

    delay(3000);
    reset_button.init();

    set_logger(logger);

    LittleFS.begin(true);

    {
        const auto config = PicoUtils::JsonConfigFile<JsonDocument>(LittleFS, CONFIG_FILE);

        std::string error;
        if (!heating.configure(config, error)) {
            Serial.printf("Invalid configuration: %s\n", error.c_str());
        }

        {
            const auto hass = config["hass"];
            HomeAssistant::mqtt.host = hass["server"] | "";
            HomeAssistant::mqtt.port = hass["port"] | 1883;
            HomeAssistant::mqtt.username = hass["username"] | "";
            HomeAssistant::mqtt.password = hass["password"] | "";
            HomeAssistant::autodiscovery_topic = hass["autodiscovery_topic"] | "homeassistant";
        }

        remote_log.server = config["syslog"] | "";
        hostname = config["hostname"] | "tepor";
    }

    load_state();

    setup_wifi();
    setup_server();
    setup_mqtt();
    register_metrics(heating);
    HomeAssistant::init(heating);

    ArduinoOTA.setHostname(hostname.c_str());
    ArduinoOTA.onStart([] {
        heating.shutdown();
    });
    ArduinoOTA.begin();
}

void loop() {
    ArduinoOTA.handle();
    server.handleClient();
    mqtt.loop();
    control_loop.tick();
    healthcheck.tick();
    save_state.tick();
    led_blinker.tick();
    HomeAssistant::tick();
}
