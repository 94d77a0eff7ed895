#pragma once

#include <Arduino.h>
#include <PicoMQTT.h>

class Heating;

namespace HomeAssistant {

extern PicoMQTT::Client mqtt;
extern String autodiscovery_topic;

void init(Heating & heating);
void tick();
bool healthcheck();

}
