// Copy to secrets.h (not committed) and fill in the broker details.
#pragma once

#define MQTT_HOST "192.168.0.10"
#define MQTT_PORT 1883
#define MQTT_USER ""
#define MQTT_PASS ""
