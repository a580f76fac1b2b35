#pragma once
#include <stdint.h>
#include <stddef.h>

struct MqttConfig
{
    const char *host;
    int port;
    const char *clientId;
    const char *user;
    const char *pass;
    const char *baseTopic; // e.g. "presence/lobby_sensor"
};

using CommandHandlerFn = void (*)(const uint8_t *payload, size_t len);

// Begin MQTT with explicit config and command handler.
void mqtt_begin(const MqttConfig &cfg, CommandHandlerFn cmdHandler);

// Call frequently from loop(); handles reconnect backoff and keepalive.
void mqtt_tick();

// True once after every successful (re)connect; the app re-registers its
// snapshot subscriber when it sees it.
bool mqtt_takeReconnected();

// SubscriberSendFn for presence snapshots on <base>/state (not retained).
// Fails while disconnected so the subscriber set drops the link.
bool mqtt_sendSnapshot(const char *payload, size_t len, void *ctx);

// Publish ACK on the dedicated ack topic (not retained).
bool mqtt_publishAck(const char *reqId, const char *type, const char *status, const char *msg);

// Publish a raw payload to a topic under baseTopic.
bool mqtt_publishLog(const char *topicSuffix, const char *payload, bool retained = false);

bool mqtt_isConnected();

const char *mqtt_stateToString(int state);
