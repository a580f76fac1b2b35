#include <WiFi.h>
#include <PubSubClient.h>
#include <ArduinoJson.h>
#include <Arduino.h>
#include <string.h>
#include <ctype.h>

#include "mqtt_transport.h"
#include "presence_config.h"
#include "logger.h"

#ifndef CFG_CMD_BUF_SIZE
#define CFG_CMD_BUF_SIZE 2048u
#endif

static WiFiClient wifiClient;
static PubSubClient mqtt(wifiClient);

static MqttConfig s_cfg{};
static CommandHandlerFn s_cmdHandler = nullptr;
static bool s_initialized = false;
static bool s_reconnected = false;

struct Topics
{
    char state[96];
    char cmd[96];
    char ack[96];
    char avail[96];
};
static Topics s_topics{};

static uint32_t s_lastAttemptMs = 0;
static const uint32_t RETRY_INTERVAL_MS = 5000;
static bool s_loggedFirstConnectAttempt = false;
static bool s_seenConnectFailure = false;
static bool s_lastConnected = false;

static const char *AVAIL_ONLINE = "online";
static const char *AVAIL_OFFLINE = "offline";

const char *mqtt_stateToString(int state)
{
    switch (state)
    {
    case -4:
        return "MQTT_CONNECTION_TIMEOUT";
    case -3:
        return "MQTT_CONNECTION_LOST";
    case -2:
        return "MQTT_CONNECT_FAILED";
    case -1:
        return "MQTT_DISCONNECTED";
    case 0:
        return "MQTT_CONNECTED";
    case 1:
        return "MQTT_CONNECT_BAD_PROTOCOL";
    case 2:
        return "MQTT_CONNECT_BAD_CLIENT_ID";
    case 3:
        return "MQTT_CONNECT_UNAVAILABLE";
    case 4:
        return "MQTT_CONNECT_BAD_CREDENTIALS";
    case 5:
        return "MQTT_CONNECT_UNAUTHORIZED";
    default:
        return "unknown";
    }
}

static void buildPayloadPreview(const uint8_t *payload, size_t len, char *out, size_t outSize)
{
    if (!out || outSize == 0)
        return;
    const size_t cap = outSize - 1;
    const size_t n = len < cap ? len : cap;
    for (size_t i = 0; i < n; ++i)
    {
        const char c = static_cast<char>(payload[i]);
        out[i] = (isprint(static_cast<unsigned char>(c)) && c != '\n' && c != '\r') ? c : '.';
    }
    out[n] = '\0';
}

static void buildTopic(char *out, size_t outSize, const char *suffix)
{
    if (outSize == 0 || s_cfg.baseTopic == nullptr)
        return;
    snprintf(out, outSize, "%s/%s", s_cfg.baseTopic, suffix);
}

static void buildTopics()
{
    buildTopic(s_topics.state, sizeof(s_topics.state), "state");
    buildTopic(s_topics.cmd, sizeof(s_topics.cmd), "cmd");
    buildTopic(s_topics.ack, sizeof(s_topics.ack), "ack");
    buildTopic(s_topics.avail, sizeof(s_topics.avail), "availability");
}

static void mqttCallback(char *topic, byte *payload, unsigned int length)
{
    if (!s_cmdHandler || topic == nullptr || strcmp(topic, s_topics.cmd) != 0)
        return;

    // PubSubClient reuses its buffer for the inbound payload and any publish
    // (acks, mirrored logs) overwrites it, so copy before doing anything else.
    static uint8_t cmdBuf[CFG_CMD_BUF_SIZE];
    if (length == 0 || length >= sizeof(cmdBuf))
    {
        LOG_WARN(LogDomain::COMMAND, "Command rejected: bad payload size len=%u", length);
        return;
    }
    memcpy(cmdBuf, payload, length);

    char preview[121];
    buildPayloadPreview(cmdBuf, length, preview, sizeof(preview));
    LOG_INFO(LogDomain::COMMAND, "Received command (len=%u): %s", length, preview);

    s_cmdHandler(cmdBuf, length);
}

static bool subscribeCommands()
{
    const bool ok = mqtt.subscribe(s_topics.cmd);
    if (!ok)
    {
        LOG_WARN(LogDomain::MQTT, "MQTT subscribe failed topic=%s", s_topics.cmd);
    }
    return ok;
}

static void logConnectFailure()
{
    const int state = mqtt.state();
    const char *stateStr = mqtt_stateToString(state);
    if (!s_seenConnectFailure)
    {
        s_seenConnectFailure = true;
        LOG_WARN(LogDomain::MQTT, "MQTT connect failed state=%d (%s)", state, stateStr);
    }
    LOG_WARN_EVERY("mqtt_connect_fail", 30000, LogDomain::MQTT,
                   "MQTT connect failed state=%d (%s)", state, stateStr);
    if (state == 4 || state == 5)
    {
        LOG_WARN_EVERY("mqtt_connect_auth_hint", 30000, LogDomain::MQTT,
                       "Check MQTT_USER/MQTT_PASS (secrets.h) and broker ACL");
    }
}

static bool ensureConnected()
{
    if (!s_initialized)
        return false;

    const uint32_t now = millis();
    if (!mqtt.connected() && s_lastConnected)
    {
        const int state = mqtt.state();
        LOG_WARN(LogDomain::MQTT, "MQTT disconnected state=%d (%s)", state, mqtt_stateToString(state));
        s_lastConnected = false;
    }

    if (!mqtt.connected())
    {
        if (WiFi.status() != WL_CONNECTED)
            return false;
        if ((uint32_t)(now - s_lastAttemptMs) < RETRY_INTERVAL_MS)
            return false;

        const char *authMode = (s_cfg.user && s_cfg.user[0] != '\0') ? "user" : "none";
        if (!s_loggedFirstConnectAttempt)
        {
            s_loggedFirstConnectAttempt = true;
            LOG_INFO(LogDomain::MQTT, "MQTT connecting host=%s port=%d clientId=%s auth=%s willTopic=%s",
                     s_cfg.host, s_cfg.port, s_cfg.clientId, authMode, s_topics.avail);
        }
        else
        {
            LOG_INFO_EVERY("mqtt_connecting", 30000, LogDomain::MQTT, "MQTT reconnecting host=%s port=%d",
                           s_cfg.host, s_cfg.port);
        }

        const bool ok = mqtt.connect(s_cfg.clientId, s_cfg.user, s_cfg.pass,
                                     s_topics.avail, 0, true, AVAIL_OFFLINE);
        s_lastAttemptMs = now;
        if (!ok)
        {
            logConnectFailure();
            return false;
        }

        s_seenConnectFailure = false;
        s_lastConnected = true;
        s_reconnected = true;
        mqtt.publish(s_topics.avail, AVAIL_ONLINE, true);
        const bool subOk = subscribeCommands();
        LOG_INFO(LogDomain::MQTT, "MQTT connected; availability=%s (online retained) cmd=%s%s",
                 s_topics.avail, s_topics.cmd, subOk ? "" : " (subscribe failed)");
    }

    s_lastConnected = true;
    mqtt.loop();
    return true;
}

void mqtt_begin(const MqttConfig &cfg, CommandHandlerFn cmdHandler)
{
    s_cfg = cfg;
    s_cmdHandler = cmdHandler;
    buildTopics();

    mqtt.setServer(cfg.host, cfg.port);
    mqtt.setKeepAlive(30);
    mqtt.setSocketTimeout(5);
    // Snapshot payload plus topic and header overhead.
    if (!mqtt.setBufferSize(CFG_PUBLISH_BUF_SIZE + 256u))
    {
        LOG_ERROR(LogDomain::MQTT, "MQTT buffer allocation failed size=%u", (unsigned)(CFG_PUBLISH_BUF_SIZE + 256u));
    }
    mqtt.setCallback(mqttCallback);
    s_initialized = true;

    logger_setMqttPublisher(mqtt_publishLog, mqtt_isConnected);

    LOG_INFO(LogDomain::MQTT, "MQTT init baseTopic=%s cmdTopic=%s stateTopic=%s",
             s_cfg.baseTopic, s_topics.cmd, s_topics.state);
    if (!s_cfg.user || s_cfg.user[0] == '\0')
    {
        LOG_WARN(LogDomain::MQTT, "MQTT credentials not set (MQTT_USER empty). Broker may reject connection.");
    }
}

void mqtt_tick()
{
    ensureConnected();
}

bool mqtt_takeReconnected()
{
    const bool r = s_reconnected;
    s_reconnected = false;
    return r;
}

bool mqtt_sendSnapshot(const char *payload, size_t len, void *ctx)
{
    (void)ctx;
    if (!mqtt.connected() || payload == nullptr)
        return false;

    const bool ok = mqtt.publish(s_topics.state, reinterpret_cast<const uint8_t *>(payload),
                                 static_cast<unsigned int>(len), false);
    if (!ok)
    {
        const int stateCode = mqtt.state();
        LOG_WARN_EVERY("mqtt_publish_state_fail", 5000, LogDomain::MQTT,
                       "MQTT publish failed topic=%s bytes=%u state=%d (%s)",
                       s_topics.state, (unsigned)len, stateCode, mqtt_stateToString(stateCode));
    }
    return ok;
}

bool mqtt_publishLog(const char *topicSuffix, const char *payload, bool retained)
{
    if (!mqtt.connected() || s_cfg.baseTopic == nullptr || payload == nullptr)
        return false;

    char topic[128];
    int n = 0;
    if (topicSuffix == nullptr || topicSuffix[0] == '\0')
        n = snprintf(topic, sizeof(topic), "%s", s_cfg.baseTopic);
    else
        n = snprintf(topic, sizeof(topic), "%s/%s", s_cfg.baseTopic, topicSuffix);
    if (n < 0 || n >= (int)sizeof(topic))
        return false;

    // No logging on failure: the logger itself calls this.
    return mqtt.publish(topic, payload, retained);
}

bool mqtt_publishAck(const char *reqId, const char *type, const char *status, const char *msg)
{
    if (!mqtt.connected())
        return false;

    StaticJsonDocument<256> doc;
    doc["request_id"] = reqId ? reqId : "";
    doc["type"] = type ? type : "";
    doc["status"] = status ? status : "";
    doc["message"] = msg ? msg : "";

    char buf[256];
    const size_t written = serializeJson(doc, buf, sizeof(buf));
    if (written == 0 || written >= sizeof(buf))
        return false;

    const bool ok = mqtt.publish(s_topics.ack, buf, false);
    if (!ok)
    {
        const int stateCode = mqtt.state();
        LOG_WARN_EVERY("mqtt_publish_ack_fail", 5000, LogDomain::MQTT,
                       "MQTT publish failed topic=%s bytes=%u state=%d (%s)",
                       s_topics.ack, (unsigned)written, stateCode, mqtt_stateToString(stateCode));
    }
    return ok;
}

bool mqtt_isConnected()
{
    return mqtt.connected();
}
