#include <Arduino.h>
#include <ctype.h>
#include <string.h>
#include <esp_system.h>

#include "main.h"
#include "ble_observer.h"
#include "brightness_actuator.h"
#include "commands.h"
#include "logger.h"
#include "mqtt_transport.h"
#include "presence_engine.h"
#include "publish_loop.h"
#include "registry_bridge.h"
#include "registry_store.h"
#include "registry_watch.h"
#include "tenant_registry.h"
#include "version.h"
#include "wifi_provisioning.h"

// Optional config overrides (see config.h)
#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#if __has_include("secrets.h")
#include "secrets.h"
#endif
#endif

// Broker details normally come from secrets.h (see secrets.example.h).
#ifndef MQTT_HOST
#define MQTT_HOST "192.168.0.10"
#endif
#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif
#ifndef MQTT_USER
#define MQTT_USER ""
#endif
#ifndef MQTT_PASS
#define MQTT_PASS ""
#endif

// ===== Device identity =====
static const char *MQTT_CLIENT_ID = "presence-sensor-esp32";
static const char *BASE_TOPIC = "presence/presence_sensor";
static const char *HOSTNAME = "presence-sensor";
static const char *PORTAL_SSID = "PresenceSensor-Setup";

static constexpr size_t SERIAL_CMD_BUF = 64;
static constexpr char SERIAL_CMD_DELIMS[] = " \t";
static const uint32_t WIFI_TIMEOUT_MS = 20000;
static const char *SUBSCRIBER_MQTT = "mqtt";
static const char *SUBSCRIBER_SERIAL = "serial";

// ===== Runtime state (owned by this module) =====
static PresenceEngine g_engine;
static PublishLoop g_publish;
static RegistryBridge g_bridge;
static bool s_engineReady = false;

static void windowFast();
static void windowBle();
static void windowRegistry();
static void windowPublish();
static void windowMqtt();

struct LoopWindow
{
  const char *name;
  uint32_t intervalMs;
  uint32_t lastMs;
  void (*fn)();
};

static void runWindow(LoopWindow &w, uint32_t now)
{
  if (w.intervalMs == 0 || (uint32_t)(now - w.lastMs) >= w.intervalMs)
  {
    w.fn();
    w.lastMs = now;
  }
}

// ----------------- Helpers -----------------

static uint32_t clockMillis()
{
  return millis();
}

static void serialLineWriter(const char *line)
{
  Serial.println(line);
}

static const char *mapResetReason(esp_reset_reason_t reason)
{
  switch (reason)
  {
  case ESP_RST_POWERON:
    return "power_on";
  case ESP_RST_SW:
    return "software";
  case ESP_RST_PANIC:
    return "panic";
  case ESP_RST_INT_WDT:
  case ESP_RST_TASK_WDT:
  case ESP_RST_WDT:
    return "watchdog";
  case ESP_RST_BROWNOUT:
    return "brownout";
  case ESP_RST_DEEPSLEEP:
    return "deep_sleep";
  default:
    return "other";
  }
}

static void printHelpMenu()
{
  LOG_INFO(LogDomain::SYSTEM, "Serial commands:");
  LOG_INFO(LogDomain::SYSTEM, "  tenants -> list tracked tenants with live state");
  LOG_INFO(LogDomain::SYSTEM, "  status  -> link, publish, watcher and log switches");
  LOG_INFO(LogDomain::SYSTEM, "  reload  -> re-read the registry file now");
  LOG_INFO(LogDomain::SYSTEM, "  stream on/off -> print each snapshot on this console");
  LOG_INFO(LogDomain::SYSTEM, "  publish start/stop -> run or pause the publish loop");
  LOG_INFO(LogDomain::SYSTEM, "  watch start/stop -> follow or ignore registry file changes");
  LOG_INFO(LogDomain::SYSTEM, "  log hf on/off -> enable/disable high-frequency logs");
  LOG_INFO(LogDomain::SYSTEM, "  wifi  -> start WiFi captive portal (setup mode)");
  LOG_INFO(LogDomain::SYSTEM, "  wipewifi -> clear WiFi creds + reboot into setup portal");
  LOG_INFO(LogDomain::SYSTEM, "  help  -> show this menu");
}

static bool readSerialLine(char *buf, size_t bufSize)
{
  if (!buf || bufSize < 2 || !Serial.available())
  {
    return false;
  }

  size_t len = Serial.readBytesUntil('\n', buf, bufSize - 1);
  if (len == 0)
  {
    return false;
  }

  while (len > 0 && (buf[len - 1] == '\r' || buf[len - 1] == '\n' || buf[len - 1] == ' ' || buf[len - 1] == '\t'))
  {
    len--;
  }
  buf[len] = '\0';

  size_t start = 0;
  while (buf[start] == ' ' || buf[start] == '\t')
  {
    start++;
  }
  if (start > 0)
  {
    memmove(buf, buf + start, len - start + 1);
    len -= start;
  }

  for (size_t i = 0; i < len; i++)
  {
    buf[i] = (char)tolower((unsigned char)buf[i]);
  }

  return buf[0] != '\0';
}

// Second subscriber: one JSON line per tick on the console.
static bool serialSendSnapshot(const char *payload, size_t len, void * /*ctx*/)
{
  const size_t written = Serial.write(reinterpret_cast<const uint8_t *>(payload), len);
  Serial.write('\n');
  return written == len;
}

// ---------------- App actions (shared by serial and MQTT commands) ----------------

static bool reloadRegistry()
{
  return bridge_reloadNow(g_bridge, g_engine, "command");
}

static void setPublishEnabled(bool enabled)
{
  if (enabled)
  {
    publish_start(g_publish, millis());
  }
  else
  {
    publish_stop(g_publish);
  }
}

static void setWatchEnabled(bool enabled)
{
  registry_watchSetEnabled(enabled);
  if (enabled)
  {
    bridge_start(g_bridge);
  }
  else
  {
    bridge_stop(g_bridge);
  }
}

static void setSerialStream(bool enabled)
{
  if (enabled)
  {
    subscribers_add(g_publish.subscribers, SUBSCRIBER_SERIAL, serialSendSnapshot, nullptr);
  }
  else if (!subscribers_remove(g_publish.subscribers, SUBSCRIBER_SERIAL))
  {
    LOG_INFO(LogDomain::SYSTEM, "Serial stream was not active");
  }
}

static void dispatchCommand(const uint8_t *payload, size_t len)
{
  const CmdStatus st = commands_handle(payload, len);
  LOG_DEBUG(LogDomain::COMMAND, "Command finished status=%s", cmdStatusToString(st));
}

static bool parseOnOff(const char *arg, const char *onWord, const char *offWord, bool &out)
{
  if (!arg)
  {
    return false;
  }
  if (strcmp(arg, onWord) == 0)
  {
    out = true;
    return true;
  }
  if (strcmp(arg, offWord) == 0)
  {
    out = false;
    return true;
  }
  return false;
}

static void handleSerialCommands()
{
  char line[SERIAL_CMD_BUF];
  if (!readSerialLine(line, sizeof(line)))
  {
    return;
  }

  char *save = nullptr;
  char *cmd = strtok_r(line, SERIAL_CMD_DELIMS, &save);
  if (!cmd || *cmd == '\0')
  {
    return;
  }

  if (strcmp(cmd, "tenants") == 0)
  {
    registry_logTenants(g_engine, millis());
    LOG_INFO(LogDomain::SYSTEM, "alpha=%.2f brightness=%d subscribers=%u ble_dropped=%lu ignored=%lu",
             g_engine.alpha, (int)g_engine.feedback.level,
             (unsigned)subscribers_count(g_publish.subscribers),
             (unsigned long)ble_observerDropped(),
             (unsigned long)g_engine.observationsIgnored);
    return;
  }
  if (strcmp(cmd, "status") == 0)
  {
    LOG_INFO(LogDomain::SYSTEM, "wifi=%s mqtt=%s publish=%s watcher=%s bridge=%s log_hf=%s",
             wifi_isConnected() ? "up" : "down",
             mqtt_isConnected() ? "up" : "down",
             publish_isRunning(g_publish) ? "running" : "stopped",
             registry_watchIsEnabled() ? "on" : "paused",
             bridge_isRunning(g_bridge) ? "running" : "stopped",
             logger_isHighFreqEnabled() ? "on" : "off");
    return;
  }
  if (strcmp(cmd, "reload") == 0)
  {
    reloadRegistry();
    return;
  }

  bool enabled = false;
  if (strcmp(cmd, "stream") == 0)
  {
    if (parseOnOff(strtok_r(nullptr, SERIAL_CMD_DELIMS, &save), "on", "off", enabled))
    {
      setSerialStream(enabled);
      return;
    }
    printHelpMenu();
    return;
  }
  if (strcmp(cmd, "publish") == 0)
  {
    if (parseOnOff(strtok_r(nullptr, SERIAL_CMD_DELIMS, &save), "start", "stop", enabled))
    {
      setPublishEnabled(enabled);
      return;
    }
    printHelpMenu();
    return;
  }
  if (strcmp(cmd, "watch") == 0)
  {
    if (parseOnOff(strtok_r(nullptr, SERIAL_CMD_DELIMS, &save), "start", "stop", enabled))
    {
      setWatchEnabled(enabled);
      return;
    }
    printHelpMenu();
    return;
  }

  if (strcmp(cmd, "log") == 0)
  {
    const char *arg1 = strtok_r(nullptr, SERIAL_CMD_DELIMS, &save);
    const char *arg2 = strtok_r(nullptr, SERIAL_CMD_DELIMS, &save);
    if (arg1 && strcmp(arg1, "hf") == 0 && parseOnOff(arg2, "on", "off", enabled))
    {
      logger_setHighFreqEnabled(enabled);
      LOG_INFO(LogDomain::SYSTEM, "High-frequency logging %s (serial command)", enabled ? "enabled" : "disabled");
      return;
    }
    printHelpMenu();
    return;
  }

  if (strcmp(cmd, "wifi") == 0)
  {
    wifi_requestPortal();
    return;
  }
  if (strcmp(cmd, "wipewifi") == 0)
  {
    wifi_wipeCredentialsAndReboot();
    return;
  }

  printHelpMenu();
}

// ---------------- Loop windows ----------------

static void windowFast()
{
  wifi_ensureConnected(WIFI_TIMEOUT_MS);
  handleSerialCommands();
  registry_watchDrain(g_bridge, millis());
}

static void windowBle()
{
  if (s_engineReady)
  {
    ble_observerDrain(g_engine);
  }
}

static void windowRegistry()
{
  if (s_engineReady)
  {
    bridge_poll(g_bridge, g_engine, millis());
  }
}

static void windowPublish()
{
  if (s_engineReady)
  {
    publish_poll(g_publish, g_engine, millis());
  }
}

static void windowMqtt()
{
  mqtt_tick();
  // The link is dropped from the subscriber set on a failed send; add it back once connected.
  if (mqtt_takeReconnected() && !subscribers_contains(g_publish.subscribers, SUBSCRIBER_MQTT))
  {
    subscribers_add(g_publish.subscribers, SUBSCRIBER_MQTT, mqtt_sendSnapshot, nullptr);
  }
}

static LoopWindow g_windows[] = {
    {"FAST", 0u, 0u, windowFast},
    {"BLE", 0u, 0u, windowBle},
    {"REGISTRY", 10u, 0u, windowRegistry},
    {"PUBLISH", 0u, 0u, windowPublish},
    {"MQTT", 0u, 0u, windowMqtt}};

// ---------------- Arduino lifecycle ----------------

// Contract: call once after boot. Loads the registry before scanning starts.
void appSetup()
{
  Serial.begin(115200);
  delay(1500);
  logger_setLineWriter(serialLineWriter);
  logger_setClock(clockMillis);
  logger_begin(BASE_TOPIC, true, true);
  LOG_INFO(LogDomain::SYSTEM, "BOOT presence_sensor %s starting...", FW_VERSION);
  LOG_INFO(LogDomain::SYSTEM, "Reset reason=%s", mapResetReason(esp_reset_reason()));

  const PresenceConfig cfg = presence_defaultConfig();
  const FeedbackConfig feedbackCfg = feedback_defaultConfig();
  LOG_INFO(LogDomain::SYSTEM, "Thresholds enter=%.1f dBm exit=%.1f dBm window=%lu ms packets=%u",
           cfg.enterThresholdDbm, cfg.exitThresholdDbm, (unsigned long)cfg.windowMs, (unsigned)cfg.packetsRequired);
  LOG_INFO(LogDomain::SYSTEM, "Alpha near=%.2f far=%.2f timeout=%lu ms broadcast=%u Hz",
           cfg.alphaNear, cfg.alphaFar, (unsigned long)cfg.tenantTimeoutMs, (unsigned)CFG_BROADCAST_HZ);
  LOG_INFO(LogDomain::SYSTEM, "Brightness %d..%d step up=%d down=%d",
           (int)feedbackCfg.minLevel, (int)feedbackCfg.maxLevel, (int)feedbackCfg.stepUp, (int)feedbackCfg.stepDown);

  s_engineReady = engine_init(g_engine, cfg, feedbackCfg);
  if (!s_engineReady)
  {
    LOG_ERROR(LogDomain::SYSTEM, "Presence engine refused its configuration; scanning disabled");
  }

  WifiPortalConfig wifiCfg{
      .hostname = HOSTNAME,
      .portalSsid = PORTAL_SSID,
      .portalTimeoutS = 180};
  wifi_begin(wifiCfg);

  if (!brightness_begin(g_engine.feedback.level))
  {
    LOG_WARN(LogDomain::ACTUATOR, "Logo LED unavailable; brightness writes will fail");
  }

  registry_storeBegin();
  bridge_begin(g_bridge, registry_storeRead, nullptr, CFG_REGISTRY_DEBOUNCE_MS);
  publish_begin(g_publish, CFG_BROADCAST_HZ, brightness_write, nullptr);

  if (s_engineReady)
  {
    bridge_reloadNow(g_bridge, g_engine, "startup");
    bridge_start(g_bridge);
    if (!registry_watchBegin())
    {
      LOG_WARN(LogDomain::REGISTRY, "Registry watcher not running; use 'reload' after editing the file");
    }
    if (!ble_observerBegin())
    {
      LOG_ERROR(LogDomain::BLE, "BLE observer failed to start; no tenant will be seen");
    }
    publish_start(g_publish, millis());
  }
  printHelpMenu();

  CommandsContext cmdCtx{
      .reloadRegistry = reloadRegistry,
      .writeRegistry = registry_storeWrite,
      .setPublishEnabled = setPublishEnabled,
      .setWatchEnabled = setWatchEnabled,
      .publishAck = mqtt_publishAck};
  commands_begin(cmdCtx);

  MqttConfig mqttCfg{
      .host = MQTT_HOST,
      .port = MQTT_PORT,
      .clientId = MQTT_CLIENT_ID,
      .user = MQTT_USER,
      .pass = MQTT_PASS,
      .baseTopic = BASE_TOPIC};
  mqtt_begin(mqttCfg, dispatchCommand);
}

// Contract: called frequently from the Arduino loop; must remain non-blocking.
void appLoop()
{
  const uint32_t now = millis();
  for (LoopWindow &w : g_windows)
  {
    runWindow(w, now);
  }
}
