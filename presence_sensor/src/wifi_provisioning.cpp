#include <WiFi.h>
#include <WiFiManager.h>
#include <Arduino.h>
#include <Preferences.h>

#include "wifi_provisioning.h"
#include "logger.h"
#include "wifi_policy.h"

#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#endif

static const char *PREF_KEY_FORCE_PORTAL = "force_portal";

static Preferences wifiPrefs;
static WifiPortalConfig s_cfg{};

static bool s_connectInFlight = false;
static uint32_t s_connectStartMs = 0;
static uint32_t s_retryAtMs = 0;
static uint32_t s_backoffMs = CFG_WIFI_CONNECT_RETRY_MIN_MS;
static bool s_loggedMissingCredentials = false;
static bool s_runtimePortalRequested = false;
static WifiStep s_lastStep = WifiStep::BEGIN_CONNECT;

static void resetConnectState()
{
    s_connectInFlight = false;
    s_connectStartMs = 0;
    s_retryAtMs = 0;
    s_backoffMs = CFG_WIFI_CONNECT_RETRY_MIN_MS;
}

void wifi_begin(const WifiPortalConfig &cfg)
{
    s_cfg = cfg;
    wifiPrefs.begin("wifi", false);
}

static void startPortal()
{
    LOG_INFO(LogDomain::WIFI, "Starting captive portal ssid=%s timeout_s=%u",
             s_cfg.portalSsid ? s_cfg.portalSsid : "", (unsigned)s_cfg.portalTimeoutS);
    // Clear the one-shot latches first so a failed portal cannot loop forever.
    s_runtimePortalRequested = false;
    wifiPrefs.putBool(PREF_KEY_FORCE_PORTAL, false);

    WiFi.mode(WIFI_STA);
    WiFi.disconnect(true, true);

    WiFiManager wm;
    wm.setConfigPortalTimeout(s_cfg.portalTimeoutS);
    wm.setConnectTimeout(20);
    wm.setConnectRetries(2);
    if (s_cfg.hostname)
        wm.setHostname(s_cfg.hostname);

    const bool ok = wm.startConfigPortal(s_cfg.portalSsid);
    resetConnectState();
    if (!ok)
    {
        LOG_WARN(LogDomain::WIFI, "Portal timed out or failed; scanning continues offline");
        return;
    }

    LOG_INFO(LogDomain::WIFI, "WiFi configured and connected ip=%s", WiFi.localIP().toString().c_str());
    s_loggedMissingCredentials = false;
}

void wifi_ensureConnected(uint32_t wifiTimeoutMs)
{
    const uint32_t now = millis();

    WifiLinkView view{};
    view.connected = WiFi.status() == WL_CONNECTED;
    view.connectInFlight = s_connectInFlight;
    view.connectElapsedMs = now - s_connectStartMs;
    view.connectTimeoutMs = wifiTimeoutMs;
    view.portalRequested = s_runtimePortalRequested || wifiPrefs.getBool(PREF_KEY_FORCE_PORTAL, false);
    view.hasCredentials = WiFi.SSID().length() > 0;
    view.retryPending = s_retryAtMs != 0 && (int32_t)(now - s_retryAtMs) < 0;
    view.autoPortalOnMissingCreds = CFG_WIFI_AUTO_PORTAL_ON_MISSING_CREDS != 0;

    const WifiStep step = wifi_nextStep(view);
    if (step != s_lastStep)
    {
        LOG_DEBUG(LogDomain::WIFI, "WiFi step %s -> %s", wifiStepToString(s_lastStep), wifiStepToString(step));
        s_lastStep = step;
    }

    switch (step)
    {
    case WifiStep::CONNECTED:
        if (s_connectInFlight)
        {
            LOG_INFO(LogDomain::WIFI, "Connected ip=%s rssi=%d connect_ms=%lu",
                     WiFi.localIP().toString().c_str(),
                     (int)WiFi.RSSI(),
                     (unsigned long)(now - s_connectStartMs));
        }
        resetConnectState();
        s_loggedMissingCredentials = false;
        return;

    case WifiStep::WAIT_CONNECT:
        return;

    case WifiStep::CONNECT_TIMED_OUT:
        LOG_WARN(LogDomain::WIFI, "WiFi connect timed out after %lums; retry_in_ms=%lu",
                 (unsigned long)(now - s_connectStartMs),
                 (unsigned long)s_backoffMs);
        WiFi.disconnect(false, false);
        s_connectInFlight = false;
        s_connectStartMs = 0;
        s_retryAtMs = now + s_backoffMs;
        s_backoffMs = wifi_nextBackoffMs(s_backoffMs);
        return;

    case WifiStep::START_PORTAL:
        if (!view.hasCredentials && !view.portalRequested && !s_loggedMissingCredentials)
        {
            LOG_WARN(LogDomain::WIFI, "No saved WiFi credentials; auto portal enabled");
            s_loggedMissingCredentials = true;
        }
        startPortal();
        return;

    case WifiStep::WAIT_PROVISIONING:
        if (!s_loggedMissingCredentials)
        {
            LOG_WARN(LogDomain::WIFI, "No saved WiFi credentials; scanning continues offline");
            s_loggedMissingCredentials = true;
        }
        LOG_INFO_EVERY("wifi_no_creds", 60000, LogDomain::WIFI,
                       "Setup portal not auto-started; run serial command 'wifi' to provision");
        return;

    case WifiStep::WAIT_RETRY:
        LOG_DEBUG_EVERY("wifi_wait_retry", 15000, LogDomain::WIFI,
                        "Waiting for WiFi retry now_ms=%lu retry_at_ms=%lu",
                        (unsigned long)now, (unsigned long)s_retryAtMs);
        return;

    case WifiStep::BEGIN_CONNECT:
        break;
    }

    WiFi.mode(WIFI_STA);
    if (s_cfg.hostname)
        WiFi.setHostname(s_cfg.hostname);
    LOG_INFO(LogDomain::WIFI, "Connecting to saved WiFi ssid=%s", WiFi.SSID().c_str());

    WiFi.begin();
    s_connectInFlight = true;
    s_connectStartMs = now;
    s_retryAtMs = 0;
}

bool wifi_isConnected()
{
    return WiFi.status() == WL_CONNECTED;
}

void wifi_requestPortal()
{
    LOG_INFO(LogDomain::WIFI, "Forcing captive portal");
    // Runtime request only; nothing persists across reboot.
    s_runtimePortalRequested = true;
    wifiPrefs.putBool(PREF_KEY_FORCE_PORTAL, false);
    WiFi.disconnect(true, true);
    resetConnectState();
}

void wifi_wipeCredentialsAndReboot()
{
    LOG_WARN(LogDomain::WIFI, "Wiping WiFi credentials and rebooting");
    WiFi.disconnect(true, true);
    wifiPrefs.putBool(PREF_KEY_FORCE_PORTAL, true);
    ESP.restart();
}
