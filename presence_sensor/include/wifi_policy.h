#pragma once
#include <stdint.h>

#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#endif

// 0: a device with no saved credentials keeps scanning offline until the serial
// "wifi" command opens the portal. 1: open the (blocking) portal on its own.
#ifndef CFG_WIFI_AUTO_PORTAL_ON_MISSING_CREDS
#define CFG_WIFI_AUTO_PORTAL_ON_MISSING_CREDS 0
#endif
#ifndef CFG_WIFI_CONNECT_RETRY_MIN_MS
#define CFG_WIFI_CONNECT_RETRY_MIN_MS 5000u
#endif
#ifndef CFG_WIFI_CONNECT_RETRY_MAX_MS
#define CFG_WIFI_CONNECT_RETRY_MAX_MS 300000u
#endif

// What wifi_ensureConnected should do on this pass.
enum class WifiStep : uint8_t
{
    CONNECTED = 0,
    WAIT_CONNECT,
    CONNECT_TIMED_OUT,
    START_PORTAL,
    WAIT_PROVISIONING, // no credentials and no portal request
    WAIT_RETRY,
    BEGIN_CONNECT
};

struct WifiLinkView
{
    bool connected;
    bool connectInFlight;
    uint32_t connectElapsedMs;
    uint32_t connectTimeoutMs;
    bool portalRequested; // serial command or the persisted wipe latch
    bool hasCredentials;
    bool retryPending;    // backoff deadline not reached yet
    bool autoPortalOnMissingCreds;
};

const char *wifiStepToString(WifiStep step);

// Pure decision for one pass; the caller owns the side effects.
WifiStep wifi_nextStep(const WifiLinkView &v);

// Doubles the retry delay, clamped to [CFG_WIFI_CONNECT_RETRY_MIN_MS, CFG_WIFI_CONNECT_RETRY_MAX_MS].
uint32_t wifi_nextBackoffMs(uint32_t backoffMs);
