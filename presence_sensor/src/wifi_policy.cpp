#include "wifi_policy.h"

const char *wifiStepToString(WifiStep step)
{
    switch (step)
    {
    case WifiStep::CONNECTED:
        return "connected";
    case WifiStep::WAIT_CONNECT:
        return "wait_connect";
    case WifiStep::CONNECT_TIMED_OUT:
        return "connect_timed_out";
    case WifiStep::START_PORTAL:
        return "start_portal";
    case WifiStep::WAIT_PROVISIONING:
        return "wait_provisioning";
    case WifiStep::WAIT_RETRY:
        return "wait_retry";
    case WifiStep::BEGIN_CONNECT:
        return "begin_connect";
    default:
        return "unknown";
    }
}

WifiStep wifi_nextStep(const WifiLinkView &v)
{
    if (v.connected)
        return WifiStep::CONNECTED;

    if (v.connectInFlight)
    {
        const uint32_t timeoutMs = (v.connectTimeoutMs == 0u) ? 1u : v.connectTimeoutMs;
        return v.connectElapsedMs < timeoutMs ? WifiStep::WAIT_CONNECT : WifiStep::CONNECT_TIMED_OUT;
    }

    if (v.portalRequested)
        return WifiStep::START_PORTAL;

    if (!v.hasCredentials)
        return v.autoPortalOnMissingCreds ? WifiStep::START_PORTAL : WifiStep::WAIT_PROVISIONING;

    if (v.retryPending)
        return WifiStep::WAIT_RETRY;

    return WifiStep::BEGIN_CONNECT;
}

uint32_t wifi_nextBackoffMs(uint32_t backoffMs)
{
    if (backoffMs >= (CFG_WIFI_CONNECT_RETRY_MAX_MS / 2u))
        return CFG_WIFI_CONNECT_RETRY_MAX_MS;
    const uint32_t next = backoffMs * 2u;
    return next < CFG_WIFI_CONNECT_RETRY_MIN_MS ? CFG_WIFI_CONNECT_RETRY_MIN_MS : next;
}
