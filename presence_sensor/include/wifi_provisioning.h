#pragma once

#include <stdint.h>

struct WifiPortalConfig
{
    const char *hostname;   // DHCP hostname while connected
    const char *portalSsid; // AP name of the setup portal
    uint16_t portalTimeoutS;
};

// Open the "wifi" Preferences namespace and remember the portal identity.
void wifi_begin(const WifiPortalConfig &cfg);

// Kicks off a connect with saved credentials and backs off on timeout. The captive
// portal (blocking) opens only on request, or with nothing saved when
// CFG_WIFI_AUTO_PORTAL_ON_MISSING_CREDS is set.
void wifi_ensureConnected(uint32_t wifiTimeoutMs);

bool wifi_isConnected();

// Force captive portal on next loop without wiping credentials
void wifi_requestPortal();

// Wipe WiFi credentials and reboot into captive portal
void wifi_wipeCredentialsAndReboot();
