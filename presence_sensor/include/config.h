// Optional config overrides for the presence sensor firmware.
// Contract: values must be sane; this file should only define overrides.
#pragma once
// Copy any of the defines below to change detection or feedback tuning.

// — Presence detection —
// #define CFG_ENTER_THRESHOLD_DBM -65.0f // smoothed RSSI needed to become NEAR
// #define CFG_EXIT_THRESHOLD_DBM -69.0f  // drop-back point; must stay below ENTER
// #define CFG_WINDOW_MS 4000u
// #define CFG_PACKETS_REQUIRED 4u
// #define CFG_ALPHA_NEAR 0.3f
// #define CFG_ALPHA_FAR 0.8f

// — Publish —
// #define CFG_BROADCAST_HZ 5u
#define CFG_TENANT_TIMEOUT_MS 10000u

// — Logo brightness —
#define CFG_LOGO_LED_PIN 2
// #define CFG_BRIGHTNESS_MIN 10
// #define CFG_BRIGHTNESS_MAX 255
// #define CFG_BRIGHTNESS_STEP_UP 30
// #define CFG_BRIGHTNESS_STEP_DOWN 60

// — WiFi —
// #define CFG_WIFI_AUTO_PORTAL_ON_MISSING_CREDS 1 // open the blocking setup portal when nothing is saved

// — Registry —
// #define CFG_REGISTRY_DEBOUNCE_MS 100u
// #define CFG_REGISTRY_WATCH_POLL_MS 1000u

#ifndef CFG_LOG_COLOR
#define CFG_LOG_COLOR 0 // ANSI colorized Serial logs (0=off, 1=on)
#endif
#ifndef CFG_LOG_HIGH_FREQ_DEFAULT
#define CFG_LOG_HIGH_FREQ_DEFAULT 1 // High-frequency DEBUG/trace logs at boot (0=off, 1=on)
#endif
