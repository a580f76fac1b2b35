#pragma once
#include <stddef.h>
#include <stdint.h>

// Optional config overrides (see config.h)
#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#endif

// — Hysteresis classifier —
#ifndef CFG_ENTER_THRESHOLD_DBM
#define CFG_ENTER_THRESHOLD_DBM -65.0f
#endif
#ifndef CFG_EXIT_THRESHOLD_DBM
#define CFG_EXIT_THRESHOLD_DBM -69.0f
#endif
#ifndef CFG_WINDOW_MS
#define CFG_WINDOW_MS 4000u
#endif
#ifndef CFG_PACKETS_REQUIRED
#define CFG_PACKETS_REQUIRED 4u
#endif

// — EWMA weight of the newest sample —
#ifndef CFG_ALPHA_NEAR
#define CFG_ALPHA_NEAR 0.3f // someone near: smoother tracking
#endif
#ifndef CFG_ALPHA_FAR
#define CFG_ALPHA_FAR 0.8f // nobody near: faster re-acquisition
#endif

// — Publish loop —
#ifndef CFG_BROADCAST_HZ
#define CFG_BROADCAST_HZ 5u
#endif
#ifndef CFG_TENANT_TIMEOUT_MS
#define CFG_TENANT_TIMEOUT_MS 10000u
#endif

// — Logo brightness feedback —
#ifndef CFG_BRIGHTNESS_MIN
#define CFG_BRIGHTNESS_MIN 10
#endif
#ifndef CFG_BRIGHTNESS_MAX
#define CFG_BRIGHTNESS_MAX 255
#endif
#ifndef CFG_BRIGHTNESS_STEP_UP
#define CFG_BRIGHTNESS_STEP_UP 30
#endif
#ifndef CFG_BRIGHTNESS_STEP_DOWN
#define CFG_BRIGHTNESS_STEP_DOWN 60
#endif

// — Registry reload —
#ifndef CFG_REGISTRY_DEBOUNCE_MS
#define CFG_REGISTRY_DEBOUNCE_MS 100u
#endif

// — Capacity limits (static storage) —
#ifndef CFG_MAX_TENANTS
#define CFG_MAX_TENANTS 16u
#endif
// Stamps kept per tenant window. 200 holds a 20 ms advertising interval (the BLE
// minimum) over the default 4 s window; faster senders saturate packetCount here.
#ifndef CFG_WINDOW_MAX_PACKETS
#define CFG_WINDOW_MAX_PACKETS 200u
#endif
#ifndef CFG_PENDING_RSSI_MAX
#define CFG_PENDING_RSSI_MAX 32u
#endif
#ifndef CFG_MAX_SUBSCRIBERS
#define CFG_MAX_SUBSCRIBERS 4u
#endif
#ifndef CFG_PUBLISH_BUF_SIZE
#define CFG_PUBLISH_BUF_SIZE 8192u
#endif

static_assert(CFG_ENTER_THRESHOLD_DBM > CFG_EXIT_THRESHOLD_DBM, "CFG_ENTER_THRESHOLD_DBM must be above CFG_EXIT_THRESHOLD_DBM");
static_assert(CFG_ALPHA_NEAR > 0.0f && CFG_ALPHA_NEAR <= 1.0f, "CFG_ALPHA_NEAR must be in (0..1]");
static_assert(CFG_ALPHA_FAR > 0.0f && CFG_ALPHA_FAR <= 1.0f, "CFG_ALPHA_FAR must be in (0..1]");
static_assert(CFG_BROADCAST_HZ > 0, "CFG_BROADCAST_HZ must be > 0");
static_assert(CFG_BRIGHTNESS_MIN < CFG_BRIGHTNESS_MAX, "CFG_BRIGHTNESS_MIN must be below CFG_BRIGHTNESS_MAX");
static_assert(CFG_PACKETS_REQUIRED > 0 && CFG_PACKETS_REQUIRED <= CFG_WINDOW_MAX_PACKETS,
              "CFG_PACKETS_REQUIRED must fit the packet window");
static_assert(CFG_MAX_TENANTS > 0 && CFG_MAX_TENANTS <= 255u, "CFG_MAX_TENANTS must be 1..255");
static_assert(CFG_WINDOW_MAX_PACKETS <= 0xFFFFu && CFG_PENDING_RSSI_MAX <= 0xFFFFu, "buffer counters are 16-bit");

// Runtime copy of the detection tuning; tests build their own.
struct PresenceConfig
{
    float enterThresholdDbm;
    float exitThresholdDbm;
    uint32_t windowMs;
    uint16_t packetsRequired;
    float alphaNear;
    float alphaFar;
    uint32_t tenantTimeoutMs;
};

struct FeedbackConfig
{
    int16_t minLevel;
    int16_t maxLevel;
    int16_t stepUp;
    int16_t stepDown;
};

PresenceConfig presence_defaultConfig();
FeedbackConfig feedback_defaultConfig();

// Returns false (and a short reason) when the config would break the classifier:
// a collapsed or inverted hysteresis band, alpha outside (0..1], or a packet gate
// the window cannot hold.
bool presence_validateConfig(const PresenceConfig &cfg, const char **reason);
bool feedback_validateConfig(const FeedbackConfig &cfg, const char **reason);
