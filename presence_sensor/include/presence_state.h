#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_config.h"

static constexpr size_t TENANT_MAC_MAX = 18; // "AA:BB:CC:DD:EE:FF" + NUL
static constexpr size_t TENANT_ID_MAX = 48;

static_assert(TENANT_MAC_MAX == 18, "MAC buffer must fit 17 chars + NUL");

// Arrival times of the packets seen within the last window (ring buffer, oldest first).
struct PacketWindow
{
    uint32_t stampsMs[CFG_WINDOW_MAX_PACKETS] = {0};
    uint16_t head = 0; // index of the oldest entry
    uint16_t count = 0;
};

// Raw samples recorded since the last publish tick; drained by the tick.
struct RssiBuffer
{
    int8_t samples[CFG_PENDING_RSSI_MAX] = {0};
    uint16_t count = 0;
    uint32_t dropped = 0; // samples lost to a full buffer since boot
};

struct Tenant
{
    char macAddress[TENANT_MAC_MAX] = {0}; // normalized, unique key
    char tenantId[TENANT_ID_MAX] = {0};

    // Live tracking state. Never reset for a MAC that survives a registry reload.
    float ewma = 0.0f;
    bool ewmaValid = false; // false until the first observation seeds the average
    PacketWindow window;
    bool isNear = false;
    uint32_t lastSeenMs = 0;
    bool lastSeenValid = false;
    RssiBuffer pendingRssi;
};

struct RegistryEntry
{
    char tenantId[TENANT_ID_MAX] = {0};
    char mac[TENANT_MAC_MAX] = {0}; // normalized
};

// Immutable point-in-time read of the external tenant registry.
struct RegistrySnapshot
{
    RegistryEntry entries[CFG_MAX_TENANTS];
    size_t count = 0;
};

struct FeedbackState
{
    int16_t level = 0;
    uint32_t writeFailures = 0;
};

// One engine instance owns everything the cooperative loop mutates.
// Contract: only touched from the loop task; foreign tasks go through queues.
struct PresenceEngine
{
    PresenceConfig cfg{};
    FeedbackConfig feedbackCfg{};
    float alpha = 0.0f; // process-wide EWMA weight, adapted once per publish tick

    Tenant tenants[CFG_MAX_TENANTS];
    size_t tenantCount = 0;

    // Reconcile staging area; kept here so no large arrays land on the loop stack.
    Tenant staging[CFG_MAX_TENANTS];

    RegistrySnapshot applied; // last snapshot reconciled into `tenants`
    bool hasApplied = false;

    FeedbackState feedback;

    uint32_t observationsIgnored = 0;
    uint32_t observationsApplied = 0;
};

// Strongly typed record handed over by the BLE scanning collaborator.
struct Observation
{
    char mac[TENANT_MAC_MAX] = {0}; // as reported by the scanner; normalized on ingest
    int8_t rssiDbm = 0;
    uint32_t observedAtMs = 0;
};
