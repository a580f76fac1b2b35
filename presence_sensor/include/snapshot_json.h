#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

// One published row. Strings are copied so the report outlives registry reloads.
struct TenantReport
{
    char tenantId[TENANT_ID_MAX];
    char macAddress[TENANT_MAC_MAX];
    bool isNear;
    float ewma;
    bool ewmaValid; // false -> "ewma": null
    uint16_t packetCount;
    int8_t rssis[CFG_PENDING_RSSI_MAX];
    uint16_t rssiCount;
};

struct PresenceSnapshot
{
    TenantReport rows[CFG_MAX_TENANTS];
    size_t count = 0;
};

enum class SnapshotJsonError : uint8_t
{
    OK = 0,
    DOC_OVERFLOW,
    OUT_TOO_SMALL,
    SERIALIZE_FAILED
};

const char *snapshotJsonErrorToString(SnapshotJsonError err);

// Writes the snapshot as a JSON array into outBuf (null-terminated):
// [{"tenantId":..,"macAddress":..,"isNear":..,"ewma":<num|null>,"packetCount":..,"extraRssis":[..]}]
// An empty snapshot serializes as "[]". packetCount saturates at CFG_WINDOW_MAX_PACKETS.
// Uses one file-static document; call from a single task.
SnapshotJsonError buildSnapshotJson(const PresenceSnapshot &snap, char *outBuf, size_t outSize, size_t *written);
