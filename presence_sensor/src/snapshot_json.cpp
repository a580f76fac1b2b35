#include "snapshot_json.h"

#include <ArduinoJson.h>

namespace
{
static constexpr size_t kRowMembers = 6;

// Capacity: root array + one object per tenant + one rssi array per tenant + copied strings.
static constexpr size_t kSnapshotJsonCapacity =
    JSON_ARRAY_SIZE(CFG_MAX_TENANTS) +
    CFG_MAX_TENANTS * (JSON_OBJECT_SIZE(kRowMembers) + JSON_ARRAY_SIZE(CFG_PENDING_RSSI_MAX)) +
    CFG_MAX_TENANTS * (JSON_STRING_SIZE(TENANT_ID_MAX) + JSON_STRING_SIZE(TENANT_MAC_MAX)) +
    64;

// Reused across ticks; buildSnapshotJson runs on the loop task only.
static StaticJsonDocument<kSnapshotJsonCapacity> s_doc;
} // namespace

const char *snapshotJsonErrorToString(SnapshotJsonError err)
{
    switch (err)
    {
    case SnapshotJsonError::OK:
        return "ok";
    case SnapshotJsonError::DOC_OVERFLOW:
        return "doc_overflow";
    case SnapshotJsonError::OUT_TOO_SMALL:
        return "out_too_small";
    case SnapshotJsonError::SERIALIZE_FAILED:
        return "serialize_failed";
    default:
        return "unknown";
    }
}

SnapshotJsonError buildSnapshotJson(const PresenceSnapshot &snap, char *outBuf, size_t outSize, size_t *written)
{
    if (written)
        *written = 0;
    if (!outBuf || outSize == 0)
        return SnapshotJsonError::OUT_TOO_SMALL;
    outBuf[0] = '\0';

    JsonDocument &doc = s_doc;
    doc.clear();
    JsonArray root = doc.to<JsonArray>();

    for (size_t i = 0; i < snap.count; ++i)
    {
        const TenantReport &r = snap.rows[i];
        JsonObject row = root.createNestedObject();
        row["tenantId"] = r.tenantId;
        row["macAddress"] = r.macAddress;
        row["isNear"] = r.isNear;
        if (r.ewmaValid)
            row["ewma"] = r.ewma;
        else
            row["ewma"] = static_cast<const char *>(nullptr);
        // Window length, capped at CFG_WINDOW_MAX_PACKETS.
        row["packetCount"] = r.packetCount;

        JsonArray rssis = row.createNestedArray("extraRssis");
        for (uint16_t k = 0; k < r.rssiCount; ++k)
        {
            rssis.add((int)r.rssis[k]);
        }
    }

    if (doc.overflowed())
        return SnapshotJsonError::DOC_OVERFLOW;

    const size_t required = measureJson(doc);
    if (required >= outSize)
        return SnapshotJsonError::OUT_TOO_SMALL;

    const size_t n = serializeJson(doc, outBuf, outSize);
    if (n == 0 || n >= outSize)
    {
        outBuf[0] = '\0';
        return SnapshotJsonError::SERIALIZE_FAILED;
    }
    outBuf[n] = '\0';
    if (written)
        *written = n;
    return SnapshotJsonError::OK;
}
