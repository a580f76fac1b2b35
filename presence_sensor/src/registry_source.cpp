#include "registry_source.h"

#include <ArduinoJson.h>
#include <string.h>

#include "logger.h"
#include "mac_address.h"
#include "tenant_registry.h"

namespace
{
// Accept up to twice the tracked capacity so oversized files truncate instead of failing.
static constexpr size_t kMaxParsedEntries = CFG_MAX_TENANTS * 2;
static constexpr size_t kMaxIdLen = TENANT_ID_MAX * 2;
static constexpr size_t kMaxMacLen = 24;

static constexpr size_t kRegistryJsonCapacity =
    JSON_OBJECT_SIZE(1) +
    JSON_ARRAY_SIZE(kMaxParsedEntries) +
    kMaxParsedEntries * JSON_OBJECT_SIZE(2) +
    kMaxParsedEntries * (JSON_STRING_SIZE(kMaxIdLen) + JSON_STRING_SIZE(kMaxMacLen)) +
    64; // keys and headroom
} // namespace

const char *registryParseErrorToString(RegistryParseError err)
{
    switch (err)
    {
    case RegistryParseError::OK:
        return "ok";
    case RegistryParseError::EMPTY_INPUT:
        return "empty_input";
    case RegistryParseError::INVALID_JSON:
        return "invalid_json";
    case RegistryParseError::TOO_LARGE:
        return "too_large";
    case RegistryParseError::BAD_SHAPE:
        return "bad_shape";
    case RegistryParseError::BAD_ENTRY:
        return "bad_entry";
    case RegistryParseError::BAD_MAC:
        return "bad_mac";
    case RegistryParseError::READ_FAILED:
        return "read_failed";
    default:
        return "unknown";
    }
}

static RegistryParseError fail(RegistrySnapshot &out, RegistryParseError err)
{
    registry_clearSnapshot(out);
    return err;
}

RegistryParseError registry_parseJson(const char *json, size_t len, RegistrySnapshot &out)
{
    registry_clearSnapshot(out);

    size_t start = 0;
    while (json && start < len && (json[start] == ' ' || json[start] == '\n' || json[start] == '\r' || json[start] == '\t'))
        ++start;
    if (!json || start >= len)
        return RegistryParseError::EMPTY_INPUT;

    DynamicJsonDocument doc(kRegistryJsonCapacity);
    const DeserializationError err = deserializeJson(doc, json, len);
    if (err == DeserializationError::NoMemory)
    {
        LOG_WARN(LogDomain::REGISTRY, "Registry document exceeds %u bytes of parse capacity", (unsigned)kRegistryJsonCapacity);
        return fail(out, RegistryParseError::TOO_LARGE);
    }
    if (err)
    {
        LOG_WARN(LogDomain::REGISTRY, "Registry JSON invalid: %s", err.c_str());
        return fail(out, RegistryParseError::INVALID_JSON);
    }

    if (!doc.is<JsonObject>())
        return fail(out, RegistryParseError::BAD_SHAPE);

    JsonVariantConst list = doc.as<JsonObjectConst>()[REGISTRY_LIST_KEY];
    if (list.isNull())
    {
        // No list at all reads as "no tenants".
        return RegistryParseError::OK;
    }
    if (!list.is<JsonArrayConst>())
        return fail(out, RegistryParseError::BAD_SHAPE);

    size_t skipped = 0;
    for (JsonVariantConst item : list.as<JsonArrayConst>())
    {
        if (!item.is<JsonObjectConst>())
            return fail(out, RegistryParseError::BAD_ENTRY);

        const char *id = item["id"] | (const char *)nullptr;
        const char *mac = item["mac"] | (const char *)nullptr;
        if (!id || id[0] == '\0' || strlen(id) >= TENANT_ID_MAX)
            return fail(out, RegistryParseError::BAD_ENTRY);

        char normalized[TENANT_MAC_MAX];
        if (!mac_normalize(mac, normalized, sizeof(normalized)))
        {
            LOG_WARN(LogDomain::REGISTRY, "Registry entry id=%s has bad MAC '%s'", id, mac ? mac : "");
            return fail(out, RegistryParseError::BAD_MAC);
        }

        if (out.count >= CFG_MAX_TENANTS)
        {
            skipped++;
            continue;
        }
        registry_snapshotAdd(out, id, normalized);
    }

    if (skipped > 0)
    {
        LOG_WARN(LogDomain::REGISTRY, "Registry lists %u entries beyond capacity %u; ignored",
                 (unsigned)skipped, (unsigned)CFG_MAX_TENANTS);
    }
    return RegistryParseError::OK;
}

bool registry_buildJson(const RegistrySnapshot &snapshot, char *outBuf, size_t outSize, size_t *written)
{
    if (written)
        *written = 0;
    if (!outBuf || outSize == 0)
        return false;
    outBuf[0] = '\0';

    DynamicJsonDocument doc(kRegistryJsonCapacity);
    JsonArray list = doc.createNestedArray(REGISTRY_LIST_KEY);
    for (size_t i = 0; i < snapshot.count; ++i)
    {
        JsonObject entry = list.createNestedObject();
        entry["id"] = snapshot.entries[i].tenantId;
        entry["mac"] = snapshot.entries[i].mac;
    }
    if (doc.overflowed())
        return false;

    const size_t required = measureJson(doc);
    if (required >= outSize)
        return false;

    const size_t n = serializeJson(doc, outBuf, outSize);
    if (n == 0 || n >= outSize)
    {
        outBuf[0] = '\0';
        return false;
    }
    outBuf[n] = '\0';
    if (written)
        *written = n;
    return true;
}
