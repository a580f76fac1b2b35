#include "commands.h"

#include <ArduinoJson.h>
#include <string.h>

#include "logger.h"
#include "registry_source.h"

static CommandsContext s_ctx = {};
static bool s_hasCtx = false;

// Scratch for set_registry; lives outside the loop stack.
static RegistrySnapshot s_snapshot;
static char s_registryJson[CFG_MAX_TENANTS * 96 + 64];

const char *cmdStatusToString(CmdStatus st)
{
    switch (st)
    {
    case CmdStatus::RECEIVED:
        return "received";
    case CmdStatus::APPLIED:
        return "applied";
    case CmdStatus::REJECTED:
        return "rejected";
    case CmdStatus::ERROR:
        return "error";
    default:
        return "unknown";
    }
}

void commands_begin(const CommandsContext &ctx)
{
    s_ctx = ctx;
    s_hasCtx = true;
}

static CmdStatus finish(const char *requestId, const char *type, CmdStatus st, const char *msg)
{
    if (st == CmdStatus::APPLIED)
    {
        LOG_INFO(LogDomain::COMMAND, "%s (%s): %s", type, requestId, msg);
    }
    else
    {
        LOG_WARN(LogDomain::COMMAND, "%s (%s) %s: %s", type[0] ? type : "unknown", requestId,
                 cmdStatusToString(st), msg);
    }

    if (s_ctx.publishAck)
    {
        s_ctx.publishAck(requestId, type, cmdStatusToString(st), msg);
    }
    return st;
}

static CmdStatus handleSetRegistry(const char *requestId, const char *type, JsonObjectConst data)
{
    if (!s_ctx.writeRegistry)
        return finish(requestId, type, CmdStatus::ERROR, "no_storage");

    if (data.isNull() || !data.containsKey(REGISTRY_LIST_KEY))
        return finish(requestId, type, CmdStatus::REJECTED, "missing_tenantsAndMacs");

    // Re-serialize the data object and push it through the same parser the file uses.
    const size_t needed = measureJson(data);
    if (needed >= sizeof(s_registryJson))
        return finish(requestId, type, CmdStatus::REJECTED, "registry_too_large");
    const size_t n = serializeJson(data, s_registryJson, sizeof(s_registryJson));

    const RegistryParseError err = registry_parseJson(s_registryJson, n, s_snapshot);
    if (err != RegistryParseError::OK)
        return finish(requestId, type, CmdStatus::REJECTED, registryParseErrorToString(err));
    if (!s_ctx.writeRegistry(s_snapshot))
        return finish(requestId, type, CmdStatus::ERROR, "write_failed");
    return finish(requestId, type, CmdStatus::APPLIED, "written");
}

CmdStatus commands_handle(const uint8_t *payload, size_t len)
{
    if (!s_hasCtx)
    {
        LOG_ERROR(LogDomain::COMMAND, "Command dropped: handler not initialized");
        return CmdStatus::ERROR;
    }

    DynamicJsonDocument doc(CFG_MAX_TENANTS * 160 + 512);
    DeserializationError err = deserializeJson(doc, payload, len);
    if (err)
    {
        return finish("", "unknown", CmdStatus::REJECTED, "invalid_json");
    }

    const int schema = doc["schema"] | 0;
    const char *requestId = doc["request_id"] | "";
    const char *type = doc["type"] | "";

    if (schema != CMD_SCHEMA_VERSION || strlen(type) == 0)
    {
        return finish(requestId, type, CmdStatus::REJECTED, "invalid_schema_or_type");
    }

    LOG_DEBUG(LogDomain::COMMAND, "Command received: %s (%s)", type, requestId);
    JsonObjectConst data = doc["data"].as<JsonObjectConst>();

    if (strcmp(type, "reload_registry") == 0)
    {
        if (!s_ctx.reloadRegistry)
            return finish(requestId, type, CmdStatus::ERROR, "no_registry");
        const bool changed = s_ctx.reloadRegistry();
        return finish(requestId, type, CmdStatus::APPLIED, changed ? "changed" : "unchanged");
    }

    if (strcmp(type, "set_registry") == 0)
    {
        return handleSetRegistry(requestId, type, data);
    }

    if (strcmp(type, "publish") == 0 || strcmp(type, "watch") == 0)
    {
        if (data.isNull() || !data.containsKey("enabled") || !data["enabled"].is<bool>())
            return finish(requestId, type, CmdStatus::REJECTED, "missing_enabled");

        const bool enabled = data["enabled"].as<bool>();
        void (*setter)(bool) = (type[0] == 'p') ? s_ctx.setPublishEnabled : s_ctx.setWatchEnabled;
        if (!setter)
            return finish(requestId, type, CmdStatus::ERROR, "not_supported");
        setter(enabled);
        return finish(requestId, type, CmdStatus::APPLIED, enabled ? "enabled" : "disabled");
    }

    return finish(requestId, type, CmdStatus::REJECTED, "unknown_type");
}
