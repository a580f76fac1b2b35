#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

static constexpr int CMD_SCHEMA_VERSION = 1;

enum class CmdStatus : uint8_t
{
    RECEIVED = 0,
    APPLIED,
    REJECTED,
    ERROR
};

static_assert(static_cast<uint8_t>(CmdStatus::ERROR) == 3, "CmdStatus values must be stable");

const char *cmdStatusToString(CmdStatus st);

// Callback bundle that lets commands reach the app without globals.
// Command shape: {"schema":1,"request_id":"..","type":"..","data":{..}}
struct CommandsContext
{
    // Immediate reload from storage; true when the tracked set changed.
    bool (*reloadRegistry)();
    // Persist a validated registry; the watcher notices the new file.
    bool (*writeRegistry)(const RegistrySnapshot &snapshot);
    void (*setPublishEnabled)(bool enabled);
    void (*setWatchEnabled)(bool enabled);

    bool (*publishAck)(const char *requestId, const char *type, const char *status, const char *msg);
};

// Initialize command handling with app-owned context.
void commands_begin(const CommandsContext &ctx);

// payload is raw MQTT bytes (not null terminated)
// Returns the final status that was acked.
CmdStatus commands_handle(const uint8_t *payload, size_t len);
