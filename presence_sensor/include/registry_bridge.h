#pragma once
#include <stdint.h>

#include "presence_state.h"
#include "registry_source.h"

// Reads the current registry into out. Any non-OK result is treated as an empty registry.
using RegistryReadFn = RegistryParseError (*)(RegistrySnapshot &out, void *ctx);

// Loop-side end of the registry-change handoff. The watcher task only enqueues;
// the loop dequeues and calls bridge_onNotified, then bridge_poll runs the reload.
struct RegistryBridge
{
    RegistryReadFn readFn = nullptr;
    void *readCtx = nullptr;
    uint32_t debounceMs = CFG_REGISTRY_DEBOUNCE_MS;

    bool running = false;
    bool pending = false;
    uint32_t deadlineMs = 0;

    uint32_t notifications = 0;
    uint32_t reloads = 0;
    uint32_t readFailures = 0;

    RegistrySnapshot scratch;
};

void bridge_begin(RegistryBridge &bridge, RegistryReadFn readFn, void *readCtx, uint32_t debounceMs);
void bridge_start(RegistryBridge &bridge);
// Drops any pending reload; later notifications are ignored until bridge_start.
void bridge_stop(RegistryBridge &bridge);
bool bridge_isRunning(const RegistryBridge &bridge);

// Arms (or re-arms) the debounce deadline. Returns false when the bridge is stopped.
bool bridge_onNotified(RegistryBridge &bridge, uint32_t nowMs);

// Runs the reload once the debounce has elapsed. Returns true when the registry changed.
bool bridge_poll(RegistryBridge &bridge, PresenceEngine &engine, uint32_t nowMs);

// Immediate read + reconcile (startup load, explicit reload command).
bool bridge_reloadNow(RegistryBridge &bridge, PresenceEngine &engine, const char *reason);
