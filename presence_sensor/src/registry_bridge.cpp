#include "registry_bridge.h"

#include "logger.h"
#include "tenant_registry.h"

void bridge_begin(RegistryBridge &bridge, RegistryReadFn readFn, void *readCtx, uint32_t debounceMs)
{
    bridge.readFn = readFn;
    bridge.readCtx = readCtx;
    bridge.debounceMs = debounceMs;
    bridge.running = false;
    bridge.pending = false;
    bridge.deadlineMs = 0;
    bridge.notifications = 0;
    bridge.reloads = 0;
    bridge.readFailures = 0;
    registry_clearSnapshot(bridge.scratch);
}

void bridge_start(RegistryBridge &bridge)
{
    bridge.running = true;
    LOG_INFO(LogDomain::REGISTRY, "Registry bridge started (debounce %lu ms)", (unsigned long)bridge.debounceMs);
}

void bridge_stop(RegistryBridge &bridge)
{
    if (bridge.pending)
    {
        LOG_INFO(LogDomain::REGISTRY, "Registry bridge stopped, pending reload dropped");
    }
    else
    {
        LOG_INFO(LogDomain::REGISTRY, "Registry bridge stopped");
    }
    bridge.running = false;
    bridge.pending = false;
}

bool bridge_isRunning(const RegistryBridge &bridge)
{
    return bridge.running;
}

bool bridge_onNotified(RegistryBridge &bridge, uint32_t nowMs)
{
    if (!bridge.running)
    {
        LOG_DEBUG(LogDomain::REGISTRY, "Registry change ignored (bridge stopped)");
        return false;
    }
    bridge.notifications++;
    bridge.pending = true;
    bridge.deadlineMs = nowMs + bridge.debounceMs;
    LOG_DEBUG(LogDomain::REGISTRY, "Registry change noticed, reload in %lu ms", (unsigned long)bridge.debounceMs);
    return true;
}

bool bridge_poll(RegistryBridge &bridge, PresenceEngine &engine, uint32_t nowMs)
{
    if (!bridge.running || !bridge.pending)
        return false;
    if ((int32_t)(nowMs - bridge.deadlineMs) < 0)
        return false;

    bridge.pending = false;
    return bridge_reloadNow(bridge, engine, "file changed");
}

bool bridge_reloadNow(RegistryBridge &bridge, PresenceEngine &engine, const char *reason)
{
    bridge.reloads++;
    RegistryParseError err = RegistryParseError::READ_FAILED;
    if (bridge.readFn)
    {
        err = bridge.readFn(bridge.scratch, bridge.readCtx);
    }

    if (err != RegistryParseError::OK)
    {
        bridge.readFailures++;
        registry_clearSnapshot(bridge.scratch);
        LOG_WARN(LogDomain::REGISTRY, "Registry read failed (%s): %s; using empty registry",
                 reason ? reason : "reload", registryParseErrorToString(err));
    }
    else
    {
        LOG_INFO(LogDomain::REGISTRY, "Registry reloaded (%s): %u entries", reason ? reason : "reload",
                 (unsigned)bridge.scratch.count);
    }

    return registry_applyIfChanged(engine, bridge.scratch);
}
