#pragma once

#include <stddef.h>
#include <stdint.h>

#include "registry_bridge.h"

#ifndef CFG_REGISTRY_WATCH_POLL_MS
#define CFG_REGISTRY_WATCH_POLL_MS 1000u
#endif
#ifndef CFG_REGISTRY_WATCH_STACK_BYTES
#define CFG_REGISTRY_WATCH_STACK_BYTES 4096u
#endif
#ifndef CFG_REGISTRY_WATCH_PRIORITY
#define CFG_REGISTRY_WATCH_PRIORITY 1u
#endif
#ifndef CFG_REGISTRY_WATCH_QUEUE_DEPTH
#define CFG_REGISTRY_WATCH_QUEUE_DEPTH 4u
#endif
#ifndef CFG_REGISTRY_WATCH_CORE
#define CFG_REGISTRY_WATCH_CORE 0
#endif

// Starts the watcher task. It polls the registry file signature and posts a
// payload-less notification to a queue when it changes. It never reads the
// registry content or touches engine state.
bool registry_watchBegin();

// Pause/resume polling. Changes made while paused are reported on resume.
void registry_watchSetEnabled(bool enabled);
bool registry_watchIsEnabled();

// Loop side: hand every queued notification to the bridge. Returns how many
// the bridge accepted (none while it is stopped).
size_t registry_watchDrain(RegistryBridge &bridge, uint32_t nowMs);
