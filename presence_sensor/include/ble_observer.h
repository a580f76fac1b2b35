#pragma once

#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

#ifndef CFG_BLE_QUEUE_DEPTH
#define CFG_BLE_QUEUE_DEPTH 64u
#endif
#ifndef CFG_BLE_DRAIN_MAX
#define CFG_BLE_DRAIN_MAX 32u // observations applied per loop pass
#endif
#ifndef CFG_BLE_SCAN_INTERVAL
#define CFG_BLE_SCAN_INTERVAL 100u // units of 0.625 ms
#endif
#ifndef CFG_BLE_SCAN_WINDOW
#define CFG_BLE_SCAN_WINDOW 99u
#endif

static_assert(CFG_BLE_SCAN_WINDOW <= CFG_BLE_SCAN_INTERVAL, "CFG_BLE_SCAN_WINDOW must not exceed CFG_BLE_SCAN_INTERVAL");

// Creates the observation queue, initializes NimBLE and starts a passive,
// continuous scan with duplicates reported. The scan callback runs in the NimBLE
// host task and only enqueues Observation records.
bool ble_observerBegin();

// Loop side: apply up to CFG_BLE_DRAIN_MAX queued observations to the engine,
// one engine_ingest each. Returns how many were applied.
size_t ble_observerDrain(PresenceEngine &engine);

// Observations lost to a full queue since boot.
uint32_t ble_observerDropped();
