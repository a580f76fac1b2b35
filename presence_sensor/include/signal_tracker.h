#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

// Fold one observation into the tenant: seed or blend the EWMA with `alpha`,
// append `nowMs` to the packet window (then evict), and queue the raw sample
// for the next publish tick.
// Timestamps older than the newest window entry are clamped so the window stays
// non-decreasing.
void tracker_update(Tenant &t, int8_t rssiDbm, uint32_t nowMs, float alpha, uint32_t windowMs);

// Drop window entries with now - stamp > windowMs. Returns the number evicted.
uint16_t tracker_evict(Tenant &t, uint32_t nowMs, uint32_t windowMs);

uint16_t tracker_packetCount(const Tenant &t);

// Move pending samples (arrival order) into out and clear the buffer.
// Returns the count copied; samples beyond outCap stay dropped.
size_t tracker_drainRssi(Tenant &t, int8_t *out, size_t outCap);
