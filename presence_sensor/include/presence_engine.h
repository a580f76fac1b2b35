#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

// Prepare a fresh engine: empty registry, alpha at the "nobody near" value,
// brightness at its minimum. Refuses (returns false) an invalid config.
bool engine_init(PresenceEngine &engine, const PresenceConfig &cfg, const FeedbackConfig &feedbackCfg);

enum class IngestResult : uint8_t
{
    APPLIED = 0,
    UNMAPPED, // MAC not in the registry
    BAD_MAC
};

// One observation as a single unit of work: tracker update, hysteresis, lastSeen.
IngestResult engine_ingest(PresenceEngine &engine, const Observation &obs);

// Age every tenant's window to nowMs and re-run the hysteresis rule, so a tenant
// that stopped advertising falls back to FAR without a new packet.
// Returns the number of transitions.
size_t engine_evaluateAt(PresenceEngine &engine, uint32_t nowMs);
