#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

struct ReconcileResult
{
    uint8_t added;
    uint8_t removed;
    uint8_t renamed; // same MAC, new tenantId
    uint8_t kept;    // same MAC, same tenantId
};

// Replace the tracked set with the snapshot's MACs, in snapshot order.
// Tenants whose MAC survives keep every live field; only tenantId is overwritten.
// Duplicate MACs keep their first position and take the last tenantId.
ReconcileResult registry_reconcile(PresenceEngine &engine, const RegistrySnapshot &snapshot);

// Reconcile only when the snapshot differs from the last applied one.
// Returns true when a reconcile ran; result is filled in that case.
bool registry_applyIfChanged(PresenceEngine &engine, const RegistrySnapshot &snapshot, ReconcileResult *result = nullptr);

// Lookup by normalized MAC; nullptr when the MAC is not tracked.
Tenant *registry_find(PresenceEngine &engine, const char *normalizedMac);
const Tenant *registry_find(const PresenceEngine &engine, const char *normalizedMac);

bool registry_snapshotEquals(const RegistrySnapshot &a, const RegistrySnapshot &b);
void registry_clearSnapshot(RegistrySnapshot &snapshot);

// Appends one entry (normalizing the MAC). False on a full snapshot or a bad MAC.
bool registry_snapshotAdd(RegistrySnapshot &snapshot, const char *tenantId, const char *mac);

// Diagnostics: one log line per tracked tenant with its live state.
void registry_logTenants(const PresenceEngine &engine, uint32_t nowMs);
