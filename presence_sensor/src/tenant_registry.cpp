#include "tenant_registry.h"

#include <stdio.h>
#include <string.h>

#include "logger.h"
#include "mac_address.h"
#include "signal_tracker.h"

static void copyField(char *dst, size_t dstSize, const char *src)
{
    strncpy(dst, src ? src : "", dstSize);
    dst[dstSize - 1] = '\0';
}

static int findIn(const Tenant *tenants, size_t count, const char *mac)
{
    for (size_t i = 0; i < count; ++i)
    {
        if (strcmp(tenants[i].macAddress, mac) == 0)
            return (int)i;
    }
    return -1;
}

static void logScanTargets(const PresenceEngine &engine)
{
    if (engine.tenantCount == 0)
    {
        LOG_INFO(LogDomain::REGISTRY, "Now scanning for: (none)");
        return;
    }

    char line[200];
    size_t pos = 0;
    line[0] = '\0';
    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        const int n = snprintf(line + pos, sizeof(line) - pos, "%s%s", i ? ", " : "", engine.tenants[i].macAddress);
        if (n < 0 || (size_t)n >= sizeof(line) - pos)
        {
            LOG_INFO(LogDomain::REGISTRY, "Now scanning for: %s ... (%u total)", line, (unsigned)engine.tenantCount);
            return;
        }
        pos += (size_t)n;
    }
    LOG_INFO(LogDomain::REGISTRY, "Now scanning for: %s", line);
}

ReconcileResult registry_reconcile(PresenceEngine &engine, const RegistrySnapshot &snapshot)
{
    ReconcileResult res{0, 0, 0, 0};
    size_t stagedCount = 0;

    for (size_t i = 0; i < snapshot.count && i < CFG_MAX_TENANTS; ++i)
    {
        const RegistryEntry &entry = snapshot.entries[i];
        char mac[TENANT_MAC_MAX];
        if (!mac_normalize(entry.mac, mac, sizeof(mac)))
        {
            LOG_WARN(LogDomain::REGISTRY, "Skipping entry id=%s: bad MAC '%s'", entry.tenantId, entry.mac);
            continue;
        }

        const int dup = findIn(engine.staging, stagedCount, mac);
        if (dup >= 0)
        {
            // Later duplicates win the tenantId, position stays with the first.
            copyField(engine.staging[dup].tenantId, TENANT_ID_MAX, entry.tenantId);
            continue;
        }

        Tenant &staged = engine.staging[stagedCount++];
        const int existing = findIn(engine.tenants, engine.tenantCount, mac);
        if (existing >= 0)
        {
            staged = engine.tenants[existing];
        }
        else
        {
            staged = Tenant{};
            copyField(staged.macAddress, TENANT_MAC_MAX, mac);
        }
        copyField(staged.tenantId, TENANT_ID_MAX, entry.tenantId);
    }

    // Classify against the old set after duplicates have settled their final ids.
    for (size_t i = 0; i < stagedCount; ++i)
    {
        const Tenant &staged = engine.staging[i];
        const int existing = findIn(engine.tenants, engine.tenantCount, staged.macAddress);
        if (existing < 0)
        {
            res.added++;
            LOG_INFO(LogDomain::REGISTRY, "Tenant added: %s (%s)", staged.tenantId, staged.macAddress);
        }
        else if (strcmp(engine.tenants[existing].tenantId, staged.tenantId) != 0)
        {
            res.renamed++;
            LOG_INFO(LogDomain::REGISTRY, "Tenant updated: %s id %s -> %s", staged.macAddress,
                     engine.tenants[existing].tenantId, staged.tenantId);
        }
        else
        {
            res.kept++;
        }
    }

    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        const Tenant &old = engine.tenants[i];
        if (findIn(engine.staging, stagedCount, old.macAddress) < 0)
        {
            res.removed++;
            LOG_INFO(LogDomain::REGISTRY, "Tenant removed: %s (%s)", old.tenantId, old.macAddress);
        }
    }

    for (size_t i = 0; i < stagedCount; ++i)
    {
        engine.tenants[i] = engine.staging[i];
    }
    engine.tenantCount = stagedCount;

    LOG_INFO(LogDomain::REGISTRY, "Registry applied: %u tenants (added=%u removed=%u renamed=%u kept=%u)",
             (unsigned)engine.tenantCount, (unsigned)res.added, (unsigned)res.removed, (unsigned)res.renamed,
             (unsigned)res.kept);
    logScanTargets(engine);
    return res;
}

bool registry_applyIfChanged(PresenceEngine &engine, const RegistrySnapshot &snapshot, ReconcileResult *result)
{
    if (engine.hasApplied && registry_snapshotEquals(engine.applied, snapshot))
    {
        LOG_DEBUG(LogDomain::REGISTRY, "Registry unchanged (%u entries), skipping", (unsigned)snapshot.count);
        return false;
    }

    const ReconcileResult res = registry_reconcile(engine, snapshot);
    engine.applied = snapshot;
    engine.hasApplied = true;
    if (result)
    {
        *result = res;
    }
    return true;
}

Tenant *registry_find(PresenceEngine &engine, const char *normalizedMac)
{
    if (!normalizedMac)
        return nullptr;
    const int idx = findIn(engine.tenants, engine.tenantCount, normalizedMac);
    return idx >= 0 ? &engine.tenants[idx] : nullptr;
}

const Tenant *registry_find(const PresenceEngine &engine, const char *normalizedMac)
{
    if (!normalizedMac)
        return nullptr;
    const int idx = findIn(engine.tenants, engine.tenantCount, normalizedMac);
    return idx >= 0 ? &engine.tenants[idx] : nullptr;
}

bool registry_snapshotEquals(const RegistrySnapshot &a, const RegistrySnapshot &b)
{
    if (a.count != b.count)
        return false;
    for (size_t i = 0; i < a.count; ++i)
    {
        if (strcmp(a.entries[i].mac, b.entries[i].mac) != 0)
            return false;
        if (strcmp(a.entries[i].tenantId, b.entries[i].tenantId) != 0)
            return false;
    }
    return true;
}

void registry_clearSnapshot(RegistrySnapshot &snapshot)
{
    for (size_t i = 0; i < snapshot.count; ++i)
    {
        snapshot.entries[i] = RegistryEntry{};
    }
    snapshot.count = 0;
}

bool registry_snapshotAdd(RegistrySnapshot &snapshot, const char *tenantId, const char *mac)
{
    if (snapshot.count >= CFG_MAX_TENANTS)
        return false;

    RegistryEntry &entry = snapshot.entries[snapshot.count];
    if (!mac_normalize(mac, entry.mac, sizeof(entry.mac)))
        return false;
    copyField(entry.tenantId, sizeof(entry.tenantId), tenantId);
    snapshot.count++;
    return true;
}

void registry_logTenants(const PresenceEngine &engine, uint32_t nowMs)
{
    LOG_INFO(LogDomain::REGISTRY, "Tracked tenants: %u (alpha=%.2f)", (unsigned)engine.tenantCount, (double)engine.alpha);
    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        const Tenant &t = engine.tenants[i];
        char ewma[16];
        if (t.ewmaValid)
            snprintf(ewma, sizeof(ewma), "%.1f", (double)t.ewma);
        else
            snprintf(ewma, sizeof(ewma), "--");

        char seen[20];
        if (t.lastSeenValid)
            snprintf(seen, sizeof(seen), "%lums ago", (unsigned long)(uint32_t)(nowMs - t.lastSeenMs));
        else
            snprintf(seen, sizeof(seen), "never");

        LOG_INFO(LogDomain::REGISTRY, "  %s %-20s %s ewma=%s pkts=%u pending=%u dropped=%lu seen=%s",
                 t.macAddress, t.tenantId, t.isNear ? "NEAR" : "FAR ", ewma, (unsigned)tracker_packetCount(t),
                 (unsigned)t.pendingRssi.count, (unsigned long)t.pendingRssi.dropped, seen);
    }
}
