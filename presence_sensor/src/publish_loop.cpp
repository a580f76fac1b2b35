#include "publish_loop.h"

#include <string.h>

#include "logger.h"
#include "presence_classifier.h"
#include "presence_engine.h"
#include "signal_tracker.h"

void publish_begin(PublishLoop &loop, uint32_t broadcastHz, ActuatorWriteFn actuatorFn, void *actuatorCtx)
{
    loop.intervalMs = broadcastHz > 0 ? (1000u / broadcastHz) : (1000u / CFG_BROADCAST_HZ);
    if (loop.intervalMs == 0)
        loop.intervalMs = 1;
    loop.actuatorFn = actuatorFn;
    loop.actuatorCtx = actuatorCtx;
    loop.running = false;
    loop.hasTicked = false;
    loop.lastTickMs = 0;
    loop.tickCount = 0;
    loop.serializeFailures = 0;
    loop.snapshot.count = 0;
}

void publish_start(PublishLoop &loop, uint32_t nowMs)
{
    if (loop.running)
        return;
    loop.running = true;
    loop.hasTicked = false;
    loop.lastTickMs = nowMs;
    LOG_INFO(LogDomain::PUBLISH, "Publish loop started (%lu ms cadence)", (unsigned long)loop.intervalMs);
}

void publish_stop(PublishLoop &loop)
{
    if (!loop.running)
        return;
    loop.running = false;
    LOG_INFO(LogDomain::PUBLISH, "Publish loop stopped after %lu ticks", (unsigned long)loop.tickCount);
}

bool publish_isRunning(const PublishLoop &loop)
{
    return loop.running;
}

bool publish_due(const PublishLoop &loop, uint32_t nowMs)
{
    if (!loop.running)
        return false;
    if (!loop.hasTicked)
        return true;
    return (int32_t)(nowMs - loop.lastTickMs) >= (int32_t)loop.intervalMs;
}

static bool isFresh(const Tenant &t, uint32_t nowMs, uint32_t timeoutMs)
{
    if (!t.lastSeenValid)
        return false;
    const int32_t age = (int32_t)(nowMs - t.lastSeenMs);
    // An observation stamped after the tick start counts as fresh.
    return age <= (int32_t)timeoutMs;
}

size_t publish_buildSnapshot(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs)
{
    PresenceSnapshot &snap = loop.snapshot;
    snap.count = 0;
    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        Tenant &t = engine.tenants[i];
        if (!isFresh(t, nowMs, engine.cfg.tenantTimeoutMs))
            continue;

        TenantReport &row = snap.rows[snap.count++];
        strncpy(row.tenantId, t.tenantId, sizeof(row.tenantId));
        row.tenantId[sizeof(row.tenantId) - 1] = '\0';
        strncpy(row.macAddress, t.macAddress, sizeof(row.macAddress));
        row.macAddress[sizeof(row.macAddress) - 1] = '\0';
        row.isNear = t.isNear;
        row.ewmaValid = t.ewmaValid;
        row.ewma = t.ewmaValid ? t.ewma : 0.0f;
        row.packetCount = tracker_packetCount(t);
        row.rssiCount = (uint16_t)tracker_drainRssi(t, row.rssis, CFG_PENDING_RSSI_MAX);
    }
    return snap.count;
}

PublishTickResult publish_tick(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs)
{
    PublishTickResult res{0, 0, false, false, FeedbackResult::UNCHANGED, SnapshotJsonError::OK};

    // Tenant state settles first; everything after this only reads it or is best-effort.
    engine_evaluateAt(engine, nowMs);
    res.reported = publish_buildSnapshot(loop, engine, nowMs);

    res.anyoneNear = classifier_anyoneNear(engine.tenants, engine.tenantCount);
    res.alphaChanged = classifier_adaptAlpha(engine.alpha, res.anyoneNear, engine.cfg);
    res.feedback = feedback_step(engine.feedback, engine.feedbackCfg, res.anyoneNear, loop.actuatorFn, loop.actuatorCtx);

    loop.tickCount++;
    loop.lastTickMs = nowMs;
    loop.hasTicked = true;

    if (subscribers_count(loop.subscribers) == 0)
        return res;

    size_t len = 0;
    res.json = buildSnapshotJson(loop.snapshot, loop.payload, sizeof(loop.payload), &len);
    if (res.json != SnapshotJsonError::OK)
    {
        loop.serializeFailures++;
        LOG_ERROR_EVERY("pub_json", 5000, LogDomain::PUBLISH, "Snapshot serialize failed: %s (rows=%u failures=%lu)",
                        snapshotJsonErrorToString(res.json), (unsigned)res.reported,
                        (unsigned long)loop.serializeFailures);
        return res;
    }

    res.delivered = subscribers_broadcast(loop.subscribers, loop.payload, len);
    LOG_DEBUG_EVERY("pub_tick", 10000, LogDomain::PUBLISH, "Tick %lu: rows=%u delivered=%u bytes=%u",
                    (unsigned long)loop.tickCount, (unsigned)res.reported, (unsigned)res.delivered, (unsigned)len);
    return res;
}

bool publish_poll(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs, PublishTickResult *result)
{
    if (!publish_due(loop, nowMs))
        return false;

    const uint32_t scheduled = loop.hasTicked ? loop.lastTickMs + loop.intervalMs : nowMs;
    const PublishTickResult res = publish_tick(loop, engine, nowMs);

    // Hold the fixed cadence unless we fell more than a full interval behind.
    if ((int32_t)(nowMs - scheduled) < (int32_t)loop.intervalMs)
    {
        loop.lastTickMs = scheduled;
    }
    if (result)
    {
        *result = res;
    }
    return true;
}
