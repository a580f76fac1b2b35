#include "presence_engine.h"

#include "feedback_controller.h"
#include "logger.h"
#include "mac_address.h"
#include "presence_classifier.h"
#include "signal_tracker.h"
#include "tenant_registry.h"

static void logTransition(const Tenant &t, PresenceTransition tr)
{
    if (tr == PresenceTransition::NONE)
        return;
    LOG_INFO(LogDomain::PRESENCE, "%s (%s) is now %s: ewma=%.1f pkts=%u", t.tenantId, t.macAddress,
             presenceTransitionToString(tr), (double)t.ewma, (unsigned)tracker_packetCount(t));
}

bool engine_init(PresenceEngine &engine, const PresenceConfig &cfg, const FeedbackConfig &feedbackCfg)
{
    const char *reason = nullptr;
    if (!presence_validateConfig(cfg, &reason))
    {
        LOG_ERROR(LogDomain::CONFIG, "Presence config rejected: %s (enter=%.1f exit=%.1f)", reason,
                  (double)cfg.enterThresholdDbm, (double)cfg.exitThresholdDbm);
        return false;
    }
    if (!feedback_validateConfig(feedbackCfg, &reason))
    {
        LOG_ERROR(LogDomain::CONFIG, "Feedback config rejected: %s (min=%d max=%d)", reason,
                  (int)feedbackCfg.minLevel, (int)feedbackCfg.maxLevel);
        return false;
    }

    engine.cfg = cfg;
    engine.feedbackCfg = feedbackCfg;
    engine.alpha = cfg.alphaFar;
    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        engine.tenants[i] = Tenant{};
    }
    engine.tenantCount = 0;
    registry_clearSnapshot(engine.applied);
    engine.hasApplied = false;
    feedback_init(engine.feedback, feedbackCfg);
    engine.observationsIgnored = 0;
    engine.observationsApplied = 0;
    return true;
}

IngestResult engine_ingest(PresenceEngine &engine, const Observation &obs)
{
    char mac[TENANT_MAC_MAX];
    if (!mac_normalize(obs.mac, mac, sizeof(mac)))
    {
        engine.observationsIgnored++;
        return IngestResult::BAD_MAC;
    }

    Tenant *t = registry_find(engine, mac);
    if (!t)
    {
        engine.observationsIgnored++;
        return IngestResult::UNMAPPED;
    }

    tracker_update(*t, obs.rssiDbm, obs.observedAtMs, engine.alpha, engine.cfg.windowMs);
    t->lastSeenMs = obs.observedAtMs;
    t->lastSeenValid = true;
    engine.observationsApplied++;

    LOG_DEBUG_EVERY("ble_obs", 1000, LogDomain::BLE, "%s rssi=%d ewma=%.1f pkts=%u", t->tenantId, (int)obs.rssiDbm,
                    (double)t->ewma, (unsigned)tracker_packetCount(*t));

    logTransition(*t, classifier_evaluate(*t, engine.cfg));
    return IngestResult::APPLIED;
}

size_t engine_evaluateAt(PresenceEngine &engine, uint32_t nowMs)
{
    size_t transitions = 0;
    for (size_t i = 0; i < engine.tenantCount; ++i)
    {
        Tenant &t = engine.tenants[i];
        tracker_evict(t, nowMs, engine.cfg.windowMs);
        const PresenceTransition tr = classifier_evaluate(t, engine.cfg);
        if (tr != PresenceTransition::NONE)
        {
            transitions++;
            logTransition(t, tr);
        }
    }
    return transitions;
}
