#include "presence_classifier.h"

#include "logger.h"
#include "signal_tracker.h"

const char *presenceTransitionToString(PresenceTransition t)
{
    switch (t)
    {
    case PresenceTransition::BECAME_NEAR:
        return "near";
    case PresenceTransition::BECAME_FAR:
        return "far";
    case PresenceTransition::NONE:
    default:
        return "none";
    }
}

PresenceTransition classifier_evaluate(Tenant &t, const PresenceConfig &cfg)
{
    const uint16_t packets = tracker_packetCount(t);
    const bool enoughPackets = packets >= cfg.packetsRequired;

    if (!t.isNear)
    {
        if (t.ewmaValid && t.ewma >= cfg.enterThresholdDbm && enoughPackets)
        {
            t.isNear = true;
            return PresenceTransition::BECAME_NEAR;
        }
        return PresenceTransition::NONE;
    }

    const bool signalLost = !t.ewmaValid || t.ewma < cfg.exitThresholdDbm;
    if (signalLost || !enoughPackets)
    {
        t.isNear = false;
        return PresenceTransition::BECAME_FAR;
    }
    return PresenceTransition::NONE;
}

bool classifier_anyoneNear(const Tenant *tenants, size_t count)
{
    if (!tenants)
        return false;
    for (size_t i = 0; i < count; ++i)
    {
        if (tenants[i].isNear)
            return true;
    }
    return false;
}

bool classifier_adaptAlpha(float &alpha, bool anyoneNear, const PresenceConfig &cfg)
{
    const float next = anyoneNear ? cfg.alphaNear : cfg.alphaFar;
    if (next == alpha)
        return false;

    LOG_INFO(LogDomain::PRESENCE, "Changing ALPHA %.2f -> %.2f (%s)",
             (double)alpha, (double)next, anyoneNear ? "someone near" : "nobody near");
    alpha = next;
    return true;
}
