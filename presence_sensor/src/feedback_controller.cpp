#include "feedback_controller.h"

#include "logger.h"

const char *feedbackResultToString(FeedbackResult r)
{
    switch (r)
    {
    case FeedbackResult::UNCHANGED:
        return "unchanged";
    case FeedbackResult::WRITTEN:
        return "written";
    case FeedbackResult::WRITE_FAILED:
        return "write_failed";
    default:
        return "unknown";
    }
}

void feedback_init(FeedbackState &st, const FeedbackConfig &cfg)
{
    st.level = cfg.minLevel;
    st.writeFailures = 0;
}

static int16_t clampLevel(int32_t v, const FeedbackConfig &cfg)
{
    if (v < cfg.minLevel)
        return cfg.minLevel;
    if (v > cfg.maxLevel)
        return cfg.maxLevel;
    return (int16_t)v;
}

FeedbackResult feedback_step(FeedbackState &st, const FeedbackConfig &cfg, bool anyoneNear,
                             ActuatorWriteFn writeFn, void *ctx)
{
    int16_t next = st.level;
    if (anyoneNear && st.level < cfg.maxLevel)
    {
        next = clampLevel((int32_t)st.level + cfg.stepUp, cfg);
    }
    else if (!anyoneNear && st.level > cfg.minLevel)
    {
        next = clampLevel((int32_t)st.level - cfg.stepDown, cfg);
    }

    if (next == st.level)
        return FeedbackResult::UNCHANGED;

    if (!writeFn || !writeFn(next, ctx))
    {
        st.writeFailures++;
        LOG_WARN_EVERY("fb_write", 5000, LogDomain::ACTUATOR, "Brightness %d -> %d %s (failures=%lu)",
                       (int)st.level, (int)next, feedbackResultToString(FeedbackResult::WRITE_FAILED),
                       (unsigned long)st.writeFailures);
        return FeedbackResult::WRITE_FAILED;
    }

    LOG_DEBUG(LogDomain::ACTUATOR, "Brightness %s: %d -> %d", next > st.level ? "up" : "down", (int)st.level, (int)next);
    st.level = next;
    return FeedbackResult::WRITTEN;
}
