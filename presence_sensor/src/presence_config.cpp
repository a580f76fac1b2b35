#include "presence_config.h"

PresenceConfig presence_defaultConfig()
{
    PresenceConfig cfg{};
    cfg.enterThresholdDbm = CFG_ENTER_THRESHOLD_DBM;
    cfg.exitThresholdDbm = CFG_EXIT_THRESHOLD_DBM;
    cfg.windowMs = CFG_WINDOW_MS;
    cfg.packetsRequired = (uint16_t)CFG_PACKETS_REQUIRED;
    cfg.alphaNear = CFG_ALPHA_NEAR;
    cfg.alphaFar = CFG_ALPHA_FAR;
    cfg.tenantTimeoutMs = CFG_TENANT_TIMEOUT_MS;
    return cfg;
}

FeedbackConfig feedback_defaultConfig()
{
    FeedbackConfig cfg{};
    cfg.minLevel = (int16_t)CFG_BRIGHTNESS_MIN;
    cfg.maxLevel = (int16_t)CFG_BRIGHTNESS_MAX;
    cfg.stepUp = (int16_t)CFG_BRIGHTNESS_STEP_UP;
    cfg.stepDown = (int16_t)CFG_BRIGHTNESS_STEP_DOWN;
    return cfg;
}

static bool reject(const char **reason, const char *why)
{
    if (reason)
    {
        *reason = why;
    }
    return false;
}

static bool alphaInRange(float a)
{
    return a > 0.0f && a <= 1.0f;
}

bool presence_validateConfig(const PresenceConfig &cfg, const char **reason)
{
    if (!(cfg.enterThresholdDbm > cfg.exitThresholdDbm))
        return reject(reason, "enter_threshold_not_above_exit");
    if (cfg.windowMs == 0)
        return reject(reason, "window_ms_zero");
    if (cfg.packetsRequired == 0 || cfg.packetsRequired > CFG_WINDOW_MAX_PACKETS)
        return reject(reason, "packets_required_out_of_range");
    if (!alphaInRange(cfg.alphaNear) || !alphaInRange(cfg.alphaFar))
        return reject(reason, "alpha_out_of_range");
    if (cfg.tenantTimeoutMs == 0)
        return reject(reason, "tenant_timeout_zero");

    if (reason)
    {
        *reason = "ok";
    }
    return true;
}

bool feedback_validateConfig(const FeedbackConfig &cfg, const char **reason)
{
    if (cfg.minLevel < 0 || cfg.minLevel >= cfg.maxLevel)
        return reject(reason, "level_range_invalid");
    if (cfg.stepUp <= 0 || cfg.stepDown <= 0)
        return reject(reason, "step_not_positive");

    if (reason)
    {
        *reason = "ok";
    }
    return true;
}
