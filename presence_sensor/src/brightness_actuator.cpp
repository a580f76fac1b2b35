#include "brightness_actuator.h"

#include <Arduino.h>

#include "logger.h"

static bool s_attached = false;
static const uint32_t DUTY_MAX = (1u << CFG_LOGO_PWM_BITS) - 1u;

bool brightness_begin(int16_t initialLevel)
{
    if (!ledcAttach(CFG_LOGO_LED_PIN, CFG_LOGO_PWM_FREQ_HZ, CFG_LOGO_PWM_BITS))
    {
        LOG_ERROR(LogDomain::ACTUATOR, "LEDC attach failed pin=%d freq=%u bits=%u",
                  (int)CFG_LOGO_LED_PIN, (unsigned)CFG_LOGO_PWM_FREQ_HZ, (unsigned)CFG_LOGO_PWM_BITS);
        return false;
    }
    s_attached = true;
    LOG_INFO(LogDomain::ACTUATOR, "Logo LED on pin=%d freq=%u bits=%u", (int)CFG_LOGO_LED_PIN,
             (unsigned)CFG_LOGO_PWM_FREQ_HZ, (unsigned)CFG_LOGO_PWM_BITS);
    return brightness_write(initialLevel, nullptr);
}

bool brightness_write(int16_t level, void *ctx)
{
    (void)ctx;
    if (!s_attached)
        return false;

    uint32_t duty = level < 0 ? 0u : (uint32_t)level;
    if (duty > DUTY_MAX)
        duty = DUTY_MAX;
    return ledcWrite(CFG_LOGO_LED_PIN, duty);
}
