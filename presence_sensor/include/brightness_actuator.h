#pragma once
#include <stdint.h>

#ifndef CFG_LOGO_LED_PIN
#define CFG_LOGO_LED_PIN 2
#endif
#ifndef CFG_LOGO_PWM_FREQ_HZ
#define CFG_LOGO_PWM_FREQ_HZ 5000u
#endif
#ifndef CFG_LOGO_PWM_BITS
#define CFG_LOGO_PWM_BITS 8u // duty 0..255 matches the brightness range
#endif

// Attach the logo LED to an LEDC channel and drive it at initialLevel.
bool brightness_begin(int16_t initialLevel);

// ActuatorWriteFn: set the PWM duty. False when the pin is not attached
// or the LEDC write fails.
bool brightness_write(int16_t level, void *ctx);
