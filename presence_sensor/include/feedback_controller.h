#pragma once
#include <stdint.h>

#include "presence_state.h"

// Actuator sink; returns false when the write did not take effect.
using ActuatorWriteFn = bool (*)(int16_t level, void *ctx);

enum class FeedbackResult : uint8_t
{
    UNCHANGED = 0, // already at the bound for this direction; nothing written
    WRITTEN,
    WRITE_FAILED
};

const char *feedbackResultToString(FeedbackResult r);

// Level starts at the minimum bound.
void feedback_init(FeedbackState &st, const FeedbackConfig &cfg);

// One brightness step toward max (anyoneNear) or min (nobody near), clamped.
// The new level is kept only after a successful write so a failed write is
// attempted again on the next tick.
FeedbackResult feedback_step(FeedbackState &st, const FeedbackConfig &cfg, bool anyoneNear,
                             ActuatorWriteFn writeFn, void *ctx);
