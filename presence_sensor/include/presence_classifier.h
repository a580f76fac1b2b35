#pragma once
#include <stddef.h>

#include "presence_state.h"

enum class PresenceTransition : uint8_t
{
    NONE = 0,
    BECAME_NEAR,
    BECAME_FAR
};

const char *presenceTransitionToString(PresenceTransition t);

// Apply the hysteresis rule to one tenant using its current EWMA and window.
// FAR -> NEAR needs ewma >= enter AND packets >= required.
// NEAR -> FAR on ewma < exit OR packets < required.
// An unseeded EWMA never enters NEAR.
PresenceTransition classifier_evaluate(Tenant &t, const PresenceConfig &cfg);

bool classifier_anyoneNear(const Tenant *tenants, size_t count);

// Pick the process-wide EWMA weight from aggregate presence.
// Returns true when the value changed.
bool classifier_adaptAlpha(float &alpha, bool anyoneNear, const PresenceConfig &cfg);
