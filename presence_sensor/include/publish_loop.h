#pragma once
#include <stddef.h>
#include <stdint.h>

#include "feedback_controller.h"
#include "presence_state.h"
#include "snapshot_json.h"
#include "subscriber_set.h"

struct PublishLoop
{
    SubscriberSet subscribers;
    PresenceSnapshot snapshot; // reused every tick
    char payload[CFG_PUBLISH_BUF_SIZE] = {0};

    uint32_t intervalMs = 1000u / CFG_BROADCAST_HZ;
    uint32_t lastTickMs = 0;
    bool hasTicked = false;
    bool running = false;

    ActuatorWriteFn actuatorFn = nullptr;
    void *actuatorCtx = nullptr;

    uint32_t tickCount = 0;
    uint32_t serializeFailures = 0;
};

struct PublishTickResult
{
    size_t reported;  // rows in this tick's snapshot
    size_t delivered; // subscribers that accepted the payload
    bool anyoneNear;
    bool alphaChanged;
    FeedbackResult feedback;
    SnapshotJsonError json; // OK when nothing was serialized
};

void publish_begin(PublishLoop &loop, uint32_t broadcastHz, ActuatorWriteFn actuatorFn, void *actuatorCtx);

// Start/stop take effect between ticks.
void publish_start(PublishLoop &loop, uint32_t nowMs);
void publish_stop(PublishLoop &loop);
bool publish_isRunning(const PublishLoop &loop);
bool publish_due(const PublishLoop &loop, uint32_t nowMs);

// Fill loop.snapshot with tenants seen within the timeout, draining their pending
// samples. Timed-out tenants are skipped, not removed.
size_t publish_buildSnapshot(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs);

// One tick: age windows, snapshot + drain, adapt alpha and step the brightness
// from the whole tracked set, then fan the JSON out to subscribers.
PublishTickResult publish_tick(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs);

// Runs a tick when running and due; keeps cadence without drifting.
bool publish_poll(PublishLoop &loop, PresenceEngine &engine, uint32_t nowMs, PublishTickResult *result = nullptr);
