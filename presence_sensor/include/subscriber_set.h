#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_config.h"

// Delivery callback; false means the subscriber is gone and gets dropped.
using SubscriberSendFn = bool (*)(const char *payload, size_t len, void *ctx);

static constexpr size_t SUBSCRIBER_NAME_MAX = 16;

struct Subscriber
{
    char name[SUBSCRIBER_NAME_MAX] = {0};
    SubscriberSendFn sendFn = nullptr;
    void *ctx = nullptr;
    uint32_t delivered = 0;
};

struct SubscriberSet
{
    Subscriber slots[CFG_MAX_SUBSCRIBERS];
    size_t count = 0;
};

// Adds or replaces (same name) a subscriber. False when the set is full or the
// name does not fit SUBSCRIBER_NAME_MAX - 1 chars.
bool subscribers_add(SubscriberSet &set, const char *name, SubscriberSendFn sendFn, void *ctx);
bool subscribers_remove(SubscriberSet &set, const char *name);
bool subscribers_contains(const SubscriberSet &set, const char *name);
size_t subscribers_count(const SubscriberSet &set);

// Fire-and-forget fan-out. A failed send drops that subscriber only.
// Returns the number of successful deliveries.
size_t subscribers_broadcast(SubscriberSet &set, const char *payload, size_t len);
