#include "subscriber_set.h"

#include <string.h>

#include "logger.h"

static int findSlot(const SubscriberSet &set, const char *name)
{
    for (size_t i = 0; i < set.count; ++i)
    {
        if (strcmp(set.slots[i].name, name) == 0)
            return (int)i;
    }
    return -1;
}

static void removeAt(SubscriberSet &set, size_t idx)
{
    for (size_t i = idx + 1; i < set.count; ++i)
    {
        set.slots[i - 1] = set.slots[i];
    }
    set.count--;
    set.slots[set.count] = Subscriber{};
}

bool subscribers_add(SubscriberSet &set, const char *name, SubscriberSendFn sendFn, void *ctx)
{
    if (!name || name[0] == '\0' || !sendFn)
        return false;
    if (strlen(name) >= SUBSCRIBER_NAME_MAX)
    {
        LOG_WARN(LogDomain::PUBLISH, "Subscriber '%s' rejected: name longer than %u chars", name,
                 (unsigned)(SUBSCRIBER_NAME_MAX - 1));
        return false;
    }

    int idx = findSlot(set, name);
    if (idx < 0)
    {
        if (set.count >= CFG_MAX_SUBSCRIBERS)
        {
            LOG_WARN(LogDomain::PUBLISH, "Subscriber '%s' rejected: set full (%u)", name, (unsigned)CFG_MAX_SUBSCRIBERS);
            return false;
        }
        idx = (int)set.count++;
    }

    Subscriber &s = set.slots[idx];
    strncpy(s.name, name, sizeof(s.name));
    s.name[sizeof(s.name) - 1] = '\0';
    s.sendFn = sendFn;
    s.ctx = ctx;
    s.delivered = 0;
    LOG_INFO(LogDomain::PUBLISH, "Subscriber added: %s (total=%u)", s.name, (unsigned)set.count);
    return true;
}

bool subscribers_remove(SubscriberSet &set, const char *name)
{
    if (!name)
        return false;
    const int idx = findSlot(set, name);
    if (idx < 0)
        return false;
    removeAt(set, (size_t)idx);
    LOG_INFO(LogDomain::PUBLISH, "Subscriber removed: %s (total=%u)", name, (unsigned)set.count);
    return true;
}

bool subscribers_contains(const SubscriberSet &set, const char *name)
{
    return name && findSlot(set, name) >= 0;
}

size_t subscribers_count(const SubscriberSet &set)
{
    return set.count;
}

size_t subscribers_broadcast(SubscriberSet &set, const char *payload, size_t len)
{
    size_t delivered = 0;
    size_t i = 0;
    while (i < set.count)
    {
        Subscriber &s = set.slots[i];
        if (s.sendFn(payload, len, s.ctx))
        {
            s.delivered++;
            delivered++;
            ++i;
            continue;
        }

        char name[SUBSCRIBER_NAME_MAX];
        strncpy(name, s.name, sizeof(name));
        name[sizeof(name) - 1] = '\0';
        removeAt(set, i);
        LOG_WARN(LogDomain::PUBLISH, "Subscriber dropped after failed send: %s (remaining=%u)", name, (unsigned)set.count);
    }
    return delivered;
}
