#include "signal_tracker.h"

static constexpr uint16_t kWindowCap = (uint16_t)CFG_WINDOW_MAX_PACKETS;

static uint16_t windowIndex(const PacketWindow &w, uint16_t offset)
{
    return (uint16_t)((w.head + offset) % kWindowCap);
}

static uint32_t windowNewest(const PacketWindow &w)
{
    return w.stampsMs[windowIndex(w, (uint16_t)(w.count - 1))];
}

static void windowPush(PacketWindow &w, uint32_t stampMs)
{
    if (w.count == kWindowCap)
    {
        // Full: the oldest stamp makes room. Counts above the cap read as "enough".
        w.head = windowIndex(w, 1);
        w.count--;
    }
    w.stampsMs[windowIndex(w, w.count)] = stampMs;
    w.count++;
}

uint16_t tracker_evict(Tenant &t, uint32_t nowMs, uint32_t windowMs)
{
    PacketWindow &w = t.window;
    uint16_t evicted = 0;
    while (w.count > 0)
    {
        const uint32_t front = w.stampsMs[w.head];
        // Signed age keeps the comparison valid across millis() wraparound.
        const int32_t age = (int32_t)(nowMs - front);
        if (age <= (int32_t)windowMs)
            break;
        w.head = windowIndex(w, 1);
        w.count--;
        evicted++;
    }
    if (w.count == 0)
    {
        w.head = 0;
    }
    return evicted;
}

void tracker_update(Tenant &t, int8_t rssiDbm, uint32_t nowMs, float alpha, uint32_t windowMs)
{
    const float sample = (float)rssiDbm;
    if (!t.ewmaValid)
    {
        t.ewma = sample;
        t.ewmaValid = true;
    }
    else
    {
        t.ewma = alpha * sample + (1.0f - alpha) * t.ewma;
    }

    uint32_t stamp = nowMs;
    if (t.window.count > 0)
    {
        const uint32_t newest = windowNewest(t.window);
        if ((int32_t)(stamp - newest) < 0)
        {
            stamp = newest;
        }
    }
    windowPush(t.window, stamp);
    tracker_evict(t, stamp, windowMs);

    RssiBuffer &pending = t.pendingRssi;
    if (pending.count < CFG_PENDING_RSSI_MAX)
    {
        pending.samples[pending.count++] = rssiDbm;
    }
    else
    {
        pending.dropped++;
    }
}

uint16_t tracker_packetCount(const Tenant &t)
{
    return t.window.count;
}

size_t tracker_drainRssi(Tenant &t, int8_t *out, size_t outCap)
{
    RssiBuffer &pending = t.pendingRssi;
    size_t n = pending.count;
    if (!out)
    {
        pending.dropped += (uint32_t)n;
        n = 0;
    }
    else if (n > outCap)
    {
        pending.dropped += (uint32_t)(n - outCap);
        n = outCap;
    }
    for (size_t i = 0; i < n; ++i)
    {
        out[i] = pending.samples[i];
    }
    pending.count = 0;
    return n;
}
