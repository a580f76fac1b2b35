#include "ble_observer.h"

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <string.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

#include "logger.h"
#include "presence_engine.h"

static QueueHandle_t s_queue = nullptr;
static portMUX_TYPE s_dropMux = portMUX_INITIALIZER_UNLOCKED;
static uint32_t s_dropped = 0;
static uint32_t s_droppedReported = 0;

// NimBLE host task context: no logging, no engine access.
static void pushObservationDropOldest(const Observation &obs)
{
    if (s_queue == nullptr)
        return;
    if (xQueueSend(s_queue, &obs, 0) == pdTRUE)
        return;

    // Queue full: drop the oldest record, keep the newest.
    Observation dropped{};
    (void)xQueueReceive(s_queue, &dropped, 0);
    const bool requeued = xQueueSend(s_queue, &obs, 0) == pdTRUE;

    portENTER_CRITICAL(&s_dropMux);
    s_dropped += requeued ? 1u : 2u;
    portEXIT_CRITICAL(&s_dropMux);
}

class ScanCallbacks : public NimBLEScanCallbacks
{
    void onResult(const NimBLEAdvertisedDevice *adv) override
    {
        Observation obs{};
        const std::string mac = adv->getAddress().toString();
        strncpy(obs.mac, mac.c_str(), sizeof(obs.mac));
        obs.mac[sizeof(obs.mac) - 1] = '\0';

        int rssi = adv->getRSSI();
        if (rssi < -128)
            rssi = -128;
        if (rssi > 127)
            rssi = 127;
        obs.rssiDbm = static_cast<int8_t>(rssi);
        obs.observedAtMs = millis();

        pushObservationDropOldest(obs);
    }

    void onScanEnd(const NimBLEScanResults &results, int reason) override
    {
        (void)results;
        (void)reason;
        // Continuous scan; the host stops it on a controller reset, so restart.
        NimBLEDevice::getScan()->start(0, false, false);
    }
};

static ScanCallbacks s_scanCallbacks;

bool ble_observerBegin()
{
    if (s_queue == nullptr)
    {
        s_queue = xQueueCreate((UBaseType_t)CFG_BLE_QUEUE_DEPTH, sizeof(Observation));
        if (s_queue == nullptr)
        {
            LOG_ERROR(LogDomain::BLE, "Observation queue create failed depth=%u", (unsigned)CFG_BLE_QUEUE_DEPTH);
            return false;
        }
    }

    NimBLEDevice::init("");
    NimBLEScan *scan = NimBLEDevice::getScan();
    scan->setActiveScan(false); // advertisements only, no scan requests
    scan->setInterval(CFG_BLE_SCAN_INTERVAL);
    scan->setWindow(CFG_BLE_SCAN_WINDOW);
    scan->setMaxResults(0); // callbacks only, nothing stored
    scan->setDuplicateFilter(false);
    scan->setScanCallbacks(&s_scanCallbacks, true);
    if (!scan->start(0, false, false))
    {
        LOG_ERROR(LogDomain::BLE, "BLE scan start failed");
        return false;
    }

    LOG_INFO(LogDomain::BLE, "BLE scan started (passive, duplicates on) interval=%u window=%u queue_depth=%u",
             (unsigned)CFG_BLE_SCAN_INTERVAL, (unsigned)CFG_BLE_SCAN_WINDOW, (unsigned)CFG_BLE_QUEUE_DEPTH);
    return true;
}

size_t ble_observerDrain(PresenceEngine &engine)
{
    if (s_queue == nullptr)
        return 0;

    size_t applied = 0;
    Observation obs{};
    for (size_t i = 0; i < CFG_BLE_DRAIN_MAX; ++i)
    {
        if (xQueueReceive(s_queue, &obs, 0) != pdTRUE)
            break;
        if (engine_ingest(engine, obs) == IngestResult::APPLIED)
            ++applied;
    }

    const uint32_t dropped = ble_observerDropped();
    if (dropped != s_droppedReported)
    {
        LOG_WARN_EVERY("ble_queue_drop", 10000, LogDomain::BLE, "Observation queue full; dropped=%lu total",
                       (unsigned long)dropped);
        s_droppedReported = dropped;
    }
    return applied;
}

uint32_t ble_observerDropped()
{
    portENTER_CRITICAL(&s_dropMux);
    const uint32_t dropped = s_dropped;
    portEXIT_CRITICAL(&s_dropMux);
    return dropped;
}
