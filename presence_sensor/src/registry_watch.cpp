#include "registry_watch.h"

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "logger.h"
#include "registry_store.h"

struct WatchNotice
{
    uint32_t signatureHash;
};

static QueueHandle_t s_queue = nullptr;
static TaskHandle_t s_taskHandle = nullptr;
static portMUX_TYPE s_watchMux = portMUX_INITIALIZER_UNLOCKED;
static bool s_enabled = true;
static uint32_t s_readFailures = 0;
static uint32_t s_readFailuresReported = 0;
static RegistryFileSignature s_baseline;

static bool watchEnabled()
{
    portENTER_CRITICAL(&s_watchMux);
    const bool enabled = s_enabled;
    portEXIT_CRITICAL(&s_watchMux);
    return enabled;
}

// Watcher task: posts to the queue only. Logging stays on the loop side.
static void watchTask(void * /*arg*/)
{
    RegistryFileSignature last = s_baseline;

    for (;;)
    {
        vTaskDelay(pdMS_TO_TICKS(CFG_REGISTRY_WATCH_POLL_MS));
        if (!watchEnabled())
            continue;

        RegistryFileSignature current{};
        if (!registry_storeSignature(current))
        {
            portENTER_CRITICAL(&s_watchMux);
            ++s_readFailures;
            portEXIT_CRITICAL(&s_watchMux);
            continue;
        }
        if (registry_signatureEquals(current, last))
            continue;

        last = current;
        WatchNotice notice{current.hash};
        // Full queue: a change is already pending.
        (void)xQueueSend(s_queue, &notice, 0);
    }
}

bool registry_watchBegin()
{
    if (s_taskHandle != nullptr)
        return true;

    s_queue = xQueueCreate((UBaseType_t)CFG_REGISTRY_WATCH_QUEUE_DEPTH, sizeof(WatchNotice));
    if (s_queue == nullptr)
    {
        LOG_ERROR(LogDomain::REGISTRY, "registryWatch queue create failed depth=%u",
                  (unsigned)CFG_REGISTRY_WATCH_QUEUE_DEPTH);
        return false;
    }

    // Baseline from the file the startup load just read, so boot does not notify.
    if (!registry_storeSignature(s_baseline))
    {
        LOG_WARN(LogDomain::REGISTRY, "Registry signature read failed; first poll will notify");
    }

    BaseType_t created = pdFAIL;
#if (CFG_REGISTRY_WATCH_CORE < 0)
    created = xTaskCreate(
        watchTask,
        "registryWatch",
        (uint32_t)CFG_REGISTRY_WATCH_STACK_BYTES,
        nullptr,
        (UBaseType_t)CFG_REGISTRY_WATCH_PRIORITY,
        &s_taskHandle);
#else
    created = xTaskCreatePinnedToCore(
        watchTask,
        "registryWatch",
        (uint32_t)CFG_REGISTRY_WATCH_STACK_BYTES,
        nullptr,
        (UBaseType_t)CFG_REGISTRY_WATCH_PRIORITY,
        &s_taskHandle,
        (BaseType_t)CFG_REGISTRY_WATCH_CORE);
#endif

    if (created != pdPASS)
    {
        LOG_ERROR(LogDomain::REGISTRY, "registryWatch create failed stack_bytes=%u",
                  (unsigned)CFG_REGISTRY_WATCH_STACK_BYTES);
        vQueueDelete(s_queue);
        s_queue = nullptr;
        s_taskHandle = nullptr;
        return false;
    }

    LOG_INFO(LogDomain::REGISTRY, "registryWatch started core=%d poll_ms=%u stack_bytes=%u prio=%u baseline=%s",
             (int)CFG_REGISTRY_WATCH_CORE,
             (unsigned)CFG_REGISTRY_WATCH_POLL_MS,
             (unsigned)CFG_REGISTRY_WATCH_STACK_BYTES,
             (unsigned)CFG_REGISTRY_WATCH_PRIORITY,
             s_baseline.exists ? "file" : "missing");
    return true;
}

void registry_watchSetEnabled(bool enabled)
{
    portENTER_CRITICAL(&s_watchMux);
    s_enabled = enabled;
    portEXIT_CRITICAL(&s_watchMux);
    LOG_INFO(LogDomain::REGISTRY, "Registry watcher %s", enabled ? "resumed" : "paused");
}

bool registry_watchIsEnabled()
{
    return watchEnabled();
}

size_t registry_watchDrain(RegistryBridge &bridge, uint32_t nowMs)
{
    if (s_queue == nullptr)
        return 0;

    size_t accepted = 0;
    WatchNotice notice{};
    while (xQueueReceive(s_queue, &notice, 0) == pdTRUE)
    {
        LOG_DEBUG(LogDomain::REGISTRY, "Registry file changed hash=%08lx", (unsigned long)notice.signatureHash);
        if (bridge_onNotified(bridge, nowMs))
            ++accepted;
    }

    portENTER_CRITICAL(&s_watchMux);
    const uint32_t failures = s_readFailures;
    portEXIT_CRITICAL(&s_watchMux);
    if (failures != s_readFailuresReported)
    {
        LOG_WARN_EVERY("registry_watch_read_fail", 30000, LogDomain::REGISTRY,
                       "Registry signature read failed count=%lu", (unsigned long)failures);
        s_readFailuresReported = failures;
    }
    return accepted;
}
