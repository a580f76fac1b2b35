#include "test_macros.h"

#include <string.h>

#include "presence_engine.h"
#include "registry_bridge.h"
#include "signal_tracker.h"
#include "tenant_registry.h"

// Stand-in for the registry file: the document text plus a read counter.
struct FakeFile
{
    const char *json = nullptr; // nullptr -> missing file
    bool readError = false;
    int reads = 0;
};

static RegistryParseError fakeRead(RegistrySnapshot &out, void *ctx)
{
    FakeFile *f = static_cast<FakeFile *>(ctx);
    f->reads++;
    if (f->readError)
        return RegistryParseError::READ_FAILED;
    if (!f->json)
    {
        registry_clearSnapshot(out);
        return RegistryParseError::OK;
    }
    return registry_parseJson(f->json, strlen(f->json), out);
}

static PresenceEngine s_engine;
static RegistryBridge s_bridge;
static FakeFile s_file;

static const char *kOne = "{\"tenantsAndMacs\":[{\"id\":\"alice\",\"mac\":\"AA:BB:CC:DD:EE:01\"}]}";
static const char *kTwo = "{\"tenantsAndMacs\":[{\"id\":\"alice\",\"mac\":\"AA:BB:CC:DD:EE:01\"},"
                          "{\"id\":\"bob\",\"mac\":\"AA:BB:CC:DD:EE:02\"}]}";

static void setup()
{
    EXPECT_TRUE(engine_init(s_engine, presence_defaultConfig(), feedback_defaultConfig()));
    s_file = FakeFile{};
    bridge_begin(s_bridge, fakeRead, &s_file, 100);
    bridge_start(s_bridge);
}

static void test_startup_load()
{
    setup();
    s_file.json = kOne;
    EXPECT_TRUE(bridge_reloadNow(s_bridge, s_engine, "startup"));
    EXPECT_EQ_INT(s_engine.tenantCount, 1);
    EXPECT_EQ_INT(s_file.reads, 1);
}

static void test_notification_waits_for_debounce()
{
    setup();
    s_file.json = kOne;
    bridge_reloadNow(s_bridge, s_engine, "startup");

    s_file.json = kTwo;
    EXPECT_TRUE(bridge_onNotified(s_bridge, 1000));
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 1050));
    EXPECT_EQ_INT(s_file.reads, 1);

    // A second notification pushes the deadline out.
    EXPECT_TRUE(bridge_onNotified(s_bridge, 1080));
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 1120));
    EXPECT_TRUE(bridge_poll(s_bridge, s_engine, 1180));
    EXPECT_EQ_INT(s_file.reads, 2);
    EXPECT_EQ_INT(s_engine.tenantCount, 2);

    // One reload per burst.
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 2000));
    EXPECT_EQ_INT(s_file.reads, 2);
}

static void test_unchanged_file_skips_reconcile()
{
    setup();
    s_file.json = kOne;
    bridge_reloadNow(s_bridge, s_engine, "startup");

    Observation obs;
    strncpy(obs.mac, "AA:BB:CC:DD:EE:01", sizeof(obs.mac) - 1);
    obs.rssiDbm = -50;
    obs.observedAtMs = 10;
    engine_ingest(s_engine, obs);

    bridge_onNotified(s_bridge, 100);
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 300));
    EXPECT_EQ_INT(s_file.reads, 2);
    EXPECT_TRUE(s_engine.tenants[0].ewmaValid);
    EXPECT_EQ_INT(tracker_packetCount(s_engine.tenants[0]), 1);
}

static void test_bad_file_falls_back_to_empty()
{
    setup();
    s_file.json = kTwo;
    bridge_reloadNow(s_bridge, s_engine, "startup");
    EXPECT_EQ_INT(s_engine.tenantCount, 2);

    s_file.json = "{\"tenantsAndMacs\":[{\"id\":\"x\",";
    bridge_onNotified(s_bridge, 0);
    EXPECT_TRUE(bridge_poll(s_bridge, s_engine, 100));
    EXPECT_EQ_INT(s_engine.tenantCount, 0);
    EXPECT_EQ_INT(s_bridge.readFailures, 1);

    // Next notification retries from scratch.
    s_file.json = kOne;
    bridge_onNotified(s_bridge, 500);
    EXPECT_TRUE(bridge_poll(s_bridge, s_engine, 600));
    EXPECT_EQ_INT(s_engine.tenantCount, 1);

    s_file.readError = true;
    EXPECT_TRUE(bridge_reloadNow(s_bridge, s_engine, "manual"));
    EXPECT_EQ_INT(s_engine.tenantCount, 0);

    s_file.readError = false;
    s_file.json = nullptr;
    EXPECT_FALSE(bridge_reloadNow(s_bridge, s_engine, "manual"));
    EXPECT_EQ_INT(s_engine.tenantCount, 0);
}

static void test_stopped_bridge_ignores_notifications()
{
    setup();
    s_file.json = kOne;
    EXPECT_TRUE(bridge_isRunning(s_bridge));
    EXPECT_TRUE(bridge_onNotified(s_bridge, 0));
    bridge_stop(s_bridge);
    EXPECT_FALSE(bridge_isRunning(s_bridge));
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 500));
    EXPECT_FALSE(bridge_onNotified(s_bridge, 600));
    EXPECT_EQ_INT(s_file.reads, 0);

    bridge_start(s_bridge);
    EXPECT_TRUE(bridge_isRunning(s_bridge));
    EXPECT_FALSE(bridge_poll(s_bridge, s_engine, 800));
    EXPECT_TRUE(bridge_onNotified(s_bridge, 900));
    EXPECT_TRUE(bridge_poll(s_bridge, s_engine, 1000));
    EXPECT_EQ_INT(s_engine.tenantCount, 1);
}

int main()
{
    test_startup_load();
    test_notification_waits_for_debounce();
    test_unchanged_file_skips_reconcile();
    test_bad_file_falls_back_to_empty();
    test_stopped_bridge_ignores_notifications();

    if (s_failures != 0)
    {
        std::fprintf(stderr, "registry_bridge tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("registry_bridge tests passed\n");
    return 0;
}
