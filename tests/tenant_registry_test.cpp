#include "test_macros.h"

#include <string.h>

#include "presence_engine.h"
#include "registry_source.h"
#include "signal_tracker.h"
#include "tenant_registry.h"

static PresenceEngine s_engine;
static RegistrySnapshot s_snap;

static PresenceEngine &freshEngine()
{
    EXPECT_TRUE(engine_init(s_engine, presence_defaultConfig(), feedback_defaultConfig()));
    return s_engine;
}

static const RegistrySnapshot &snapshotOf(const char *const *pairs, size_t n)
{
    registry_clearSnapshot(s_snap);
    for (size_t i = 0; i < n; ++i)
    {
        EXPECT_TRUE(registry_snapshotAdd(s_snap, pairs[2 * i], pairs[2 * i + 1]));
    }
    return s_snap;
}

static void observe(PresenceEngine &engine, const char *mac, int8_t rssi, uint32_t atMs)
{
    Observation obs;
    strncpy(obs.mac, mac, sizeof(obs.mac) - 1);
    obs.rssiDbm = rssi;
    obs.observedAtMs = atMs;
    engine_ingest(engine, obs);
}

static void test_reconcile_adds_in_snapshot_order()
{
    PresenceEngine &engine = freshEngine();
    const char *pairs[] = {"alice", "aa:aa:aa:aa:aa:01", "bob", "aa:aa:aa:aa:aa:02"};
    ReconcileResult res{};
    EXPECT_TRUE(registry_applyIfChanged(engine, snapshotOf(pairs, 2), &res));
    EXPECT_EQ_INT(res.added, 2);
    EXPECT_EQ_INT(res.removed, 0);
    EXPECT_EQ_INT(engine.tenantCount, 2);
    EXPECT_EQ_STR(engine.tenants[0].tenantId, "alice");
    EXPECT_EQ_STR(engine.tenants[0].macAddress, "AA:AA:AA:AA:AA:01");
    EXPECT_EQ_STR(engine.tenants[1].tenantId, "bob");
    EXPECT_FALSE(engine.tenants[0].isNear);
    EXPECT_FALSE(engine.tenants[0].ewmaValid);
    EXPECT_FALSE(engine.tenants[0].lastSeenValid);
}

static void test_identical_snapshot_is_noop()
{
    PresenceEngine &engine = freshEngine();
    const char *pairs[] = {"alice", "AA:AA:AA:AA:AA:01"};
    EXPECT_TRUE(registry_applyIfChanged(engine, snapshotOf(pairs, 1)));
    for (uint32_t i = 0; i < 4; ++i)
    {
        observe(engine, "AA:AA:AA:AA:AA:01", -50, 100 * i);
    }
    const Tenant before = engine.tenants[0];

    ReconcileResult res{9, 9, 9, 9};
    EXPECT_FALSE(registry_applyIfChanged(engine, snapshotOf(pairs, 1), &res));
    EXPECT_EQ_INT(res.added, 9); // untouched: reconcile never ran

    const Tenant &after = engine.tenants[0];
    EXPECT_TRUE(after.isNear == before.isNear);
    EXPECT_NEAR_FLOAT(after.ewma, before.ewma, 0.0);
    EXPECT_EQ_INT(tracker_packetCount(after), tracker_packetCount(before));
    EXPECT_EQ_INT(after.pendingRssi.count, before.pendingRssi.count);
}

static void test_rename_keeps_live_state()
{
    PresenceEngine &engine = freshEngine();
    const char *v1[] = {"alice", "AA:AA:AA:AA:AA:01", "bob", "AA:AA:AA:AA:AA:02"};
    registry_applyIfChanged(engine, snapshotOf(v1, 2));
    for (uint32_t i = 0; i < 5; ++i)
    {
        observe(engine, "AA:AA:AA:AA:AA:01", -55, 100 * i);
    }
    const Tenant *alice = registry_find(engine, "AA:AA:AA:AA:AA:01");
    EXPECT_TRUE(alice->isNear);
    const float ewma = alice->ewma;

    // alice's phone now belongs to carol, bob is gone, dave is new.
    const char *v2[] = {"dave", "AA:AA:AA:AA:AA:03", "carol", "aa-aa-aa-aa-aa-01"};
    ReconcileResult res{};
    EXPECT_TRUE(registry_applyIfChanged(engine, snapshotOf(v2, 2), &res));
    EXPECT_EQ_INT(res.added, 1);
    EXPECT_EQ_INT(res.removed, 1);
    EXPECT_EQ_INT(res.renamed, 1);
    EXPECT_EQ_INT(res.kept, 0);
    EXPECT_EQ_INT(engine.tenantCount, 2);

    const Tenant *carol = registry_find(engine, "AA:AA:AA:AA:AA:01");
    EXPECT_TRUE(carol != nullptr);
    EXPECT_EQ_STR(carol->tenantId, "carol");
    EXPECT_TRUE(carol->isNear);
    EXPECT_NEAR_FLOAT(carol->ewma, ewma, 0.0);
    EXPECT_EQ_INT(tracker_packetCount(*carol), 5);
    EXPECT_EQ_INT(carol->pendingRssi.count, 5);
    EXPECT_TRUE(registry_find(engine, "AA:AA:AA:AA:AA:02") == nullptr);
    EXPECT_EQ_STR(engine.tenants[0].tenantId, "dave");
}

static void test_duplicate_mac_last_id_wins()
{
    PresenceEngine &engine = freshEngine();
    const char *pairs[] = {"first", "AA:AA:AA:AA:AA:01", "other", "AA:AA:AA:AA:AA:02", "second", "AA:AA:AA:AA:AA:01"};
    ReconcileResult res{};
    registry_applyIfChanged(engine, snapshotOf(pairs, 3), &res);
    EXPECT_EQ_INT(engine.tenantCount, 2);
    EXPECT_EQ_INT(res.added, 2);
    EXPECT_EQ_STR(engine.tenants[0].tenantId, "second");
    EXPECT_EQ_STR(engine.tenants[1].tenantId, "other");
}

static void test_empty_snapshot_removes_everyone()
{
    PresenceEngine &engine = freshEngine();
    const char *pairs[] = {"alice", "AA:AA:AA:AA:AA:01"};
    registry_applyIfChanged(engine, snapshotOf(pairs, 1));

    ReconcileResult res{};
    EXPECT_TRUE(registry_applyIfChanged(engine, snapshotOf(pairs, 0), &res));
    EXPECT_EQ_INT(res.removed, 1);
    EXPECT_EQ_INT(engine.tenantCount, 0);
}

static void test_parse_registry_document()
{
    RegistrySnapshot snap;
    const char *json = "{\"tenantsAndMacs\":[{\"id\":\"alice\",\"mac\":\"aa:bb:cc:dd:ee:01\"},"
                       "{\"id\":\"bob\",\"mac\":\"AA-BB-CC-DD-EE-02\"}]}";
    EXPECT_TRUE(registry_parseJson(json, strlen(json), snap) == RegistryParseError::OK);
    EXPECT_EQ_INT(snap.count, 2);
    EXPECT_EQ_STR(snap.entries[0].tenantId, "alice");
    EXPECT_EQ_STR(snap.entries[0].mac, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ_STR(snap.entries[1].mac, "AA:BB:CC:DD:EE:02");
}

static void test_parse_missing_key_is_empty()
{
    RegistrySnapshot snap;
    const char *json = "{\"somethingElse\":[]}";
    EXPECT_TRUE(registry_parseJson(json, strlen(json), snap) == RegistryParseError::OK);
    EXPECT_EQ_INT(snap.count, 0);

    const char *emptyList = "{\"tenantsAndMacs\":[]}";
    EXPECT_TRUE(registry_parseJson(emptyList, strlen(emptyList), snap) == RegistryParseError::OK);
    EXPECT_EQ_INT(snap.count, 0);
}

static void test_parse_rejects_malformed_documents()
{
    RegistrySnapshot snap;
    const char *cases[] = {
        "{\"tenantsAndMacs\":[{\"id\":\"alice\",\"mac\":\"nope\"}]}",
        "{\"tenantsAndMacs\":[{\"mac\":\"AA:BB:CC:DD:EE:01\"}]}",
        "{\"tenantsAndMacs\":[\"AA:BB:CC:DD:EE:01\"]}",
        "{\"tenantsAndMacs\":{}}",
        "[1,2,3]",
        "{\"tenantsAndMacs\":[",
    };
    const RegistryParseError expected[] = {
        RegistryParseError::BAD_MAC,
        RegistryParseError::BAD_ENTRY,
        RegistryParseError::BAD_ENTRY,
        RegistryParseError::BAD_SHAPE,
        RegistryParseError::BAD_SHAPE,
        RegistryParseError::INVALID_JSON,
    };
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i)
    {
        const RegistryParseError err = registry_parseJson(cases[i], strlen(cases[i]), snap);
        EXPECT_EQ_INT((int)err, (int)expected[i]);
        EXPECT_EQ_INT(snap.count, 0);
    }

    EXPECT_TRUE(registry_parseJson("", 0, snap) == RegistryParseError::EMPTY_INPUT);
    EXPECT_TRUE(registry_parseJson(" \n", 2, snap) == RegistryParseError::EMPTY_INPUT);
    EXPECT_TRUE(registry_parseJson(nullptr, 0, snap) == RegistryParseError::EMPTY_INPUT);
}

static void test_parse_truncates_beyond_capacity()
{
    static char json[4096];
    size_t pos = (size_t)snprintf(json, sizeof(json), "{\"tenantsAndMacs\":[");
    for (unsigned i = 0; i < CFG_MAX_TENANTS + 2; ++i)
    {
        pos += (size_t)snprintf(json + pos, sizeof(json) - pos, "%s{\"id\":\"t%u\",\"mac\":\"AA:BB:CC:DD:%02X:%02X\"}",
                                i ? "," : "", i, i / 256, i % 256);
    }
    pos += (size_t)snprintf(json + pos, sizeof(json) - pos, "]}");

    RegistrySnapshot snap;
    EXPECT_TRUE(registry_parseJson(json, pos, snap) == RegistryParseError::OK);
    EXPECT_EQ_INT(snap.count, CFG_MAX_TENANTS);
    EXPECT_EQ_STR(snap.entries[0].tenantId, "t0");
}

static void test_build_json_parses_back()
{
    const char *pairs[] = {"alice", "AA:BB:CC:DD:EE:01"};
    const RegistrySnapshot &snap = snapshotOf(pairs, 1);
    char buf[256];
    size_t written = 0;
    EXPECT_TRUE(registry_buildJson(snap, buf, sizeof(buf), &written));
    EXPECT_EQ_STR(buf, "{\"tenantsAndMacs\":[{\"id\":\"alice\",\"mac\":\"AA:BB:CC:DD:EE:01\"}]}");
    EXPECT_EQ_INT(written, strlen(buf));

    char tiny[16];
    EXPECT_FALSE(registry_buildJson(snap, tiny, sizeof(tiny), &written));
    EXPECT_EQ_INT(written, 0);
}

int main()
{
    test_reconcile_adds_in_snapshot_order();
    test_identical_snapshot_is_noop();
    test_rename_keeps_live_state();
    test_duplicate_mac_last_id_wins();
    test_empty_snapshot_removes_everyone();
    test_parse_registry_document();
    test_parse_missing_key_is_empty();
    test_parse_rejects_malformed_documents();
    test_parse_truncates_beyond_capacity();
    test_build_json_parses_back();

    if (s_failures != 0)
    {
        std::fprintf(stderr, "tenant_registry tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("tenant_registry tests passed\n");
    return 0;
}
