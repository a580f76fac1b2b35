#include "test_macros.h"

#include <string.h>

#include "commands.h"

struct AckLog
{
    char requestId[40];
    char type[24];
    char status[16];
    char msg[64];
    int count;
};

static AckLog s_ack;
static int s_reloads = 0;
static bool s_reloadChanged = false;
static int s_writes = 0;
static RegistrySnapshot s_written;
static bool s_writeOk = true;
static int s_publishCalls = 0;
static bool s_publishEnabled = false;
static int s_watchCalls = 0;
static bool s_watchEnabled = true;

static void copyTo(char *dst, size_t size, const char *src)
{
    strncpy(dst, src ? src : "", size);
    dst[size - 1] = '\0';
}

static bool fakeAck(const char *requestId, const char *type, const char *status, const char *msg)
{
    copyTo(s_ack.requestId, sizeof(s_ack.requestId), requestId);
    copyTo(s_ack.type, sizeof(s_ack.type), type);
    copyTo(s_ack.status, sizeof(s_ack.status), status);
    copyTo(s_ack.msg, sizeof(s_ack.msg), msg);
    s_ack.count++;
    return true;
}

static bool fakeReload()
{
    s_reloads++;
    return s_reloadChanged;
}

static bool fakeWrite(const RegistrySnapshot &snapshot)
{
    s_writes++;
    s_written = snapshot;
    return s_writeOk;
}

static void fakePublish(bool enabled)
{
    s_publishCalls++;
    s_publishEnabled = enabled;
}

static void fakeWatch(bool enabled)
{
    s_watchCalls++;
    s_watchEnabled = enabled;
}

static CmdStatus send(const char *json)
{
    return commands_handle(reinterpret_cast<const uint8_t *>(json), strlen(json));
}

static void test_rejects_bad_envelopes()
{
    EXPECT_TRUE(send("not json") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "invalid_json");

    EXPECT_TRUE(send("{\"schema\":2,\"request_id\":\"r1\",\"type\":\"reload_registry\"}") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "invalid_schema_or_type");
    EXPECT_EQ_STR(s_ack.requestId, "r1");

    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r2\",\"type\":\"reboot\"}") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "unknown_type");
    EXPECT_EQ_INT(s_reloads, 0);
}

static void test_reload_registry()
{
    s_reloadChanged = true;
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r3\",\"type\":\"reload_registry\"}") == CmdStatus::APPLIED);
    EXPECT_EQ_INT(s_reloads, 1);
    EXPECT_EQ_STR(s_ack.status, "applied");
    EXPECT_EQ_STR(s_ack.msg, "changed");
    EXPECT_EQ_STR(s_ack.type, "reload_registry");
}

static void test_set_registry_validates_before_writing()
{
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r4\",\"type\":\"set_registry\",\"data\":{\"tenantsAndMacs\":"
                     "[{\"id\":\"alice\",\"mac\":\"aa:bb:cc:dd:ee:01\"}]}}") == CmdStatus::APPLIED);
    EXPECT_EQ_INT(s_writes, 1);
    EXPECT_EQ_INT(s_written.count, 1);
    EXPECT_EQ_STR(s_written.entries[0].mac, "AA:BB:CC:DD:EE:01");

    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r5\",\"type\":\"set_registry\",\"data\":{\"tenantsAndMacs\":"
                     "[{\"id\":\"alice\",\"mac\":\"zz\"}]}}") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "bad_mac");
    EXPECT_EQ_INT(s_writes, 1);

    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r6\",\"type\":\"set_registry\",\"data\":{}}") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "missing_tenantsAndMacs");

    // An empty list is a valid registry.
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r7\",\"type\":\"set_registry\",\"data\":{\"tenantsAndMacs\":[]}}") ==
                CmdStatus::APPLIED);
    EXPECT_EQ_INT(s_written.count, 0);

    s_writeOk = false;
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r8\",\"type\":\"set_registry\",\"data\":{\"tenantsAndMacs\":[]}}") ==
                CmdStatus::ERROR);
    EXPECT_EQ_STR(s_ack.msg, "write_failed");
    s_writeOk = true;
}

static void test_publish_and_watch_toggles()
{
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r9\",\"type\":\"publish\",\"data\":{\"enabled\":true}}") ==
                CmdStatus::APPLIED);
    EXPECT_EQ_INT(s_publishCalls, 1);
    EXPECT_TRUE(s_publishEnabled);
    EXPECT_EQ_STR(s_ack.msg, "enabled");

    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r10\",\"type\":\"watch\",\"data\":{\"enabled\":false}}") ==
                CmdStatus::APPLIED);
    EXPECT_EQ_INT(s_watchCalls, 1);
    EXPECT_FALSE(s_watchEnabled);
    EXPECT_EQ_INT(s_publishCalls, 1);

    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r11\",\"type\":\"watch\",\"data\":{\"enabled\":\"yes\"}}") ==
                CmdStatus::REJECTED);
    EXPECT_TRUE(send("{\"schema\":1,\"request_id\":\"r12\",\"type\":\"publish\"}") == CmdStatus::REJECTED);
    EXPECT_EQ_STR(s_ack.msg, "missing_enabled");
    EXPECT_EQ_INT(s_watchCalls, 1);
}

int main()
{
    CommandsContext ctx{};
    ctx.reloadRegistry = fakeReload;
    ctx.writeRegistry = fakeWrite;
    ctx.setPublishEnabled = fakePublish;
    ctx.setWatchEnabled = fakeWatch;
    ctx.publishAck = fakeAck;
    commands_begin(ctx);

    test_rejects_bad_envelopes();
    test_reload_registry();
    test_set_registry_validates_before_writing();
    test_publish_and_watch_toggles();

    if (s_failures != 0)
    {
        std::fprintf(stderr, "commands tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("commands tests passed\n");
    return 0;
}
