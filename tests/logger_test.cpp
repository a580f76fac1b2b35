#include "test_macros.h"

#include "logger.h"

static uint32_t s_clockMs = 0;
static int s_lines = 0;
static char s_lastLine[384];

static uint32_t fakeClock()
{
    return s_clockMs;
}

static void captureLine(const char *line)
{
    s_lines++;
    std::snprintf(s_lastLine, sizeof(s_lastLine), "%s", line);
}

static void resetCapture()
{
    s_lines = 0;
    s_lastLine[0] = '\0';
}

static void test_high_freq_off_mutes_debug_and_info_only()
{
    logger_setHighFreqEnabled(false);
    EXPECT_FALSE(logger_isHighFreqEnabled());
    s_clockMs = 10000;
    resetCapture();

    LOG_DEBUG_EVERY("dbg_tick", 1000, LogDomain::PUBLISH, "tick %d", 1);
    LOG_INFO_EVERY("info_tick", 1000, LogDomain::PUBLISH, "tick %d", 2);
    EXPECT_EQ_INT(s_lines, 0);

    LOG_WARN_EVERY("warn_drop", 1000, LogDomain::BLE, "dropped=%d", 3);
    EXPECT_EQ_INT(s_lines, 1);
    EXPECT_TRUE(std::strstr(s_lastLine, "dropped=3") != nullptr);

    LOG_ERROR_EVERY("err_json", 1000, LogDomain::PUBLISH, "serialize failed");
    EXPECT_EQ_INT(s_lines, 2);
    EXPECT_TRUE(std::strstr(s_lastLine, "serialize failed") != nullptr);

    // Plain logs are never gated.
    LOG_DEBUG(LogDomain::SYSTEM, "plain debug");
    EXPECT_EQ_INT(s_lines, 3);
}

static void test_throttle_applies_per_key()
{
    logger_setHighFreqEnabled(false);
    s_clockMs = 50000;
    resetCapture();

    LOG_WARN_EVERY("rd_fail", 30000, LogDomain::REGISTRY, "read failed count=%d", 1);
    s_clockMs += 10000;
    LOG_WARN_EVERY("rd_fail", 30000, LogDomain::REGISTRY, "read failed count=%d", 2);
    EXPECT_EQ_INT(s_lines, 1);

    LOG_WARN_EVERY("other_key", 30000, LogDomain::REGISTRY, "other");
    EXPECT_EQ_INT(s_lines, 2);

    s_clockMs += 20000;
    LOG_WARN_EVERY("rd_fail", 30000, LogDomain::REGISTRY, "read failed count=%d", 3);
    EXPECT_EQ_INT(s_lines, 3);
    EXPECT_TRUE(std::strstr(s_lastLine, "count=3") != nullptr);
}

static void test_high_freq_on_lets_debug_through()
{
    logger_setHighFreqEnabled(true);
    EXPECT_TRUE(logger_isHighFreqEnabled());
    s_clockMs = 200000;
    resetCapture();

    LOG_DEBUG_EVERY("dbg_tick", 1000, LogDomain::PUBLISH, "tick %d", 4);
    EXPECT_EQ_INT(s_lines, 1);
    EXPECT_TRUE(std::strstr(s_lastLine, "tick 4") != nullptr);
}

int main()
{
    logger_setClock(fakeClock);
    logger_setLineWriter(captureLine);

    test_high_freq_off_mutes_debug_and_info_only();
    test_throttle_applies_per_key();
    test_high_freq_on_lets_debug_through();

    logger_setLineWriter(nullptr);
    logger_setClock(nullptr);

    if (s_failures != 0)
    {
        std::fprintf(stderr, "logger tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("logger tests passed\n");
    return 0;
}
