#include "test_macros.h"

#include "feedback_controller.h"
#include "logger.h"

struct FakeActuator
{
    int16_t lastLevel = -1;
    int writes = 0;
    bool fail = false;
};

static bool fakeWrite(int16_t level, void *ctx)
{
    FakeActuator *a = static_cast<FakeActuator *>(ctx);
    a->writes++;
    if (a->fail)
        return false;
    a->lastLevel = level;
    return true;
}

static void test_ramps_up_and_clamps()
{
    const FeedbackConfig cfg = feedback_defaultConfig();
    FeedbackState st;
    feedback_init(st, cfg);
    EXPECT_EQ_INT(st.level, 10);

    FakeActuator act;
    int16_t expected = 10;
    for (int i = 0; i < 8; ++i)
    {
        expected = (int16_t)(expected + 30 > 255 ? 255 : expected + 30);
        EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITTEN);
        EXPECT_EQ_INT(st.level, expected);
        EXPECT_EQ_INT(act.lastLevel, expected);
    }
    EXPECT_EQ_INT(st.level, 250);
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITTEN);
    EXPECT_EQ_INT(st.level, 255);

    // At the bound nothing is written.
    const int writes = act.writes;
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::UNCHANGED);
    EXPECT_EQ_INT(act.writes, writes);
}

static void test_fades_down_faster()
{
    const FeedbackConfig cfg = feedback_defaultConfig();
    FeedbackState st;
    feedback_init(st, cfg);
    st.level = 255;

    FakeActuator act;
    const int16_t expected[] = {195, 135, 75, 15, 10};
    for (int16_t want : expected)
    {
        EXPECT_TRUE(feedback_step(st, cfg, false, fakeWrite, &act) == FeedbackResult::WRITTEN);
        EXPECT_EQ_INT(st.level, want);
    }
    EXPECT_TRUE(feedback_step(st, cfg, false, fakeWrite, &act) == FeedbackResult::UNCHANGED);
    EXPECT_EQ_INT(act.writes, 5);
}

static void test_write_failure_is_isolated()
{
    const FeedbackConfig cfg = feedback_defaultConfig();
    FeedbackState st;
    feedback_init(st, cfg);

    FakeActuator act;
    act.fail = true;
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITE_FAILED);
    EXPECT_EQ_INT(st.level, 10);
    EXPECT_EQ_INT(st.writeFailures, 1);
    EXPECT_EQ_INT(act.writes, 1);

    // Next tick tries again from the last level that actually landed.
    act.fail = false;
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITTEN);
    EXPECT_EQ_INT(st.level, 40);

    EXPECT_TRUE(feedback_step(st, cfg, true, nullptr, nullptr) == FeedbackResult::WRITE_FAILED);
    EXPECT_EQ_INT(st.level, 40);
}

static uint32_t s_clockMs = 0;
static int s_failureLines = 0;

static uint32_t fakeClock()
{
    return s_clockMs;
}

static void countFailureLines(const char *line)
{
    if (std::strstr(line, "write_failed") != nullptr)
        s_failureLines++;
}

static void test_write_failures_logged_with_high_freq_off()
{
    logger_setClock(fakeClock);
    logger_setLineWriter(countFailureLines);
    logger_setHighFreqEnabled(false);
    s_clockMs = 100000;
    s_failureLines = 0;

    const FeedbackConfig cfg = feedback_defaultConfig();
    FeedbackState st;
    feedback_init(st, cfg);
    FakeActuator act;
    act.fail = true;
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITE_FAILED);
        s_clockMs += 10000;
    }
    EXPECT_EQ_INT(st.writeFailures, 5);
    EXPECT_EQ_INT(s_failureLines, 5);

    // Inside the throttle interval the repeat is held back.
    s_failureLines = 0;
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITE_FAILED);
    s_clockMs += 1000;
    EXPECT_TRUE(feedback_step(st, cfg, true, fakeWrite, &act) == FeedbackResult::WRITE_FAILED);
    EXPECT_EQ_INT(s_failureLines, 1);

    logger_setHighFreqEnabled(true);
    logger_setLineWriter(nullptr);
    logger_setClock(nullptr);
}

int main()
{
    test_ramps_up_and_clamps();
    test_fades_down_faster();
    test_write_failure_is_isolated();
    test_write_failures_logged_with_high_freq_off();

    if (s_failures != 0)
    {
        std::fprintf(stderr, "feedback_controller tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("feedback_controller tests passed\n");
    return 0;
}
