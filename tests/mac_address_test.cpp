#include "test_macros.h"

#include "mac_address.h"

static void test_normalize_accepts_common_forms()
{
    char out[18];
    EXPECT_TRUE(mac_normalize("aa:bb:cc:dd:ee:ff", out, sizeof(out)));
    EXPECT_EQ_STR(out, "AA:BB:CC:DD:EE:FF");

    EXPECT_TRUE(mac_normalize("0a-1B-2c-3D-4e-5F", out, sizeof(out)));
    EXPECT_EQ_STR(out, "0A:1B:2C:3D:4E:5F");

    EXPECT_TRUE(mac_normalize("001122334455", out, sizeof(out)));
    EXPECT_EQ_STR(out, "00:11:22:33:44:55");

    EXPECT_TRUE(mac_normalize("  de:ad:be:ef:00:01\n", out, sizeof(out)));
    EXPECT_EQ_STR(out, "DE:AD:BE:EF:00:01");
}

static void test_normalize_rejects_malformed()
{
    char out[18];
    EXPECT_FALSE(mac_normalize(nullptr, out, sizeof(out)));
    EXPECT_EQ_STR(out, "");
    EXPECT_FALSE(mac_normalize("", out, sizeof(out)));
    EXPECT_FALSE(mac_normalize("AA:BB:CC:DD:EE", out, sizeof(out)));
    EXPECT_FALSE(mac_normalize("AA:BB:CC:DD:EE:FF:00", out, sizeof(out)));
    EXPECT_FALSE(mac_normalize("AA:BB-CC:DD:EE:FF", out, sizeof(out)));
    EXPECT_FALSE(mac_normalize("AA:BB:CC:DD:EE:FG", out, sizeof(out)));
    EXPECT_FALSE(mac_normalize("AA.BB.CC.DD.EE.FF", out, sizeof(out)));

    char small[10];
    EXPECT_FALSE(mac_normalize("AA:BB:CC:DD:EE:FF", small, sizeof(small)));
}

static void test_equals_ignores_format()
{
    EXPECT_TRUE(mac_equals("aa-bb-cc-dd-ee-ff", "AA:BB:CC:DD:EE:FF"));
    EXPECT_FALSE(mac_equals("AA:BB:CC:DD:EE:FF", "AA:BB:CC:DD:EE:FE"));
    EXPECT_FALSE(mac_equals("garbage", "garbage"));
}

int main()
{
    test_normalize_accepts_common_forms();
    test_normalize_rejects_malformed();
    test_equals_ignores_format();

    if (s_failures != 0)
    {
        std::fprintf(stderr, "mac_address tests failed: %d\n", s_failures);
        return 1;
    }

    std::printf("mac_address tests passed\n");
    return 0;
}
