#pragma once
#include <cmath>
#include <cstdio>
#include <cstring>

// Minimal host-side expectation macros. Include once per test binary;
// main() returns non-zero when s_failures is set.
static int s_failures = 0;

#define EXPECT_TRUE(expr)                                                                                               \
    do                                                                                                                  \
    {                                                                                                                   \
        if (!(expr))                                                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected true: %s\n", __FILE__, __LINE__, #expr);                          \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ_INT(actual, expected)                                                                                 \
    do                                                                                                                  \
    {                                                                                                                   \
        const long _a = (long)(actual);                                                                                 \
        const long _e = (long)(expected);                                                                               \
        if (_a != _e)                                                                                                   \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=%ld got %ld\n", __FILE__, __LINE__, #actual, _e, _a);          \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_NEAR_FLOAT(actual, expected, tol)                                                                        \
    do                                                                                                                  \
    {                                                                                                                   \
        const double _a = (double)(actual);                                                                             \
        const double _e = (double)(expected);                                                                           \
        if (std::fabs(_a - _e) > (double)(tol))                                                                         \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=%.4f got %.4f\n", __FILE__, __LINE__, #actual, _e, _a);        \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_EQ_STR(actual, expected)                                                                                 \
    do                                                                                                                  \
    {                                                                                                                   \
        const char *_a = (actual);                                                                                      \
        const char *_e = (expected);                                                                                    \
        if (!_a || std::strcmp(_a, _e) != 0)                                                                            \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=\"%s\" got \"%s\"\n", __FILE__, __LINE__, #actual, _e,         \
                         _a ? _a : "(null)");                                                                           \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)
