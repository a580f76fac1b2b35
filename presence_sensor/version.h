#pragma once
#include <stddef.h>

// Firmware version; override from the build, e.g. -DFW_VERSION=\"0.3.1\"
#ifndef FW_VERSION
#define FW_VERSION "0.1.0-dev"
#endif

namespace fw_version
{
template <size_t N>
constexpr size_t literal_size(const char (&)[N])
{
    return N;
}

static constexpr size_t kSizeWithNul = literal_size(FW_VERSION);
static_assert(kSizeWithNul >= 2, "FW_VERSION must be a non-empty string literal");
static_assert(kSizeWithNul <= 32, "FW_VERSION too long for the boot banner");
} // namespace fw_version
