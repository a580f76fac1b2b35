#include "mac_address.h"

#include <ctype.h>
#include <stdint.h>
#include <string.h>

static constexpr size_t kMacOctets = 6;
static constexpr size_t kMacCanonLen = 17;

static int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool mac_normalize(const char *in, char *out, size_t outSize)
{
    if (!out || outSize <= kMacCanonLen)
        return false;
    out[0] = '\0';
    if (!in)
        return false;

    // Skip surrounding whitespace only; everything else must be exact.
    while (*in && isspace((unsigned char)*in))
        ++in;
    size_t len = strlen(in);
    while (len > 0 && isspace((unsigned char)in[len - 1]))
        --len;

    // Either 12 bare hex digits or 17 chars with one consistent separator.
    char sep = 0;
    if (len == kMacCanonLen)
    {
        sep = in[2];
        if (sep != ':' && sep != '-')
            return false;
    }
    else if (len != kMacOctets * 2)
    {
        return false;
    }

    uint8_t octets[kMacOctets] = {0};
    size_t pos = 0;
    for (size_t i = 0; i < kMacOctets; ++i)
    {
        if (i > 0 && sep != 0)
        {
            if (in[pos] != sep)
                return false;
            ++pos;
        }
        const int hi = hexValue(in[pos]);
        const int lo = hexValue(in[pos + 1]);
        if (hi < 0 || lo < 0)
            return false;
        octets[i] = (uint8_t)((hi << 4) | lo);
        pos += 2;
    }

    static const char kHex[] = "0123456789ABCDEF";
    size_t o = 0;
    for (size_t i = 0; i < kMacOctets; ++i)
    {
        if (i > 0)
            out[o++] = ':';
        out[o++] = kHex[octets[i] >> 4];
        out[o++] = kHex[octets[i] & 0x0F];
    }
    out[o] = '\0';
    return true;
}

bool mac_equals(const char *a, const char *b)
{
    char na[kMacCanonLen + 1];
    char nb[kMacCanonLen + 1];
    if (!mac_normalize(a, na, sizeof(na)) || !mac_normalize(b, nb, sizeof(nb)))
        return false;
    return strcmp(na, nb) == 0;
}
