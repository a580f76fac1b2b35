#pragma once
#include <stddef.h>

// Canonical form is upper-case, colon separated: "AA:BB:CC:DD:EE:FF".
// Accepts ':' or '-' separators (or none, 12 hex digits) in any case.
// Returns false and leaves out empty on malformed input or outSize < 18.
bool mac_normalize(const char *in, char *out, size_t outSize);

// True when both inputs normalize to the same address.
bool mac_equals(const char *a, const char *b);
