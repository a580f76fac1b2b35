#pragma once
#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"

// Registry file shape: {"tenantsAndMacs":[{"id":"<tenant>","mac":"AA:BB:CC:DD:EE:FF"}, ...]}
static constexpr const char *REGISTRY_LIST_KEY = "tenantsAndMacs";

enum class RegistryParseError : uint8_t
{
    OK = 0,
    EMPTY_INPUT,
    INVALID_JSON,
    TOO_LARGE,
    BAD_SHAPE, // root is not an object, or the list is not an array
    BAD_ENTRY, // entry is not an object or has no usable id
    BAD_MAC,
    READ_FAILED // storage layer could not read the file
};

const char *registryParseErrorToString(RegistryParseError err);

// Parses a registry document into out (MACs normalized, file order kept).
// A missing list key yields an empty snapshot and OK.
// On any error out is left empty: one bad entry rejects the whole document.
// Entries beyond CFG_MAX_TENANTS are dropped with a warning.
RegistryParseError registry_parseJson(const char *json, size_t len, RegistrySnapshot &out);

// Canonical serialization of a snapshot (used when a new registry is written).
// Returns false when outSize is too small.
bool registry_buildJson(const RegistrySnapshot &snapshot, char *outBuf, size_t outSize, size_t *written);
