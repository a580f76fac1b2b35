#pragma once

#include <stddef.h>
#include <stdint.h>

#include "presence_state.h"
#include "registry_source.h"

#ifndef CFG_REGISTRY_PATH
#define CFG_REGISTRY_PATH "/tenants-and-macs.json"
#endif
#ifndef CFG_REGISTRY_FILE_MAX
#define CFG_REGISTRY_FILE_MAX 4096u
#endif

// Cheap change detector for the registry file: size plus FNV-1a over the content.
struct RegistryFileSignature
{
    bool exists = false;
    uint32_t size = 0;
    uint32_t hash = 0;
};

// Mounts LittleFS (formatting an unmountable partition).
bool registry_storeBegin();

// RegistryReadFn for the bridge. A missing file is an empty registry (OK).
RegistryParseError registry_storeRead(RegistrySnapshot &out, void *ctx);

// Writes the canonical JSON to a temp file, then renames it over the registry
// so readers never see a partial document.
bool registry_storeWrite(const RegistrySnapshot &snapshot);

// Safe to call from the watcher task; uses only its own stack buffer.
bool registry_storeSignature(RegistryFileSignature &out);
bool registry_signatureEquals(const RegistryFileSignature &a, const RegistryFileSignature &b);
