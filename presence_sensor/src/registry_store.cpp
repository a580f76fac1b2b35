#include "registry_store.h"

#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>

#include "logger.h"
#include "tenant_registry.h"

static const char *REGISTRY_TMP_PATH = CFG_REGISTRY_PATH ".tmp";

static const uint32_t FNV_OFFSET = 2166136261u;
static const uint32_t FNV_PRIME = 16777619u;

// Loop-side buffers; the watcher task never touches them.
static char s_readBuf[CFG_REGISTRY_FILE_MAX + 1];
static char s_writeBuf[CFG_REGISTRY_FILE_MAX];

bool registry_storeBegin()
{
    if (!LittleFS.begin(true))
    {
        LOG_ERROR(LogDomain::REGISTRY, "LittleFS mount failed; registry will read as empty");
        return false;
    }
    LOG_INFO(LogDomain::REGISTRY, "LittleFS mounted used=%u total=%u path=%s",
             (unsigned)LittleFS.usedBytes(), (unsigned)LittleFS.totalBytes(), CFG_REGISTRY_PATH);
    return true;
}

RegistryParseError registry_storeRead(RegistrySnapshot &out, void *ctx)
{
    (void)ctx;
    registry_clearSnapshot(out);

    if (!LittleFS.exists(CFG_REGISTRY_PATH))
    {
        LOG_INFO(LogDomain::REGISTRY, "No registry file at %s; tracking nobody", CFG_REGISTRY_PATH);
        return RegistryParseError::OK;
    }

    File f = LittleFS.open(CFG_REGISTRY_PATH, FILE_READ);
    if (!f)
        return RegistryParseError::READ_FAILED;

    const size_t size = f.size();
    if (size > CFG_REGISTRY_FILE_MAX)
    {
        f.close();
        return RegistryParseError::TOO_LARGE;
    }

    const size_t n = f.readBytes(s_readBuf, size);
    f.close();
    if (n != size)
        return RegistryParseError::READ_FAILED;
    s_readBuf[n] = '\0';

    return registry_parseJson(s_readBuf, n, out);
}

bool registry_storeWrite(const RegistrySnapshot &snapshot)
{
    size_t len = 0;
    if (!registry_buildJson(snapshot, s_writeBuf, sizeof(s_writeBuf), &len))
    {
        LOG_WARN(LogDomain::REGISTRY, "Registry too large to write entries=%u", (unsigned)snapshot.count);
        return false;
    }

    File f = LittleFS.open(REGISTRY_TMP_PATH, FILE_WRITE);
    if (!f)
    {
        LOG_ERROR(LogDomain::REGISTRY, "Open failed path=%s", REGISTRY_TMP_PATH);
        return false;
    }
    const size_t written = f.write(reinterpret_cast<const uint8_t *>(s_writeBuf), len);
    f.close();
    if (written != len)
    {
        LOG_ERROR(LogDomain::REGISTRY, "Short write path=%s wrote=%u of %u", REGISTRY_TMP_PATH,
                  (unsigned)written, (unsigned)len);
        if (!LittleFS.remove(REGISTRY_TMP_PATH))
            LOG_WARN(LogDomain::REGISTRY, "Could not remove %s", REGISTRY_TMP_PATH);
        return false;
    }

    // littlefs rename replaces an existing target in one step.
    if (!LittleFS.rename(REGISTRY_TMP_PATH, CFG_REGISTRY_PATH))
    {
        LOG_ERROR(LogDomain::REGISTRY, "Rename failed %s -> %s", REGISTRY_TMP_PATH, CFG_REGISTRY_PATH);
        return false;
    }

    LOG_INFO(LogDomain::REGISTRY, "Registry written entries=%u bytes=%u", (unsigned)snapshot.count, (unsigned)len);
    return true;
}

bool registry_storeSignature(RegistryFileSignature &out)
{
    out = RegistryFileSignature{};
    if (!LittleFS.exists(CFG_REGISTRY_PATH))
        return true;

    File f = LittleFS.open(CFG_REGISTRY_PATH, FILE_READ);
    if (!f)
        return false;

    uint8_t chunk[128];
    uint32_t hash = FNV_OFFSET;
    uint32_t total = 0;
    for (;;)
    {
        const size_t n = f.read(chunk, sizeof(chunk));
        if (n == 0)
            break;
        for (size_t i = 0; i < n; ++i)
        {
            hash ^= chunk[i];
            hash *= FNV_PRIME;
        }
        total += (uint32_t)n;
    }
    f.close();

    out.exists = true;
    out.size = total;
    out.hash = hash;
    return true;
}

bool registry_signatureEquals(const RegistryFileSignature &a, const RegistryFileSignature &b)
{
    return a.exists == b.exists && a.size == b.size && a.hash == b.hash;
}
