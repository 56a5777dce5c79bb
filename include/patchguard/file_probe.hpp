#pragma once

#include <ctime>
#include <string>

namespace patchguard {

// Current state of a built file, as the patch engine will see it
struct FileFacts {
    std::string md5;            // upper-case hex
    std::string version;        // "a.b.c.d", empty when the file carries none
    std::time_t last_write = 0;
};

struct FileProbeResult {
    bool exists = false;
    bool ok = false;            // facts were gathered
    std::string error;
    FileFacts facts;
};

/**
 * File system probes used by the detail check.
 *
 * Implementations must be safe to call from several threads at once.
 */
class FileProbe {
public:
    virtual ~FileProbe() = default;

    virtual FileProbeResult probe(const std::string& full_path) const = 0;
};

// Reads the real file: MD5 of its content, PE version resource, mtime
class DiskFileProbe : public FileProbe {
public:
    FileProbeResult probe(const std::string& full_path) const override;
};

} // namespace patchguard
