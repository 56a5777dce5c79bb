#include "patchguard/file_probe.hpp"
#include "patchguard/digest.hpp"
#include "patchguard/platform.hpp"

namespace patchguard {

FileProbeResult DiskFileProbe::probe(const std::string& full_path) const {
    FileProbeResult result;

    if (!is_regular_file(full_path)) {
        return result;
    }
    result.exists = true;

    auto hash = compute_file_md5(full_path);
    if (!hash.ok) {
        result.error = hash.error;
        return result;
    }
    result.facts.md5 = hash.hex_digest;

    auto mtime = last_write_time(full_path);
    if (!mtime) {
        result.error = "cannot read modification time of " + full_path;
        return result;
    }
    result.facts.last_write = *mtime;

    // Files without a version resource simply have no version
    auto version = read_version_resource(full_path);
    if (version.ok) {
        result.facts.version = version.version;
    }

    result.ok = true;
    return result;
}

} // namespace patchguard
