#include "patchguard/report.hpp"
#include "patchguard/platform.hpp"

#include <spdlog/spdlog.h>

namespace patchguard {

ReportWriteResult remove_stale_report(const std::string& path) {
    ReportWriteResult result;
    if (path_exists(path) && !remove_file(path)) {
        result.error = "cannot delete previous report " + path;
        return result;
    }
    result.ok = true;
    return result;
}

ReportWriteResult write_report(const std::string& path, const std::string& text) {
    ReportWriteResult result;

    auto write = atomic_write_file(path, text);
    if (!write.ok) {
        result.error = write.error;
        return result;
    }

    spdlog::info("Report written to {}", path);
    result.ok = true;
    return result;
}

} // namespace patchguard
