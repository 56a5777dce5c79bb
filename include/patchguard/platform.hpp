#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace patchguard {

// ============================================================================
// Embedded Version Resource
// ============================================================================

struct VersionResourceResult {
    bool ok = false;          // false when the resource is absent or malformed
    std::string error;
    std::string version;      // "major.minor.build.private"
};

// Read the fixed file version from a PE image's RT_VERSION resource
// (VS_FIXEDFILEINFO). Non-PE files and images without a version resource
// report ok == false with a reason.
VersionResourceResult read_version_resource(const std::string& binary_path);
VersionResourceResult read_version_resource(const std::vector<uint8_t>& binary_data);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format).
// Library and manifest paths are recorded with Windows separators.
std::string to_portable_path(const std::string& path);

// Replace the "${config}" placeholder with the active build flavor
std::string expand_config_placeholder(const std::string& path, const std::string& build_flavor);

// Case-insensitive substring match of any pattern against a path.
// Separators are normalized on both sides and "${config}" is expanded.
bool path_matches_any(const std::string& path,
                      const std::vector<std::string>& patterns,
                      const std::string& build_flavor);

// Strip root (and the separator after it) from the front of path, if present
std::string make_relative_path(const std::string& path, const std::string& root);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool remove_file(const std::string& path);

std::optional<std::string> read_file(const std::string& path);
std::vector<uint8_t> read_binary_file(const std::string& path);

// Last modification time of a file, in seconds since the epoch
std::optional<std::time_t> last_write_time(const std::string& path);

// ============================================================================
// Time
// ============================================================================

// Parse a library date in ISO ("2011-03-14 10:23[:45]", optional 'T') or
// US short form ("3/14/2011 10:23[:45] [AM|PM]"), interpreted as local time
std::optional<std::time_t> parse_library_date(const std::string& text);

// Format as local "YYYY-MM-DD HH:MM"
std::string format_local_time(std::time_t t);

// ============================================================================
// Processes
// ============================================================================

struct CommandResult {
    bool ok = false;          // process was started and waited for
    int exit_code = -1;
    std::string error;
    std::string stdout_text;
    std::string stderr_text;
};

// Run argv[0] (looked up on PATH) in working_dir, capturing both streams
CommandResult run_command(const std::vector<std::string>& argv, const std::string& working_dir);

// ============================================================================
// Environment
// ============================================================================

std::string get_host_name();

// Generate an upper-case random (version 4) UUID
std::string generate_uuid();

} // namespace patchguard
