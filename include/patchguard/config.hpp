#pragma once

#include <string>
#include <vector>

namespace patchguard {

constexpr const char* CONFIG_SCHEMA = "patchguard.config.v1";

// ============================================================================
// Integrity Configuration
// ============================================================================

struct IntegrityConfig {
    std::string schema;

    // "integrity_checks" section. Patterns are case-insensitive partial paths
    // and may contain the ${config} placeholder.
    struct {
        std::vector<std::string> ignore_untracked;     // may exist in DistFiles untracked
        std::vector<std::string> ignore_version_zero;  // may legitimately be 0.0.0.0
    } integrity_checks;

    // Partial paths of files that are not part of the installation
    std::vector<std::string> omissions;

    // "failure_notification" section
    struct {
        std::vector<std::string> emailing_machines;  // hosts that mail the report
        std::vector<std::string> recipients;
        std::string sender;
        std::string smtp_url;                        // e.g. smtp://mail.example.org:25
        std::string subject = "Automatic Installer Integrity Report";
    } notification;

    std::string source_path;
};

// Configuration used when no config file exists
IntegrityConfig get_builtin_empty_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    IntegrityConfig config;
    std::vector<std::string> warnings;
};

// Parse configuration from a JSON string
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_config(const std::string& path);

// True when host_name (case-insensitive) is one of the emailing machines
bool is_emailing_machine(const IntegrityConfig& config, const std::string& host_name);

} // namespace patchguard
