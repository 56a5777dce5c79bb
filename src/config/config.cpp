#include "patchguard/config.hpp"
#include "patchguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace patchguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to get a string array from JSON; non-string members are reported
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key,
                                          std::vector<std::string>& warnings) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;

    if (!j[key].is_array()) {
        warnings.push_back("invalid_configuration:not_an_array:" + key);
        return result;
    }

    for (const auto& elem : j[key]) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        } else {
            warnings.push_back("invalid_configuration:non_string_entry:" + key);
        }
    }
    return result;
}

} // namespace

IntegrityConfig get_builtin_empty_config() {
    IntegrityConfig config;
    config.schema = CONFIG_SCHEMA;
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "integrity_checks" section
        if (j.contains("integrity_checks") && j["integrity_checks"].is_object()) {
            const auto& checks = j["integrity_checks"];
            result.config.integrity_checks.ignore_untracked =
                get_string_array(checks, "ignore_untracked", result.warnings);
            result.config.integrity_checks.ignore_version_zero =
                get_string_array(checks, "ignore_version_zero", result.warnings);
        }

        // "omissions"
        result.config.omissions = get_string_array(j, "omissions", result.warnings);

        // "failure_notification" section
        if (j.contains("failure_notification") && j["failure_notification"].is_object()) {
            const auto& notify = j["failure_notification"];
            auto& out = result.config.notification;

            out.emailing_machines = get_string_array(notify, "emailing_machines", result.warnings);
            out.recipients = get_string_array(notify, "recipients", result.warnings);

            if (auto sender = get_string(notify, "sender")) {
                out.sender = trim(*sender);
            }
            if (auto url = get_string(notify, "smtp_url")) {
                out.smtp_url = trim(*url);
            }
            if (auto subject = get_string(notify, "subject")) {
                out.subject = *subject;
            }

            if (!out.emailing_machines.empty() && (out.recipients.empty() || out.smtp_url.empty())) {
                result.warnings.push_back("invalid_configuration:incomplete_failure_notification");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot read " + path;
        return result;
    }
    return parse_config(*content, path);
}

bool is_emailing_machine(const IntegrityConfig& config, const std::string& host_name) {
    if (host_name.empty()) return false;

    std::string host = to_lower(host_name);
    for (const auto& machine : config.notification.emailing_machines) {
        if (to_lower(trim(machine)) == host) {
            return true;
        }
    }
    return false;
}

} // namespace patchguard
