#pragma once

#include "patchguard/config.hpp"
#include "patchguard/diagnostics.hpp"

#include <string>
#include <vector>

namespace patchguard {

constexpr const char* DEFAULT_REPORT_FILE = "InstallerIntegrity.log";

// ============================================================================
// Report File
// ============================================================================

struct ReportWriteResult {
    bool ok = false;
    std::string error;
};

// Delete a report left behind by an earlier run. Missing is fine.
ReportWriteResult remove_stale_report(const std::string& path);

// Atomically replace path with the report text
ReportWriteResult write_report(const std::string& path, const std::string& text);

// ============================================================================
// Mail Notification
// ============================================================================

struct MailMessage {
    std::string sender;
    std::vector<std::string> recipients;
    std::string subject;
    std::string body;
};

struct MailResult {
    bool ok = false;
    std::string error;
};

// RFC 5322 message text with CRLF line endings
std::string compose_mail(const MailMessage& message);

// Deliver message through the SMTP server at smtp_url (libcurl)
MailResult send_mail(const std::string& smtp_url, const MailMessage& message);

// Mail the report to the configured recipients
MailResult send_report_mail(const IntegrityConfig& config, const std::string& report_text);

} // namespace patchguard
