#include "patchguard/diagnostics.hpp"

#include <algorithm>

namespace patchguard {

Diagnostic make_error(ErrorCode code, const std::string& subject, const std::string& message) {
    return Diagnostic{Severity::Error, static_cast<int>(code), subject, message};
}

Diagnostic make_warning(WarningCode code, const std::string& subject, const std::string& message) {
    return Diagnostic{Severity::Warning, static_cast<int>(code), subject, message};
}

Diagnostic make_note(const std::string& subject, const std::string& message) {
    return Diagnostic{Severity::Note, 0, subject, message};
}

// ============================================================================
// DiagnosticLog Implementation
// ============================================================================

DiagnosticLog::DiagnosticLog(const DiagnosticLog& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    entries_ = other.entries_;
}

DiagnosticLog& DiagnosticLog::operator=(const DiagnosticLog& other) {
    if (this == &other) return *this;
    auto copy = other.entries();
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(copy);
    return *this;
}

void DiagnosticLog::append(Diagnostic diagnostic) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::append(std::vector<Diagnostic> diagnostics) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& d : diagnostics) {
        entries_.push_back(std::move(d));
    }
}

std::vector<Diagnostic> DiagnosticLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool DiagnosticLog::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

size_t DiagnosticLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t DiagnosticLog::count(Severity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [severity](const Diagnostic& d) {
                                                 return d.severity == severity;
                                             }));
}

// ============================================================================
// Rendering
// ============================================================================

std::string render_diagnostic(const Diagnostic& diagnostic) {
    switch (diagnostic.severity) {
        case Severity::Error:
            return "ERROR #" + std::to_string(diagnostic.code) + ": " + diagnostic.message;
        case Severity::Warning:
            return "WARNING #" + std::to_string(diagnostic.code) + ": " + diagnostic.message;
        case Severity::Note:
            return diagnostic.message;
    }
    return diagnostic.message;
}

std::string render_report(const DiagnosticLog& log, const std::string& build_header) {
    std::string out = build_header;
    if (!out.empty() && out.back() != '\n') {
        out += '\n';
    }

    for (const auto& d : log.entries()) {
        out += render_diagnostic(d);
        if (out.empty() || out.back() != '\n') {
            out += '\n';
        }
    }
    return out;
}

nlohmann::json report_to_json(const DiagnosticLog& log, const std::string& build_header) {
    nlohmann::json j;
    if (!build_header.empty()) {
        j["build"] = build_header;
    }

    auto entries = log.entries();
    j["errors"] = std::count_if(entries.begin(), entries.end(),
                                [](const Diagnostic& d) { return d.severity == Severity::Error; });
    j["warnings"] = std::count_if(entries.begin(), entries.end(),
                                  [](const Diagnostic& d) { return d.severity == Severity::Warning; });

    nlohmann::json items = nlohmann::json::array();
    for (const auto& d : entries) {
        nlohmann::json item;
        item["severity"] = severity_to_string(d.severity);
        item["code"] = d.code;
        if (d.severity == Severity::Error) {
            item["key"] = error_code_to_string(static_cast<ErrorCode>(d.code));
        } else if (d.severity == Severity::Warning) {
            item["key"] = warning_code_to_string(static_cast<WarningCode>(d.code));
        }
        item["subject"] = d.subject;
        item["message"] = d.message;
        items.push_back(std::move(item));
    }
    j["diagnostics"] = std::move(items);
    return j;
}

} // namespace patchguard
