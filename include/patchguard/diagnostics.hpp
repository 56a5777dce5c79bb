#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace patchguard {

// ============================================================================
// Diagnostic Taxonomy
// ============================================================================

enum class Severity {
    Error,
    Warning,
    Note
};

inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Note: return "note";
        default: return "note";
    }
}

// Numeric values are part of the report format and must not change.
enum class ErrorCode {
    ModifiedWithoutVersionBump = 1,
    DateRegression = 2,
    MissingFeatureList = 3,
    FeatureAdded = 4,
    FeatureRemoved = 5,
    VersionLowered = 6,
    InvalidVersion = 7,
    FourthSegmentOnly = 8,
    VersionInfoRemoved = 9,
};

enum class WarningCode {
    NoFileLibrary = 1,  // Deprecated: a missing library is normal before the first release
    UntrackedFiles = 2,
    ZeroVersion = 3,
    SourceControlQueryFailed = 4,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::ModifiedWithoutVersionBump: return "modified_without_version_bump";
        case ErrorCode::DateRegression: return "date_regression";
        case ErrorCode::MissingFeatureList: return "missing_feature_list";
        case ErrorCode::FeatureAdded: return "feature_added";
        case ErrorCode::FeatureRemoved: return "feature_removed";
        case ErrorCode::VersionLowered: return "version_lowered";
        case ErrorCode::InvalidVersion: return "invalid_version";
        case ErrorCode::FourthSegmentOnly: return "fourth_segment_only";
        case ErrorCode::VersionInfoRemoved: return "version_info_removed";
        default: return "unknown";
    }
}

inline const char* warning_code_to_string(WarningCode c) {
    switch (c) {
        case WarningCode::NoFileLibrary: return "no_file_library";
        case WarningCode::UntrackedFiles: return "untracked_files";
        case WarningCode::ZeroVersion: return "zero_version";
        case WarningCode::SourceControlQueryFailed: return "source_control_query_failed";
        default: return "unknown";
    }
}

struct Diagnostic {
    Severity severity = Severity::Note;
    int code = 0;              // 1..9 for errors, 1..4 for warnings, 0 for notes
    std::string subject;       // affected path, registry key or component GUID
    std::string message;       // notes carry preformatted manifest text
};

Diagnostic make_error(ErrorCode code, const std::string& subject, const std::string& message);
Diagnostic make_warning(WarningCode code, const std::string& subject, const std::string& message);
Diagnostic make_note(const std::string& subject, const std::string& message);

// ============================================================================
// Diagnostic Log
// ============================================================================

/**
 * Append-only, ordered collection of diagnostics.
 *
 * Appends may come from several worker threads; entries are never mutated or
 * removed once added.
 */
class DiagnosticLog {
public:
    DiagnosticLog() = default;

    DiagnosticLog(const DiagnosticLog& other);
    DiagnosticLog& operator=(const DiagnosticLog& other);

    void append(Diagnostic diagnostic);
    void append(std::vector<Diagnostic> diagnostics);

    // Snapshot of all entries in emission order
    std::vector<Diagnostic> entries() const;

    bool empty() const;
    size_t size() const;
    size_t count(Severity severity) const;
    bool has_errors() const { return count(Severity::Error) > 0; }

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> entries_;
};

// ============================================================================
// Rendering
// ============================================================================

// One block per diagnostic, emission order preserved:
//   ERROR #n: message
//   WARNING #n: message
//   <note text verbatim>
std::string render_diagnostic(const Diagnostic& diagnostic);

// Full text report, prefixed by the build header when it is non-empty
std::string render_report(const DiagnosticLog& log, const std::string& build_header = "");

nlohmann::json report_to_json(const DiagnosticLog& log, const std::string& build_header = "");

} // namespace patchguard
