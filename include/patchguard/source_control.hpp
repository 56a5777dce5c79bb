#pragma once

#include <string>
#include <vector>

namespace patchguard {

// Files the version control system reports as untracked
struct UntrackedQueryResult {
    bool ok = false;
    std::vector<std::string> errors;   // stderr lines, or why the query could not run
    std::vector<std::string> files;    // relative to the queried directory, '\' separated
};

// git ls-files --other --exclude-standard, run inside dist_dir
UntrackedQueryResult query_untracked_files(const std::string& dist_dir);

// Name of the checked-out branch, or empty when it cannot be determined
std::string current_branch(const std::string& project_root);

// "Current source control branch: X", or empty when the branch is unknown
std::string build_header(const std::string& project_root);

} // namespace patchguard
