#include "patchguard/source_control.hpp"
#include "patchguard/platform.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace patchguard {

namespace {

// Non-empty lines, trailing '\r' removed
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

} // namespace

UntrackedQueryResult query_untracked_files(const std::string& dist_dir) {
    UntrackedQueryResult result;

    auto cmd = run_command({"git", "ls-files", "--other", "--exclude-standard"}, dist_dir);
    if (!cmd.ok) {
        result.errors.push_back(cmd.error);
        return result;
    }

    result.errors = split_lines(cmd.stderr_text);
    if (cmd.exit_code != 0 && result.errors.empty()) {
        result.errors.push_back("git exited with status " + std::to_string(cmd.exit_code));
    }
    if (!result.errors.empty()) {
        return result;
    }

    // Library paths use Windows separators; report untracked files the same way
    for (auto& file : split_lines(cmd.stdout_text)) {
        for (auto& c : file) {
            if (c == '/') c = '\\';
        }
        result.files.push_back(file);
    }

    spdlog::debug("{} untracked files under {}", result.files.size(), dist_dir);
    result.ok = true;
    return result;
}

std::string current_branch(const std::string& project_root) {
    auto cmd = run_command({"git", "branch"}, project_root);
    if (!cmd.ok || cmd.exit_code != 0) {
        spdlog::warn("Cannot determine source control branch: {}",
                     cmd.ok ? cmd.stderr_text : cmd.error);
        return "";
    }

    for (const auto& line : split_lines(cmd.stdout_text)) {
        if (line[0] == '*') {
            size_t start = line.find_first_not_of(" \t", 1);
            return start == std::string::npos ? "" : line.substr(start);
        }
    }
    return "";
}

std::string build_header(const std::string& project_root) {
    auto branch = current_branch(project_root);
    if (branch.empty()) return "";
    return "Current source control branch: " + branch;
}

} // namespace patchguard
