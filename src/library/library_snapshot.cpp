#include "patchguard/library_snapshot.hpp"
#include "patchguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

#include <spdlog/spdlog.h>
#include <tinyxml2.h>

namespace patchguard {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string attribute(const tinyxml2::XMLElement* element, const char* name) {
    const char* value = element->Attribute(name);
    return value ? value : "";
}

FileLibraryEntry read_file_entry(const tinyxml2::XMLElement* element,
                                 std::vector<std::string>& issues) {
    FileLibraryEntry entry;
    entry.path = attribute(element, "Path");
    entry.released_date = attribute(element, "Date");
    entry.released_version = attribute(element, "Version");
    entry.released_md5 = attribute(element, "MD5");
    entry.feature_list = split_feature_list(attribute(element, "FeatureList"));
    entry.component_guid = attribute(element, "ComponentGuid");
    entry.component_id = attribute(element, "ComponentId");
    entry.directory_id = attribute(element, "DirectoryId");
    entry.long_name = attribute(element, "LongName");
    entry.short_name = attribute(element, "ShortName");

    if (entry.component_guid.empty()) {
        issues.push_back("File " + entry.path + " has no ComponentGuid; it cannot be matched to the manifest.");
    }

    if (!entry.released_date.empty()) {
        entry.released_time = parse_library_date(entry.released_date);
        if (!entry.released_time) {
            spdlog::warn("Unparseable library date '{}' for {}", entry.released_date, entry.path);
            issues.push_back("File " + entry.path + " has an unrecognized Date (" +
                             entry.released_date + "); its date/time stamp is not checked.");
        }
    }

    return entry;
}

RegistryLibraryEntry read_registry_entry(const tinyxml2::XMLElement* element,
                                         std::vector<std::string>& issues) {
    RegistryLibraryEntry entry;
    entry.guid = attribute(element, "ComponentGuid");
    entry.root = attribute(element, "Root");
    entry.key_header = attribute(element, "KeyHeader");
    entry.directory_id = attribute(element, "DirectoryId");
    entry.id = attribute(element, "Id");
    entry.feature_list = split_feature_list(attribute(element, "FeatureList"));

    if (entry.guid.empty()) {
        issues.push_back("Registry key " + entry.root + "\\" + entry.key_header +
                         " has no ComponentGuid; it cannot be matched to the manifest.");
    }
    return entry;
}

// Parse one library document; returns an error message on failure
std::string parse_document(const std::string& xml, const char* root_name, const char* entry_name,
                           const std::function<void(const tinyxml2::XMLElement*)>& visit) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return doc.ErrorStr();
    }

    const auto* root = doc.RootElement();
    if (!root || std::string(root->Name()) != root_name) {
        return std::string("root element must be <") + root_name + ">";
    }

    for (const auto* e = root->FirstChildElement(entry_name); e; e = e->NextSiblingElement(entry_name)) {
        visit(e);
    }
    return "";
}

} // namespace

std::vector<std::string> split_feature_list(const std::string& feature_list) {
    std::vector<std::string> features;
    size_t start = 0;
    while (start <= feature_list.size()) {
        size_t pos = feature_list.find(',', start);
        if (pos == std::string::npos) pos = feature_list.size();

        std::string feature = trim(feature_list.substr(start, pos - start));
        if (!feature.empty() && std::find(features.begin(), features.end(), feature) == features.end()) {
            features.push_back(feature);
        }
        start = pos + 1;
    }
    return features;
}

LibraryLoadResult parse_library_snapshot(const std::string& file_library_xml,
                                         const std::string& registry_library_xml) {
    LibraryLoadResult result;
    auto& snapshot = result.snapshot;

    if (!file_library_xml.empty()) {
        auto error = parse_document(file_library_xml, "FileLibrary", "File",
                                    [&snapshot](const tinyxml2::XMLElement* e) {
                                        snapshot.files.push_back(read_file_entry(e, snapshot.load_issues));
                                    });
        if (!error.empty()) {
            result.error = "invalid file library: " + error;
            return result;
        }
        snapshot.has_files = true;
    }

    if (!registry_library_xml.empty()) {
        auto error = parse_document(registry_library_xml, "RegLibrary", "Component",
                                    [&snapshot](const tinyxml2::XMLElement* e) {
                                        snapshot.registry.push_back(read_registry_entry(e, snapshot.load_issues));
                                    });
        if (!error.empty()) {
            result.error = "invalid registry library: " + error;
            return result;
        }
        snapshot.has_registry = true;
    }

    result.ok = true;
    return result;
}

LibraryLoadResult load_library_snapshot(const std::string& file_library_path,
                                        const std::string& registry_library_path) {
    std::string file_xml;
    std::string registry_xml;

    if (is_regular_file(file_library_path)) {
        auto content = read_file(file_library_path);
        if (!content || content->empty()) {
            LibraryLoadResult result;
            result.error = "failed to read " + file_library_path + (content ? " (empty file)" : "");
            return result;
        }
        file_xml = std::move(*content);
    } else {
        spdlog::info("No file library at {}; file checks skipped", file_library_path);
    }

    if (is_regular_file(registry_library_path)) {
        auto content = read_file(registry_library_path);
        if (!content || content->empty()) {
            LibraryLoadResult result;
            result.error = "failed to read " + registry_library_path + (content ? " (empty file)" : "");
            return result;
        }
        registry_xml = std::move(*content);
    } else {
        spdlog::info("No registry library at {}; registry checks skipped", registry_library_path);
    }

    auto result = parse_library_snapshot(file_xml, registry_xml);
    if (result.ok) {
        spdlog::debug("Library snapshot: {} files, {} registry components",
                      result.snapshot.files.size(), result.snapshot.registry.size());
    }
    return result;
}

} // namespace patchguard
