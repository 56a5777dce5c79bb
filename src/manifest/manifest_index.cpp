#include "patchguard/manifest_index.hpp"
#include "patchguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <spdlog/spdlog.h>
#include <tinyxml2.h>

namespace patchguard {

namespace {

// Element name without any namespace prefix ("wix:Component" -> "Component")
const char* local_name(const tinyxml2::XMLElement* element) {
    const char* name = element->Name();
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

bool is_element(const tinyxml2::XMLElement* element, const char* name) {
    return element && std::strcmp(local_name(element), name) == 0;
}

std::string attribute(const tinyxml2::XMLElement* element, const char* name) {
    if (!element) return "";
    const char* value = element->Attribute(name);
    return value ? value : "";
}

const tinyxml2::XMLElement* parent_element(const tinyxml2::XMLElement* element) {
    const tinyxml2::XMLNode* parent = element->Parent();
    return parent ? parent->ToElement() : nullptr;
}

// Directory a component installs into: its own Directory attribute, or the
// enclosing Directory/DirectoryRef element
std::string component_directory(const tinyxml2::XMLElement* component) {
    std::string directory = attribute(component, "Directory");
    if (!directory.empty()) return directory;

    const auto* parent = parent_element(component);
    if (is_element(parent, "Directory") || is_element(parent, "DirectoryRef")) {
        return attribute(parent, "Id");
    }
    return "";
}

void index_component(const tinyxml2::XMLElement* element, ManifestSource& source) {
    std::string guid = attribute(element, "Guid");
    if (guid.empty()) return;

    ComponentRecord record;
    record.guid = guid;
    record.id = attribute(element, "Id");
    record.directory_id = component_directory(element);
    record.source_name = source.name;
    source.components.emplace(normalize_guid(guid), std::move(record));
}

void index_feature(const tinyxml2::XMLElement* element, ManifestSource& source) {
    std::string feature_id = attribute(element, "Id");
    if (feature_id.empty()) return;

    for (const auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (!is_element(child, "ComponentRef")) continue;
        std::string component_id = attribute(child, "Id");
        if (!component_id.empty()) {
            source.component_features[component_id].insert(feature_id);
        }
    }
}

void index_file(const tinyxml2::XMLElement* element, ManifestSource& source) {
    const auto* component = parent_element(element);
    if (!component) return;

    // The directory is the file's grandparent, unless the component names one
    std::string directory = attribute(component, "Directory");
    if (directory.empty()) {
        directory = attribute(parent_element(component), "Id");
    }
    if (directory.empty()) return;

    std::string file_source = attribute(element, "Source");
    if (file_source.empty()) {
        file_source = attribute(element, "src");
    }

    for (const char* name_attr : {"LongName", "Name"}) {
        std::string name = attribute(element, name_attr);
        if (!name.empty()) {
            source.files.emplace(std::make_pair(name, directory), file_source);
        }
    }
}

void index_element(const tinyxml2::XMLElement* element, ManifestSource& source) {
    for (const auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (is_element(child, "Component")) {
            index_component(child, source);
        } else if (is_element(child, "Feature") || is_element(child, "FeatureRef")) {
            index_feature(child, source);
        } else if (is_element(child, "File")) {
            index_file(child, source);
        }
        index_element(child, source);
    }
}

ManifestLoadResult index_document(const tinyxml2::XMLDocument& doc, const std::string& name) {
    ManifestLoadResult result;
    result.source.name = name;

    const auto* root = doc.RootElement();
    if (!root) {
        result.error = name + ": document has no root element";
        return result;
    }

    index_element(root, result.source);

    spdlog::debug("Indexed {}: {} components, {} referenced components, {} file names",
                  name, result.source.components.size(),
                  result.source.component_features.size(), result.source.files.size());

    result.ok = true;
    return result;
}

} // namespace

std::string normalize_guid(const std::string& guid) {
    std::string result;
    result.reserve(guid.size());
    for (char c : guid) {
        if (c == '{' || c == '}' || std::isspace(static_cast<unsigned char>(c))) continue;
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return result;
}

ManifestLoadResult load_manifest_source(const std::string& path) {
    tinyxml2::XMLDocument doc;
    if (doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS) {
        ManifestLoadResult result;
        result.source.name = path;
        result.error = "failed to load manifest " + path + ": " + doc.ErrorStr();
        return result;
    }
    return index_document(doc, path);
}

ManifestLoadResult parse_manifest_source(const std::string& xml, const std::string& name) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        ManifestLoadResult result;
        result.source.name = name;
        result.error = "failed to parse manifest " + name + ": " + doc.ErrorStr();
        return result;
    }
    return index_document(doc, name);
}

// ============================================================================
// ManifestIndex Implementation
// ============================================================================

ManifestIndex::ManifestIndex(std::vector<ManifestSource> sources, std::string project_root)
    : sources_(std::move(sources)), project_root_(std::move(project_root)) {
    // Feature references may live in a different source than the component
    for (auto& source : sources_) {
        for (auto& [guid, record] : source.components) {
            record.feature_ids = features_referencing(record.id);
        }
    }
}

bool ManifestIndex::has_component(const std::string& guid) const {
    return find_component(guid).has_value();
}

std::optional<ComponentRecord> ManifestIndex::find_component(const std::string& guid) const {
    std::string key = normalize_guid(guid);
    if (key.empty()) return std::nullopt;

    for (const auto& source : sources_) {
        auto it = source.components.find(key);
        if (it != source.components.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::set<std::string> ManifestIndex::features_referencing(const std::string& component_id) const {
    std::set<std::string> features;
    for (const auto& source : sources_) {
        auto it = source.component_features.find(component_id);
        if (it != source.component_features.end()) {
            features.insert(it->second.begin(), it->second.end());
        }
    }
    return features;
}

std::optional<std::string> ManifestIndex::find_file_elsewhere(const std::string& long_name,
                                                              const std::string& directory_id) const {
    if (long_name.empty() || directory_id.empty()) return std::nullopt;

    auto key = std::make_pair(long_name, directory_id);
    for (const auto& source : sources_) {
        auto it = source.files.find(key);
        if (it != source.files.end()) {
            return make_relative_path(it->second, project_root_);
        }
    }
    return std::nullopt;
}

} // namespace patchguard
