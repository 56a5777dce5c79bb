#include "patchguard/fragment.hpp"
#include "patchguard/digest.hpp"

#include <tinyxml2.h>

namespace patchguard {

namespace {

constexpr const char* UNKNOWN_COMPONENT_ID = "[unknown]";

bool is_identifier_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.';
}

bool is_identifier_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

// "--" may not appear inside an XML comment
std::string comment_text(const std::string& text) {
    std::string result = " ";
    for (char c : text) {
        if (c == '-' && !result.empty() && result.back() == '-') {
            result.push_back(' ');
        }
        result.push_back(c);
    }
    if (result.back() == '-') result.push_back(' ');
    result.push_back(' ');
    return result;
}

void push_comment(tinyxml2::XMLPrinter& printer, const std::string& text) {
    printer.PushComment(comment_text(text).c_str());
}

void push_disabled_component(tinyxml2::XMLPrinter& printer, const CorrectiveFragment& fragment) {
    // Transitive makes the installer re-evaluate the condition on every
    // maintenance run; the false condition then leaves it uninstalled.
    printer.OpenElement("Component");
    printer.PushAttribute("Id", fragment.component_id.c_str());
    printer.PushAttribute("Transitive", "yes");
    printer.PushAttribute("Guid", fragment.orphan_guid.c_str());

    printer.OpenElement("Condition");
    printer.PushText("FALSE");
    printer.CloseElement();

    // A component needs a key path (ICE18)
    printer.OpenElement("CreateFolder");
    printer.CloseElement();

    printer.CloseElement();
}

void push_removal_component(tinyxml2::XMLPrinter& printer, OrphanKind kind,
                            const RemovalComponent& removal) {
    printer.OpenElement("Component");
    printer.PushAttribute("Id", removal.id.c_str());
    printer.PushAttribute("Guid", removal.guid.c_str());

    if (kind == OrphanKind::File) {
        printer.OpenElement("RemoveFile");
        printer.PushAttribute("Id", removal.id.c_str());
        printer.PushAttribute("Name", removal.short_name.c_str());
        if (removal.long_name != removal.short_name) {
            printer.PushAttribute("LongName", removal.long_name.c_str());
        }
        printer.PushAttribute("On", "install");
        printer.CloseElement();
    } else {
        printer.OpenElement("Registry");
        printer.PushAttribute("Root", removal.registry_root.c_str());
        printer.PushAttribute("Key", removal.registry_key.c_str());
        printer.PushAttribute("Action", "removeKeyOnInstall");
        printer.PushAttribute("Id", removal.id.c_str());
        printer.CloseElement();
    }

    printer.OpenElement("CreateFolder");
    printer.CloseElement();

    printer.CloseElement();
}

CorrectiveFragment start_fragment(OrphanKind kind, const std::string& subject,
                                  const std::string& guid, const std::string& directory_id,
                                  const std::string& component_id,
                                  const std::vector<std::string>& features) {
    CorrectiveFragment fragment;
    fragment.kind = kind;
    fragment.subject = subject;
    fragment.orphan_guid = guid;
    fragment.directory_id = directory_id;
    fragment.component_id = component_id.empty() ? UNKNOWN_COMPONENT_ID : component_id;
    fragment.feature_ids = features;
    return fragment;
}

} // namespace

// ============================================================================
// Deterministic Identifiers
// ============================================================================

std::string sanitize_identifier(const std::string& name) {
    std::string candidate = name;
    for (auto& c : candidate) {
        if (!is_identifier_char(c)) c = '_';
    }

    // Can't start with a digit or a period
    if (candidate.empty() || !is_identifier_start(candidate.front())) {
        candidate.insert(candidate.begin(), '_');
    }
    return candidate;
}

IdentifierResult make_id(const std::string& name, const std::string& unique_seed) {
    IdentifierResult result;

    auto hash = compute_md5(unique_seed);
    if (!hash.ok) {
        result.error = hash.error;
        return result;
    }

    std::string candidate = sanitize_identifier(name);
    size_t max_main_length = MAX_IDENTIFIER_LENGTH - hash.hex_digest.size() - 1;
    if (candidate.size() > max_main_length) {
        candidate.resize(max_main_length);
    }

    result.id = candidate + "." + hash.hex_digest;
    result.ok = true;
    return result;
}

// ============================================================================
// Synthesis
// ============================================================================

CorrectiveFragment synthesize_file_fragment(const FileLibraryEntry& entry,
                                            const ManifestIndex& index,
                                            const GuidGenerator& new_guid) {
    auto fragment = start_fragment(OrphanKind::File, entry.path, entry.component_guid,
                                   entry.directory_id, entry.component_id, entry.feature_list);

    // A file now taken from another source folder but installed to the same
    // directory must stay on the user's machine; only the old component goes.
    fragment.relocated_source = index.find_file_elsewhere(entry.long_name, entry.directory_id);

    if (fragment.directory_id.empty() || fragment.relocated_source) {
        return fragment;
    }

    std::string name = entry.long_name != entry.short_name ? entry.long_name : entry.short_name;
    auto id = make_id("Del" + name, fragment.component_id);
    if (!id.ok) {
        fragment.error = id.error;
        return fragment;
    }

    RemovalComponent removal;
    removal.id = id.id;
    removal.guid = new_guid();
    removal.short_name = entry.short_name;
    removal.long_name = entry.long_name;
    fragment.removal = std::move(removal);
    return fragment;
}

CorrectiveFragment synthesize_registry_fragment(const RegistryLibraryEntry& entry,
                                                const GuidGenerator& new_guid) {
    auto fragment = start_fragment(OrphanKind::Registry, entry.root + "\\" + entry.key_header,
                                   entry.guid, entry.directory_id, entry.id, entry.feature_list);

    if (fragment.directory_id.empty()) {
        return fragment;
    }

    auto id = make_id("Del" + fragment.component_id, fragment.component_id);
    if (!id.ok) {
        fragment.error = id.error;
        return fragment;
    }

    RemovalComponent removal;
    removal.id = id.id;
    removal.guid = new_guid();
    removal.registry_root = entry.root;
    removal.registry_key = entry.key_header;
    fragment.removal = std::move(removal);
    return fragment;
}

std::string render_fragment(const CorrectiveFragment& fragment) {
    tinyxml2::XMLPrinter printer;

    const char* kind = fragment.kind == OrphanKind::File ? "File" : "Registry";
    push_comment(printer, std::string(kind) + " component " + fragment.orphan_guid + " [" +
                              fragment.subject + "] is missing from (Auto)Files.wxs");
    if (fragment.relocated_source) {
        push_comment(printer, "However, same file is now sourced from " + *fragment.relocated_source + ".");
    }

    if (fragment.directory_id.empty()) {
        push_comment(printer, "WARNING: Could not locate DirectoryId");
        return printer.CStr();
    }
    if (!fragment.error.empty()) {
        push_comment(printer, "WARNING: Could not derive a component identifier: " + fragment.error);
        return printer.CStr();
    }

    push_comment(printer, "Suggested PatchCorrections.wxs snippet:");

    printer.OpenElement("DirectoryRef");
    printer.PushAttribute("Id", fragment.directory_id.c_str());
    push_disabled_component(printer, fragment);
    if (fragment.removal) {
        push_removal_component(printer, fragment.kind, *fragment.removal);
    }
    printer.CloseElement();

    if (fragment.feature_ids.empty()) {
        push_comment(printer, "WARNING: No features specified for above component(s)");
    }
    for (const auto& feature : fragment.feature_ids) {
        printer.OpenElement("FeatureRef");
        printer.PushAttribute("Id", feature.c_str());

        printer.OpenElement("ComponentRef");
        printer.PushAttribute("Id", fragment.component_id.c_str());
        printer.CloseElement();

        if (fragment.removal) {
            printer.OpenElement("ComponentRef");
            printer.PushAttribute("Id", fragment.removal->id.c_str());
            printer.CloseElement();
        }

        printer.CloseElement();
    }

    // A complete snippet is followed by an empty line in the report
    std::string text = printer.CStr();
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text + "\n\n";
}

} // namespace patchguard
