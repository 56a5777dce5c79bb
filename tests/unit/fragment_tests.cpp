#include <doctest/doctest.h>
#include <patchguard/fragment.hpp>

#include <cctype>

using namespace patchguard;

namespace {

const char* FILES_WXS = R"(<Wix>
  <DirectoryRef Id="ProgramDir">
    <Component Id="core.dll" Guid="1B2C3D4E-0000-4000-8000-000000000001">
      <File Id="core.dll" Name="CORE.DLL" LongName="core.dll" Source="C:\Work\fw\DistFiles\core.dll"/>
    </Component>
  </DirectoryRef>
</Wix>)";

ManifestIndex make_index() {
    auto source = parse_manifest_source(FILES_WXS, "Files.wxs");
    REQUIRE(source.ok);
    return ManifestIndex({source.source}, "C:\\Work\\fw");
}

FileLibraryEntry orphaned_file() {
    FileLibraryEntry entry;
    entry.path = "Output\\${config}\\legacy.dll";
    entry.component_guid = "1B2C3D4E-0000-4000-8000-0000000000FF";
    entry.component_id = "legacy.dll";
    entry.directory_id = "ProgramDir";
    entry.long_name = "legacy.dll";
    entry.short_name = "LEGACY.DLL";
    entry.feature_list = {"Core", "Help"};
    return entry;
}

RegistryLibraryEntry orphaned_key() {
    RegistryLibraryEntry entry;
    entry.guid = "1B2C3D4E-0000-4000-8000-0000000000A1";
    entry.root = "HKLM";
    entry.key_header = "Software\\Example\\Product";
    entry.directory_id = "ProgramDir";
    entry.id = "RegProduct";
    entry.feature_list = {"Core"};
    return entry;
}

std::string fixed_guid() { return "00000000-1111-4222-8333-444444444444"; }

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ============================================================================
// Identifier Tests
// ============================================================================

TEST_CASE("make_id appends the upper-case MD5 of the seed") {
    auto id = make_id("Dellegacy.dll", "seed");
    REQUIRE(id.ok);
    CHECK(id.id == "Dellegacy.dll.FE4C0F30AA359C41D9F9A5F69C8C4192");
}

TEST_CASE("make_id is deterministic") {
    auto a = make_id("Del some file.txt", "component");
    auto b = make_id("Del some file.txt", "component");
    REQUIRE(a.ok);
    REQUIRE(b.ok);
    CHECK(a.id == b.id);
    CHECK(a.id != make_id("Del some file.txt", "other component").id);
}

TEST_CASE("make_id replaces characters outside [A-Za-z0-9_.]") {
    auto id = make_id("Del my-file (1).txt", "seed");
    REQUIRE(id.ok);
    CHECK(id.id == "Del_my_file__1_.txt.FE4C0F30AA359C41D9F9A5F69C8C4192");
}

TEST_CASE("make_id never starts with a digit or period") {
    for (const char* name : {"1st.dll", ".hidden", "", "-dash", "\xC3\xA9t\xC3\xA9"}) {
        auto id = make_id(name, "seed");
        REQUIRE(id.ok);
        REQUIRE_FALSE(id.id.empty());
        char first = id.id.front();
        CHECK((std::isalpha(static_cast<unsigned char>(first)) || first == '_'));
    }
    CHECK(make_id("1st.dll", "seed").id == "_1st.dll.FE4C0F30AA359C41D9F9A5F69C8C4192");
}

TEST_CASE("make_id never exceeds 72 characters") {
    std::string long_name(200, 'a');
    auto id = make_id(long_name, "seed");
    REQUIRE(id.ok);
    CHECK(id.id.size() == MAX_IDENTIFIER_LENGTH);
    CHECK(id.id == std::string(39, 'a') + ".FE4C0F30AA359C41D9F9A5F69C8C4192");

    auto short_id = make_id("x", "seed");
    REQUIRE(short_id.ok);
    CHECK(short_id.id.size() <= MAX_IDENTIFIER_LENGTH);
}

TEST_CASE("sanitize_identifier keeps valid identifiers unchanged") {
    CHECK(sanitize_identifier("Delcore.dll") == "Delcore.dll");
    CHECK(sanitize_identifier("_x") == "_x");
    CHECK(sanitize_identifier("") == "_");
}

// ============================================================================
// File Fragment Tests
// ============================================================================

TEST_CASE("synthesize_file_fragment disables the orphan and removes its file") {
    auto index = make_index();
    auto fragment = synthesize_file_fragment(orphaned_file(), index, fixed_guid);

    CHECK(fragment.kind == OrphanKind::File);
    CHECK(fragment.orphan_guid == "1B2C3D4E-0000-4000-8000-0000000000FF");
    CHECK(fragment.component_id == "legacy.dll");
    CHECK_FALSE(fragment.relocated_source);
    REQUIRE(fragment.removal);
    CHECK(fragment.removal->guid == fixed_guid());
    CHECK(fragment.removal->id == make_id("Dellegacy.dll", "legacy.dll").id);

    auto text = render_fragment(fragment);
    CHECK(contains(text, "<!-- File component 1B2C3D4E-0000-4000-8000-0000000000FF "
                         "[Output\\${config}\\legacy.dll] is missing from (Auto)Files.wxs -->"));
    CHECK(contains(text, "<!-- Suggested PatchCorrections.wxs snippet: -->"));
    CHECK(contains(text, "<DirectoryRef Id=\"ProgramDir\">"));
    CHECK(contains(text, "<Component Id=\"legacy.dll\" Transitive=\"yes\" "
                         "Guid=\"1B2C3D4E-0000-4000-8000-0000000000FF\">"));
    CHECK(contains(text, "<Condition>FALSE</Condition>"));
    CHECK(contains(text, "<Component Id=\"" + fragment.removal->id + "\" Guid=\"" + fixed_guid() + "\">"));
    CHECK(contains(text, "<RemoveFile Id=\"" + fragment.removal->id +
                             "\" Name=\"LEGACY.DLL\" LongName=\"legacy.dll\" On=\"install\"/>"));
    CHECK(contains(text, "<FeatureRef Id=\"Core\">"));
    CHECK(contains(text, "<FeatureRef Id=\"Help\">"));
    CHECK(contains(text, "<ComponentRef Id=\"legacy.dll\"/>"));
    CHECK(contains(text, "<ComponentRef Id=\"" + fragment.removal->id + "\"/>"));
}

TEST_CASE("synthesize_file_fragment omits LongName when it equals the short name") {
    auto entry = orphaned_file();
    entry.long_name = "LEGACY.DLL";
    auto fragment = synthesize_file_fragment(entry, make_index(), fixed_guid);

    REQUIRE(fragment.removal);
    CHECK(fragment.removal->id == make_id("DelLEGACY.DLL", "legacy.dll").id);
    auto text = render_fragment(fragment);
    CHECK(contains(text, "Name=\"LEGACY.DLL\" On=\"install\""));
    CHECK_FALSE(contains(text, "LongName="));
}

TEST_CASE("synthesize_file_fragment keeps a relocated file installed") {
    auto entry = orphaned_file();
    entry.long_name = "core.dll";
    entry.short_name = "CORE.DLL";
    auto fragment = synthesize_file_fragment(entry, make_index(), fixed_guid);

    REQUIRE(fragment.relocated_source);
    CHECK(*fragment.relocated_source == "DistFiles\\core.dll");
    CHECK_FALSE(fragment.removal);

    auto text = render_fragment(fragment);
    CHECK(contains(text, "<!-- However, same file is now sourced from DistFiles\\core.dll. -->"));
    CHECK(contains(text, "Transitive=\"yes\""));
    CHECK_FALSE(contains(text, "<RemoveFile"));
    CHECK(contains(text, "<ComponentRef Id=\"legacy.dll\"/>"));
}

TEST_CASE("synthesize_file_fragment without a directory suggests nothing") {
    auto entry = orphaned_file();
    entry.directory_id.clear();
    auto fragment = synthesize_file_fragment(entry, make_index(), fixed_guid);
    CHECK_FALSE(fragment.removal);

    auto text = render_fragment(fragment);
    CHECK(contains(text, "<!-- WARNING: Could not locate DirectoryId -->"));
    CHECK_FALSE(contains(text, "<DirectoryRef"));
    CHECK_FALSE(contains(text, "Suggested"));
    CHECK_FALSE(ends_with(text, "\n\n"));
}

TEST_CASE("render_fragment ends a complete snippet with an empty line") {
    auto with_features = render_fragment(synthesize_file_fragment(orphaned_file(), make_index(), fixed_guid));
    CHECK(ends_with(with_features, "</FeatureRef>\n\n"));
    CHECK_FALSE(ends_with(with_features, "\n\n\n"));

    auto entry = orphaned_file();
    entry.feature_list.clear();
    auto without_features = render_fragment(synthesize_file_fragment(entry, make_index(), fixed_guid));
    CHECK(ends_with(without_features, "component(s) -->\n\n"));

    auto registry = render_fragment(synthesize_registry_fragment(orphaned_key(), fixed_guid));
    CHECK(ends_with(registry, "</FeatureRef>\n\n"));
}

TEST_CASE("synthesize_file_fragment warns when no features were recorded") {
    auto entry = orphaned_file();
    entry.feature_list.clear();
    auto text = render_fragment(synthesize_file_fragment(entry, make_index(), fixed_guid));

    CHECK(contains(text, "<!-- WARNING: No features specified for above component(s) -->"));
    CHECK_FALSE(contains(text, "<FeatureRef"));
}

TEST_CASE("synthesize_file_fragment falls back to [unknown] component id") {
    auto entry = orphaned_file();
    entry.component_id.clear();
    auto fragment = synthesize_file_fragment(entry, make_index(), fixed_guid);

    CHECK(fragment.component_id == "[unknown]");
    REQUIRE(fragment.removal);
    CHECK(fragment.removal->id == "Dellegacy.dll.86269ACEC8DC1827C41FB457D6D25CA5");
}

TEST_CASE("render_fragment keeps comments well formed") {
    auto entry = orphaned_file();
    entry.path = "DistFiles\\odd--name.txt-";
    auto text = render_fragment(synthesize_file_fragment(entry, make_index(), fixed_guid));
    CHECK_FALSE(contains(text, "odd--name"));
    CHECK(contains(text, "[DistFiles\\odd- -name.txt-]"));
}

// ============================================================================
// Registry Fragment Tests
// ============================================================================

TEST_CASE("synthesize_registry_fragment removes the registry key") {
    auto fragment = synthesize_registry_fragment(orphaned_key(), fixed_guid);

    CHECK(fragment.kind == OrphanKind::Registry);
    CHECK(fragment.subject == "HKLM\\Software\\Example\\Product");
    REQUIRE(fragment.removal);
    CHECK(fragment.removal->id == "DelRegProduct.CF621C07FFE58BA5EA0D7A15968E2029");

    auto text = render_fragment(fragment);
    CHECK(contains(text, "<!-- Registry component 1B2C3D4E-0000-4000-8000-0000000000A1 "
                         "[HKLM\\Software\\Example\\Product] is missing from (Auto)Files.wxs -->"));
    CHECK(contains(text, "<Component Id=\"RegProduct\" Transitive=\"yes\""));
    CHECK(contains(text, "<Registry Root=\"HKLM\" Key=\"Software\\Example\\Product\" "
                         "Action=\"removeKeyOnInstall\" Id=\"DelRegProduct.CF621C07FFE58BA5EA0D7A15968E2029\"/>"));
    CHECK(contains(text, "<FeatureRef Id=\"Core\">"));
}

TEST_CASE("synthesize_registry_fragment without a directory suggests nothing") {
    auto entry = orphaned_key();
    entry.directory_id.clear();
    auto text = render_fragment(synthesize_registry_fragment(entry, fixed_guid));
    CHECK(contains(text, "<!-- WARNING: Could not locate DirectoryId -->"));
    CHECK_FALSE(contains(text, "<Registry "));
}
