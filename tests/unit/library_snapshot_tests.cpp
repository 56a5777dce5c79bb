#include <doctest/doctest.h>
#include <patchguard/library_snapshot.hpp>
#include <patchguard/platform.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace patchguard;

namespace {

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("patchguard_lib_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

const char* FILE_LIBRARY = R"(<?xml version="1.0" encoding="utf-8"?>
<FileLibrary>
  <File Path="Output\${config}\core.dll" Date="2011-03-14 10:23:45" Version="7.0.1.2"
        MD5="0CC175B9C0F1B6A831C399E269772661" FeatureList="Core, Help,Core"
        ComponentGuid="1B2C3D4E-0000-4000-8000-000000000001" ComponentId="core.dll"
        DirectoryId="ProgramDir" LongName="core.dll" ShortName="CORE.DLL"/>
  <File Path="DistFiles\readme.txt" Date="3/14/2011 2:05 PM" Version="" MD5=""
        FeatureList="" ComponentGuid="" ComponentId="readme.txt"
        DirectoryId="ProgramDir" LongName="readme.txt" ShortName="README.TXT"/>
  <File Path="DistFiles\odd.txt" Date="yesterday" FeatureList="Core"
        ComponentGuid="1B2C3D4E-0000-4000-8000-000000000003"/>
</FileLibrary>)";

const char* REG_LIBRARY = R"(<?xml version="1.0" encoding="utf-8"?>
<RegLibrary>
  <Component ComponentGuid="1B2C3D4E-0000-4000-8000-0000000000A1" Root="HKLM"
             KeyHeader="Software\Example\Product" DirectoryId="ProgramDir"
             Id="RegProduct" FeatureList="Core"/>
</RegLibrary>)";

} // namespace

// ============================================================================
// Feature List Tests
// ============================================================================

TEST_CASE("split_feature_list trims, drops empties and duplicates") {
    CHECK(split_feature_list("Core,Help") == std::vector<std::string>{"Core", "Help"});
    CHECK(split_feature_list(" Core , Help ,,Core ") == std::vector<std::string>{"Core", "Help"});
    CHECK(split_feature_list("").empty());
    CHECK(split_feature_list(" , ").empty());
}

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_CASE("parse_library_snapshot reads file entries") {
    auto result = parse_library_snapshot(FILE_LIBRARY, "");
    REQUIRE(result.ok);

    const auto& snapshot = result.snapshot;
    CHECK(snapshot.has_files);
    CHECK_FALSE(snapshot.has_registry);
    REQUIRE(snapshot.files.size() == 3);

    const auto& core = snapshot.files[0];
    CHECK(core.path == "Output\\${config}\\core.dll");
    CHECK(core.released_version == "7.0.1.2");
    CHECK(core.released_md5 == "0CC175B9C0F1B6A831C399E269772661");
    CHECK(core.feature_list == std::vector<std::string>{"Core", "Help"});
    CHECK(core.component_guid == "1B2C3D4E-0000-4000-8000-000000000001");
    CHECK(core.component_id == "core.dll");
    CHECK(core.directory_id == "ProgramDir");
    CHECK(core.long_name == "core.dll");
    CHECK(core.short_name == "CORE.DLL");
    REQUIRE(core.released_time);
    CHECK(*core.released_time == *parse_library_date("2011-03-14 10:23:45"));
}

TEST_CASE("parse_library_snapshot describes unresolvable entries once") {
    auto result = parse_library_snapshot(FILE_LIBRARY, "");
    REQUIRE(result.ok);

    const auto& issues = result.snapshot.load_issues;
    REQUIRE(issues.size() == 2);
    CHECK(issues[0].find("DistFiles\\readme.txt has no ComponentGuid") != std::string::npos);
    CHECK(issues[1].find("DistFiles\\odd.txt has an unrecognized Date (yesterday)") != std::string::npos);

    CHECK(result.snapshot.files[1].released_time);
    CHECK_FALSE(result.snapshot.files[2].released_time);
}

TEST_CASE("parse_library_snapshot reads registry entries") {
    auto result = parse_library_snapshot("", REG_LIBRARY);
    REQUIRE(result.ok);
    CHECK_FALSE(result.snapshot.has_files);
    CHECK(result.snapshot.has_registry);
    REQUIRE(result.snapshot.registry.size() == 1);

    const auto& reg = result.snapshot.registry[0];
    CHECK(reg.guid == "1B2C3D4E-0000-4000-8000-0000000000A1");
    CHECK(reg.root == "HKLM");
    CHECK(reg.key_header == "Software\\Example\\Product");
    CHECK(reg.directory_id == "ProgramDir");
    CHECK(reg.id == "RegProduct");
    CHECK(reg.feature_list == std::vector<std::string>{"Core"});
}

TEST_CASE("parse_library_snapshot treats empty text as an absent document") {
    auto result = parse_library_snapshot("", "");
    REQUIRE(result.ok);
    CHECK_FALSE(result.snapshot.has_files);
    CHECK_FALSE(result.snapshot.has_registry);
    CHECK(result.snapshot.files.empty());
    CHECK(result.snapshot.registry.empty());
}

TEST_CASE("parse_library_snapshot rejects the wrong root element") {
    auto result = parse_library_snapshot("<RegLibrary/>", "");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("<FileLibrary>") != std::string::npos);
}

TEST_CASE("parse_library_snapshot rejects malformed XML") {
    auto result = parse_library_snapshot("", "<RegLibrary><Component></RegLibrary>");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("invalid registry library") != std::string::npos);
}

// ============================================================================
// Loading Tests
// ============================================================================

TEST_CASE("load_library_snapshot skips documents that do not exist") {
    TempDir tmp;
    auto result = load_library_snapshot(tmp.file("FileLibrary.xml"), tmp.file("RegLibrary.xml"));
    REQUIRE(result.ok);
    CHECK_FALSE(result.snapshot.has_files);
    CHECK_FALSE(result.snapshot.has_registry);
}

TEST_CASE("load_library_snapshot reads both documents") {
    TempDir tmp;
    std::ofstream(tmp.file("FileLibrary.xml")) << FILE_LIBRARY;
    std::ofstream(tmp.file("RegLibrary.xml")) << REG_LIBRARY;

    auto result = load_library_snapshot(tmp.file("FileLibrary.xml"), tmp.file("RegLibrary.xml"));
    REQUIRE(result.ok);
    CHECK(result.snapshot.files.size() == 3);
    CHECK(result.snapshot.registry.size() == 1);
}

TEST_CASE("load_library_snapshot rejects an empty library file") {
    TempDir tmp;
    std::ofstream(tmp.file("FileLibrary.xml")).close();

    auto result = load_library_snapshot(tmp.file("FileLibrary.xml"), tmp.file("RegLibrary.xml"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("empty file") != std::string::npos);
}
