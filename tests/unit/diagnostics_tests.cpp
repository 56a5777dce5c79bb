#include <doctest/doctest.h>
#include <patchguard/diagnostics.hpp>

#include <thread>
#include <vector>

using namespace patchguard;

TEST_CASE("errors and warnings render with their numbers") {
    auto e = make_error(ErrorCode::VersionLowered, "a.dll", "File a.dll was lowered.");
    auto w = make_warning(WarningCode::ZeroVersion, "b.dll", "File b.dll is 0.0.0.0.");

    CHECK(render_diagnostic(e) == "ERROR #6: File a.dll was lowered.");
    CHECK(render_diagnostic(w) == "WARNING #3: File b.dll is 0.0.0.0.");
}

TEST_CASE("notes render verbatim") {
    auto n = make_note("x", "<!-- fragment -->\n<DirectoryRef Id=\"D\"/>");
    CHECK(n.code == 0);
    CHECK(render_diagnostic(n) == "<!-- fragment -->\n<DirectoryRef Id=\"D\"/>");
}

TEST_CASE("report keeps emission order and starts with the build header") {
    DiagnosticLog log;
    log.append(make_warning(WarningCode::UntrackedFiles, "DistFiles", "second"));
    log.append(make_error(ErrorCode::ModifiedWithoutVersionBump, "a", "first"));
    log.append(make_note("n", "third\n"));

    CHECK(render_report(log, "Current source control branch: develop") ==
          "Current source control branch: develop\n"
          "WARNING #2: second\n"
          "ERROR #1: first\n"
          "third\n");
}

TEST_CASE("report without a header") {
    DiagnosticLog log;
    log.append(make_error(ErrorCode::DateRegression, "a", "late"));
    CHECK(render_report(log) == "ERROR #2: late\n");
    CHECK(render_report(DiagnosticLog{}).empty());
}

TEST_CASE("log counts by severity") {
    DiagnosticLog log;
    CHECK(log.empty());
    CHECK_FALSE(log.has_errors());

    log.append(std::vector<Diagnostic>{
        make_error(ErrorCode::InvalidVersion, "a", "x"),
        make_error(ErrorCode::FeatureAdded, "b", "y"),
        make_warning(WarningCode::ZeroVersion, "c", "z"),
        make_note("d", "w"),
    });

    CHECK(log.size() == 4);
    CHECK(log.count(Severity::Error) == 2);
    CHECK(log.count(Severity::Warning) == 1);
    CHECK(log.count(Severity::Note) == 1);
    CHECK(log.has_errors());
}

TEST_CASE("log copies are independent") {
    DiagnosticLog log;
    log.append(make_note("a", "a"));

    DiagnosticLog copy = log;
    copy.append(make_note("b", "b"));
    CHECK(log.size() == 1);
    CHECK(copy.size() == 2);

    log = copy;
    CHECK(log.size() == 2);
}

TEST_CASE("concurrent appends are all kept") {
    DiagnosticLog log;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log]() {
            for (int i = 0; i < 250; ++i) {
                log.append(make_note("n", "n"));
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(log.size() == 1000);
}

TEST_CASE("report JSON carries counts and keys") {
    DiagnosticLog log;
    log.append(make_error(ErrorCode::FourthSegmentOnly, "a.dll", "msg"));
    log.append(make_warning(WarningCode::SourceControlQueryFailed, "DistFiles", "no git"));
    log.append(make_note("b.dll", "<!-- -->"));

    auto j = report_to_json(log, "Current source control branch: main");
    CHECK(j["build"] == "Current source control branch: main");
    CHECK(j["errors"] == 1);
    CHECK(j["warnings"] == 1);
    REQUIRE(j["diagnostics"].size() == 3);
    CHECK(j["diagnostics"][0]["severity"] == "error");
    CHECK(j["diagnostics"][0]["code"] == 8);
    CHECK(j["diagnostics"][0]["key"] == "fourth_segment_only");
    CHECK(j["diagnostics"][1]["key"] == "source_control_query_failed");
    CHECK(j["diagnostics"][2]["severity"] == "note");
    CHECK_FALSE(j["diagnostics"][2].contains("key"));
}

TEST_CASE("empty report JSON") {
    auto j = report_to_json(DiagnosticLog{});
    CHECK_FALSE(j.contains("build"));
    CHECK(j["errors"] == 0);
    CHECK(j["diagnostics"].empty());
}
