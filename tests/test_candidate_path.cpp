#include <doctest/doctest.h>

#include "candidate_path.h"
#include "test_helpers.h"

using namespace Quire;

TEST_SUITE_BEGIN("candidate");

TEST_CASE("FileTypeRule matches the extension after a dot") {
    FileTypeRule rule;
    rule.extension = "pdf";
    rule.caseInsensitive = false;

    CHECK(rule.matches("report.pdf"));
    CHECK(rule.matches("/home/user/docs/report.pdf"));
    CHECK(rule.matches("C:\\Users\\me\\report.pdf"));
    CHECK_FALSE(rule.matches("report.pdfx"));
    CHECK_FALSE(rule.matches("reportpdf"));
    CHECK_FALSE(rule.matches("report.png"));
    CHECK_FALSE(rule.matches(".pdf"));
    CHECK_FALSE(rule.matches("/tmp/.pdf"));
    CHECK_FALSE(rule.matches("C:\\docs\\.pdf"));
    CHECK(rule.matches("/tmp/a.pdf"));
    CHECK_FALSE(rule.matches(""));
}

TEST_CASE("FileTypeRule case handling") {
    FileTypeRule rule;
    rule.extension = "pdf";

    SUBCASE("case sensitive") {
        rule.caseInsensitive = false;
        CHECK(rule.matches("a.pdf"));
        CHECK_FALSE(rule.matches("a.PDF"));
        CHECK_FALSE(rule.matches("a.Pdf"));
    }
    SUBCASE("case insensitive") {
        rule.caseInsensitive = true;
        CHECK(rule.matches("a.pdf"));
        CHECK(rule.matches("a.PDF"));
        CHECK(rule.matches("a.Pdf"));
    }
}

TEST_CASE("FileTypeRule with empty extension matches nothing") {
    FileTypeRule rule;
    rule.extension = "";
    CHECK_FALSE(rule.matches("a."));
    CHECK_FALSE(rule.matches("a.pdf"));
}

TEST_CASE("Flag tokens start with a dash") {
    CHECK(isFlagToken("-v"));
    CHECK(isFlagToken("--update"));
    CHECK(isFlagToken("-report.pdf"));
    CHECK_FALSE(isFlagToken("report.pdf"));
    CHECK_FALSE(isFlagToken(""));
}

TEST_CASE("Candidate validation") {
    QuireTest::TempDir dir;
    FileTypeRule rule;
    rule.caseInsensitive = false;

    CHECK(isValidCandidate({"missing.pdf", CandidateSource::DragDrop}, rule));
    CHECK_FALSE(isValidCandidate({"", CandidateSource::DragDrop}, rule));
    CHECK_FALSE(isValidCandidate({"-x.pdf", CandidateSource::LaunchArgument}, rule));
    CHECK_FALSE(isValidCandidate({"missing.txt", CandidateSource::NativeBridge}, rule));

    // Wrong extension is fine as long as the file exists
    std::string notes = dir.touch("notes.txt", "hello");
    CHECK(isValidCandidate({notes, CandidateSource::NativeBridge}, rule));
    CHECK(pathExists(notes));
    CHECK(pathExists(dir.path.string()));
    CHECK_FALSE(pathExists((dir.path / "nope").string()));
    CHECK_FALSE(pathExists(""));
}

TEST_CASE("Source names") {
    CHECK(std::string(sourceName(CandidateSource::LaunchArgument)) == "launch-argument");
    CHECK(std::string(sourceName(CandidateSource::NativeBridge)) == "native-bridge");
    CHECK(std::string(sourceName(CandidateSource::DragDrop)) == "drag-drop");
}

TEST_SUITE_END();
