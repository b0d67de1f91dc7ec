#include <doctest/doctest.h>

#include "drop_listener.h"

using namespace Quire;

namespace {
FileTypeRule pdfRule() {
    FileTypeRule rule;
    rule.extension = "pdf";
    rule.caseInsensitive = false;
    return rule;
}

struct DropFixture {
    EventChannel display;
    DragDropListener listener{display, pdfRule()};
    std::vector<CandidatePath> seen;

    DropFixture() {
        listener.start([this](const CandidatePath& c) { seen.push_back(c); });
    }
};
} // namespace

TEST_SUITE_BEGIN("drop");

TEST_CASE("decodeDropPayload reads a JSON list of strings") {
    auto paths = decodeDropPayload(R"(["/a/b.pdf", "c.png"])");
    REQUIRE(paths.has_value());
    REQUIRE(paths->size() == 2);
    CHECK((*paths)[0] == "/a/b.pdf");
    CHECK((*paths)[1] == "c.png");

    auto empty = decodeDropPayload("[]");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("decodeDropPayload rejects malformed payloads") {
    CHECK_FALSE(decodeDropPayload("").has_value());
    CHECK_FALSE(decodeDropPayload("not json").has_value());
    CHECK_FALSE(decodeDropPayload(R"(["unterminated.pdf")").has_value());
    CHECK_FALSE(decodeDropPayload(R"("single.pdf")").has_value());
    CHECK_FALSE(decodeDropPayload(R"({"paths": ["a.pdf"]})").has_value());
    CHECK_FALSE(decodeDropPayload(R"(["a.pdf", 3])").has_value());
    CHECK_FALSE(decodeDropPayload("[\"\xff\xfe.pdf\"]").has_value());
}

TEST_CASE("selectFirstSupported keeps list order") {
    auto rule = pdfRule();
    auto chosen = selectFirstSupported({"image.png", "notes.pdf", "draft.pdf"}, rule);
    REQUIRE(chosen.has_value());
    CHECK(*chosen == "notes.pdf");

    CHECK_FALSE(selectFirstSupported({"a.png", "b.txt"}, rule).has_value());
    CHECK_FALSE(selectFirstSupported({}, rule).has_value());
}

TEST_CASE("Drop of a mixed batch yields only the first PDF") {
    DropFixture f;
    f.display.emit(kDropEvent, R"(["image.png","notes.pdf","draft.pdf"])");
    REQUIRE(f.seen.size() == 1);
    CHECK(f.seen[0].path == "notes.pdf");
    CHECK(f.seen[0].source == CandidateSource::DragDrop);
}

TEST_CASE("Drop without a supported file yields nothing") {
    DropFixture f;
    f.display.emit(kDropEvent, R"(["image.png","notes.txt"])");
    CHECK(f.seen.empty());
}

TEST_CASE("encodeDropPayload keeps UTF-8 paths intact") {
    std::vector<std::string> paths = {"/home/u/r\xc3\xa9sum\xc3\xa9.pdf", "/tmp/a b.pdf"};
    auto decoded = decodeDropPayload(encodeDropPayload(paths));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == paths);
}

TEST_CASE("Non-UTF-8 dropped names are skipped, not mangled") {
    DropFixture f;
    std::string latin1 = "/home/u/r\xe9sum\xe9.pdf";
    f.display.emit(kDropEvent, encodeDropPayload({latin1, "/home/u/next.pdf"}));
    REQUIRE(f.seen.size() == 1);
    CHECK(f.seen[0].path == "/home/u/next.pdf");

    f.seen.clear();
    f.display.emit(kDropEvent, encodeDropPayload({latin1}));
    CHECK(f.seen.empty());
}

TEST_CASE("Malformed drop payload is swallowed") {
    DropFixture f;
    CHECK_NOTHROW(f.display.emit(kDropEvent, "{{{{"));
    CHECK_NOTHROW(f.display.emit(kDropEvent, "[1,2,3]"));
    CHECK(f.seen.empty());
}

TEST_CASE("Hover and cancel stay subscribed and change nothing") {
    DropFixture f;
    CHECK(f.display.subscriberCount(kDropHoverEvent) == 1);
    CHECK(f.display.subscriberCount(kDropCancelledEvent) == 1);

    CHECK(f.display.emit(kDropHoverEvent, R"(["a.pdf"])") == 1);
    CHECK(f.display.emit(kDropCancelledEvent, "") == 1);
    CHECK(f.seen.empty());

    // A later drop still goes through
    f.display.emit(kDropEvent, R"(["a.pdf"])");
    CHECK(f.seen.size() == 1);
}

TEST_CASE("stop unsubscribes all three notifications") {
    DropFixture f;
    CHECK(f.listener.isListening());
    f.listener.stop();
    CHECK_FALSE(f.listener.isListening());
    CHECK(f.display.subscriberCount(kDropEvent) == 0);
    CHECK(f.display.subscriberCount(kDropHoverEvent) == 0);
    CHECK(f.display.subscriberCount(kDropCancelledEvent) == 0);

    f.display.emit(kDropEvent, R"(["a.pdf"])");
    CHECK(f.seen.empty());
}

TEST_CASE("Restarting does not double-subscribe") {
    DropFixture f;
    f.listener.start([&f](const CandidatePath& c) { f.seen.push_back(c); });
    CHECK(f.display.subscriberCount(kDropEvent) == 1);
    f.display.emit(kDropEvent, R"(["a.pdf"])");
    CHECK(f.seen.size() == 1);
}

TEST_SUITE_END();
