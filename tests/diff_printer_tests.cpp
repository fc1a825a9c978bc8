#include "test_common.hpp"
#include "diff_printer.hpp"

using diff::DiffEngine;
using diff::DiffResult;

namespace {
Snapshot snap(const std::string& path, const std::string& content, bool exists = true) {
    Snapshot s;
    s.path = path;
    s.content = content;
    s.exists = exists;
    return s;
}

std::string numbered_lines(int from, int to) {
    std::string out;
    for (int i = from; i <= to; ++i)
        out += "line " + std::to_string(i) + "\n";
    return out;
}
} // namespace

TEST_CASE("make_diff_colors can disable colors") {
    DiffColors plain = make_diff_colors(true);
    REQUIRE(plain.reset.empty());
    REQUIRE(plain.added.empty());
    DiffColors ansi = make_diff_colors(false);
    REQUIRE(ansi.added == "\033[32m");
    REQUIRE(ansi.deleted == "\033[31m");
}

TEST_CASE("render_event prints the operation and path") {
    Event ev;
    ev.path = "/tmp/x.txt";
    ev.op = Operation::Write;
    ev.timestamp = std::chrono::system_clock::now();
    std::string line = render_event(ev, make_diff_colors(true));
    REQUIRE(line.size() > 11);
    REQUIRE(line[0] == '[');
    REQUIRE(line[9] == ']');
    REQUIRE(line.substr(10) == " write: /tmp/x.txt");
}

TEST_CASE("render_diff numbers and marks lines") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("f", "a\nb\nc\n"), snap("f", "a\nx\nc\n"));
    std::string text = render_diff(r, make_diff_colors(true));
    REQUIRE(text == "f\n"
                    "    1    1   a\n"
                    "    2      - b\n"
                    "         2 + x\n"
                    "    3    3   c\n");
}

TEST_CASE("render_diff folds distant unchanged lines") {
    DiffEngine engine;
    std::string before = numbered_lines(1, 20);
    std::string after = before;
    after.replace(after.find("line 10\n"), 8, "line ten\n");
    DiffResult r = engine.compute(snap("f", before), snap("f", after));
    std::string text = render_diff(r, make_diff_colors(true));
    REQUIRE(text.find("  ...\n") != std::string::npos);
    REQUIRE(text.find("line 7\n") != std::string::npos);
    REQUIRE(text.find("line 6\n") == std::string::npos);
    REQUIRE(text.find("line 13\n") != std::string::npos);
    REQUIRE(text.find("line 14\n") == std::string::npos);
}

TEST_CASE("render_diff truncates to max_lines") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("n", "", false), snap("n", numbered_lines(1, 10)));
    std::string text = render_diff(r, make_diff_colors(true), 4);
    REQUIRE(text.rfind("n (new file)\n", 0) == 0);
    REQUIRE(text.find("line 4\n") != std::string::npos);
    REQUIRE(text.find("line 5\n") == std::string::npos);
    REQUIRE(text.find("... 6 more lines\n") != std::string::npos);
}

TEST_CASE("render_diff shows binary notices and nothing for no diff") {
    DiffEngine engine;
    DiffResult bin = engine.compute(snap("b", std::string("\0", 1)), snap("b", "", false));
    REQUIRE(render_diff(bin, make_diff_colors(true)) == "b (deleted)\nBinary file b deleted\n");
    DiffResult same = engine.compute(snap("s", "x\n"), snap("s", "x\n"));
    REQUIRE(render_diff(same, make_diff_colors(true)).empty());
}

TEST_CASE("render_outcome prints messages for skipped files") {
    Event ev;
    ev.path = "big";
    ev.op = Operation::Write;
    ChangeOutcome outcome;
    outcome.status = ChangeStatus::TooLarge;
    outcome.message = "file too large for diff (10 bytes, max 5 bytes)";
    std::string text = render_outcome(ev, outcome, make_diff_colors(true));
    REQUIRE(text.find("write: big\n") != std::string::npos);
    REQUIRE(text.find(outcome.message) != std::string::npos);

    ChangeOutcome ignored;
    REQUIRE(render_outcome(ev, ignored, make_diff_colors(true)).empty());
}
