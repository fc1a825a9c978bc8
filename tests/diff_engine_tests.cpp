#include "test_common.hpp"

using diff::DiffEngine;
using diff::DiffResult;
using diff::LineKind;

namespace {
Snapshot snap(const std::string& path, const std::string& content, bool exists = true) {
    Snapshot s;
    s.path = path;
    s.content = content;
    s.exists = exists;
    return s;
}
} // namespace

TEST_CASE("split_lines drops the empty line after a trailing newline") {
    REQUIRE(diff::split_lines("").empty());
    REQUIRE(diff::split_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(diff::split_lines("a\nb") == std::vector<std::string>{"a", "b"});
    REQUIRE(diff::split_lines("\n\n") == std::vector<std::string>{"", ""});
    REQUIRE(diff::split_lines("x\r\n") == std::vector<std::string>{"x\r"});
}

TEST_CASE("is_binary_content detects NUL bytes") {
    REQUIRE_FALSE(diff::is_binary_content(""));
    REQUIRE_FALSE(diff::is_binary_content("plain text\twith tabs\r\n"));
    REQUIRE(diff::is_binary_content(std::string("abc\0def", 7)));
    std::string big(diff::kBinarySampleSize - 1, 'a');
    big.push_back('\0');
    REQUIRE(diff::is_binary_content(big));
}

TEST_CASE("is_binary_content only samples the leading bytes") {
    std::string text(diff::kBinarySampleSize, 'a');
    text.push_back('\0');
    REQUIRE_FALSE(diff::is_binary_content(text));
}

TEST_CASE("is_binary_content uses the non-printable ratio") {
    std::string few(100, 'a');
    for (int i = 0; i < 30; ++i)
        few[i] = '\x01';
    REQUIRE_FALSE(diff::is_binary_content(few));
    std::string many(100, 'a');
    for (int i = 0; i < 31; ++i)
        many[i] = '\x01';
    REQUIRE(diff::is_binary_content(many));
    REQUIRE(diff::is_binary_content(std::string(10, '\xff')));
}

TEST_CASE("compute reports a replaced line as delete then add") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("f.txt", "a\nb\nc\n"), snap("f.txt", "a\nx\nc\n"));
    REQUIRE(r.has_diff);
    REQUIRE_FALSE(r.is_new);
    REQUIRE_FALSE(r.is_deleted);
    REQUIRE_FALSE(r.is_binary);
    REQUIRE(r.lines.size() == 4);
    REQUIRE(r.lines[0].kind == LineKind::Unchanged);
    REQUIRE(r.lines[0].content == "a");
    REQUIRE(r.lines[0].old_line == 1);
    REQUIRE(r.lines[0].new_line == 1);
    REQUIRE(r.lines[1].kind == LineKind::Deleted);
    REQUIRE(r.lines[1].content == "b");
    REQUIRE(r.lines[1].old_line == 2);
    REQUIRE_FALSE(r.lines[1].new_line.has_value());
    REQUIRE(r.lines[2].kind == LineKind::Added);
    REQUIRE(r.lines[2].content == "x");
    REQUIRE_FALSE(r.lines[2].old_line.has_value());
    REQUIRE(r.lines[2].new_line == 2);
    REQUIRE(r.lines[3].kind == LineKind::Unchanged);
    REQUIRE(r.lines[3].old_line == 3);
    REQUIRE(r.lines[3].new_line == 3);
    REQUIRE(r.unified == "--- f.txt\n+++ f.txt\n@@ -1,3 +1,3 @@\n a\n-b\n+x\n c\n");
}

TEST_CASE("compute of identical content has no diff") {
    DiffEngine engine;
    Snapshot s = snap("same.txt", "one\ntwo\nthree\n");
    DiffResult r = engine.compute(s, s);
    REQUIRE_FALSE(r.has_diff);
    REQUIRE(r.unified.empty());
    REQUIRE(r.lines.size() == 3);
    for (const auto& line : r.lines)
        REQUIRE(line.kind == LineKind::Unchanged);

    Snapshot bin = snap("same.bin", std::string("\0\1\2", 3));
    DiffResult rb = engine.compute(bin, bin);
    REQUIRE(rb.is_binary);
    REQUIRE_FALSE(rb.has_diff);
}

TEST_CASE("compute of a deletion lists every old line") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("gone.txt", "l1\nl2\nl3\n"), snap("gone.txt", "", false));
    REQUIRE(r.has_diff);
    REQUIRE(r.is_deleted);
    REQUIRE(r.lines.size() == 3);
    for (std::size_t i = 0; i < r.lines.size(); ++i) {
        REQUIRE(r.lines[i].kind == LineKind::Deleted);
        REQUIRE(r.lines[i].old_line == static_cast<int>(i + 1));
        REQUIRE_FALSE(r.lines[i].new_line.has_value());
    }
    REQUIRE(r.unified == "--- gone.txt\n+++ (deleted)\n");
}

TEST_CASE("compute of a new file lists every new line") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("new.txt", "", false), snap("new.txt", "x\ny\n"));
    REQUIRE(r.has_diff);
    REQUIRE(r.is_new);
    REQUIRE(r.path == "new.txt");
    REQUIRE(r.lines.size() == 2);
    REQUIRE(r.lines[1].kind == LineKind::Added);
    REQUIRE(r.lines[1].new_line == 2);
    REQUIRE(r.unified == "--- (new file)\n+++ new.txt\n");
}

TEST_CASE("compute of a missing path on both sides is empty") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("x", "", false), snap("x", "", false));
    REQUIRE_FALSE(r.has_diff);
    REQUIRE(r.lines.empty());
}

TEST_CASE("compute handles binary content") {
    DiffEngine engine;
    const std::string bin1("\0\1\2", 3);
    const std::string bin2("\0\3\4", 3);

    DiffResult created = engine.compute(snap("b", "", false), snap("b", bin1));
    REQUIRE(created.is_binary);
    REQUIRE(created.is_new);
    REQUIRE(created.lines.empty());
    REQUIRE(created.unified == "Binary file b created\n");

    DiffResult deleted = engine.compute(snap("b", bin1), snap("b", "", false));
    REQUIRE(deleted.is_binary);
    REQUIRE(deleted.is_deleted);
    REQUIRE(deleted.unified == "Binary file b deleted\n");

    DiffResult modified = engine.compute(snap("b", bin1), snap("b", bin2));
    REQUIRE(modified.has_diff);
    REQUIRE(modified.unified == "Binary file b modified\n");

    DiffResult to_binary = engine.compute(snap("b", "text\n"), snap("b", bin1));
    REQUIRE(to_binary.unified == "File b changed from text to binary\n");
    DiffResult to_text = engine.compute(snap("b", bin1), snap("b", "text\n"));
    REQUIRE(to_text.unified == "File b changed from binary to text\n");
    REQUIRE(to_text.lines.empty());
}

TEST_CASE("unified_diff formats hunk ranges") {
    std::vector<std::string> a{"a"};
    std::vector<std::string> b{};
    REQUIRE(diff::unified_diff(a, b, "old", "new") == "--- old\n+++ new\n@@ -1 +0,0 @@\n-a\n");
    REQUIRE(diff::unified_diff(b, a, "old", "new") == "--- old\n+++ new\n@@ -0,0 +1 @@\n+a\n");
    REQUIRE(diff::unified_diff(a, a, "old", "new").empty());
}

TEST_CASE("split_compare_lines marks a last line without newline") {
    REQUIRE(diff::split_compare_lines("").empty());
    REQUIRE(diff::split_compare_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(diff::split_compare_lines("a\nb") == std::vector<std::string>{"a", "b\n"});
}

TEST_CASE("compute reports an added trailing newline") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("t", "a\nb"), snap("t", "a\nb\n"));
    REQUIRE(r.has_diff);
    REQUIRE(r.unified ==
            "--- t\n+++ t\n@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+b\n");
    REQUIRE(r.lines.size() == 3);
    REQUIRE(r.lines[1].kind == LineKind::Deleted);
    REQUIRE(r.lines[1].content == "b");
    REQUIRE(r.lines[2].kind == LineKind::Added);
    REQUIRE(r.lines[2].content == "b");
}

TEST_CASE("compute reports a removed trailing newline") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("t", "a\nb\n"), snap("t", "a\nb"));
    REQUIRE(r.has_diff);
    REQUIRE(r.unified ==
            "--- t\n+++ t\n@@ -1,2 +1,2 @@\n a\n-b\n+b\n\\ No newline at end of file\n");
}

TEST_CASE("compute keeps the marker on an unchanged last line in context") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("t", "a\nb"), snap("t", "x\nb"));
    REQUIRE(r.has_diff);
    REQUIRE(r.unified ==
            "--- t\n+++ t\n@@ -1,2 +1,2 @@\n-a\n+x\n b\n\\ No newline at end of file\n");
    REQUIRE(r.lines.back().kind == LineKind::Unchanged);
    REQUIRE(r.lines.back().content == "b");
}

TEST_CASE("compute of a deletion without final newline lists every old line") {
    DiffEngine engine;
    DiffResult r = engine.compute(snap("gone.txt", "l1\nl2"), snap("gone.txt", "", false));
    REQUIRE(r.lines.size() == 2);
    REQUIRE(r.lines[1].content == "l2");
}
