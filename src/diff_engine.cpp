#include "diff_engine.hpp"

#include <algorithm>
#include <sstream>

namespace diff {

namespace {

bool is_non_printable(unsigned char c) {
    if (c < 0x20)
        return c != '\t' && c != '\n' && c != '\r';
    return c >= 0x7F;
}

// Unified range: "start,length", with a bare start for single lines and the
// line before the hunk for empty ranges.
std::string format_range(std::size_t lo, std::size_t hi) {
    std::size_t beginning = lo + 1;
    std::size_t length = hi - lo;
    if (length == 1)
        return std::to_string(beginning);
    if (length == 0)
        --beginning;
    return std::to_string(beginning) + "," + std::to_string(length);
}

bool missing_newline(const std::string& line) { return !line.empty() && line.back() == '\n'; }

void write_unified_line(std::ostream& out, char marker, const std::string& line) {
    if (missing_newline(line)) {
        out << marker;
        out.write(line.data(), static_cast<std::streamsize>(line.size() - 1));
        out << "\n\\ No newline at end of file\n";
        return;
    }
    out << marker << line << "\n";
}

DiffLine make_line(LineKind kind, std::optional<int> old_no, std::optional<int> new_no,
                   const std::string& content) {
    DiffLine line;
    line.kind = kind;
    line.old_line = old_no;
    line.new_line = new_no;
    line.content = missing_newline(content) ? content.substr(0, content.size() - 1) : content;
    return line;
}

} // namespace

bool is_binary_content(std::string_view content) {
    if (content.empty())
        return false;
    const std::size_t sample = std::min(content.size(), kBinarySampleSize);
    std::size_t non_printable = 0;
    for (std::size_t i = 0; i < sample; ++i) {
        auto c = static_cast<unsigned char>(content[i]);
        if (c == 0)
            return true;
        if (is_non_printable(c))
            ++non_printable;
    }
    return static_cast<double>(non_printable) / static_cast<double>(sample) > kBinaryThreshold;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            out.emplace_back(text.substr(start));
            break;
        }
        out.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

std::vector<std::string> split_compare_lines(std::string_view text) {
    std::vector<std::string> out = split_lines(text);
    if (!text.empty() && text.back() != '\n')
        out.back().push_back('\n');
    return out;
}

std::string unified_diff(const std::vector<std::string>& a, const std::vector<std::string>& b,
                         std::string_view from_path, std::string_view to_path,
                         std::size_t context) {
    SequenceMatcher matcher(a, b);
    std::ostringstream out;
    bool header = false;
    for (const auto& group : matcher.grouped_opcodes(context)) {
        if (!header) {
            out << "--- " << from_path << "\n";
            out << "+++ " << to_path << "\n";
            header = true;
        }
        const Opcode& first = group.front();
        const Opcode& last = group.back();
        out << "@@ -" << format_range(first.i1, last.i2) << " +"
            << format_range(first.j1, last.j2) << " @@\n";
        for (const auto& op : group) {
            if (op.tag == OpTag::Equal) {
                for (std::size_t i = op.i1; i < op.i2; ++i)
                    write_unified_line(out, ' ', a[i]);
                continue;
            }
            if (op.tag == OpTag::Replace || op.tag == OpTag::Delete) {
                for (std::size_t i = op.i1; i < op.i2; ++i)
                    write_unified_line(out, '-', a[i]);
            }
            if (op.tag == OpTag::Replace || op.tag == OpTag::Insert) {
                for (std::size_t j = op.j1; j < op.j2; ++j)
                    write_unified_line(out, '+', b[j]);
            }
        }
    }
    return out.str();
}

std::vector<DiffLine> structured_diff(const std::vector<std::string>& a,
                                      const std::vector<std::string>& b,
                                      const std::vector<Opcode>& ops) {
    std::vector<DiffLine> lines;
    lines.reserve(std::max(a.size(), b.size()));
    for (const auto& op : ops) {
        switch (op.tag) {
        case OpTag::Equal:
            for (std::size_t i = op.i1; i < op.i2; ++i) {
                int new_no = static_cast<int>(op.j1 + (i - op.i1) + 1);
                lines.push_back(
                    make_line(LineKind::Unchanged, static_cast<int>(i + 1), new_no, a[i]));
            }
            break;
        case OpTag::Delete:
            for (std::size_t i = op.i1; i < op.i2; ++i)
                lines.push_back(
                    make_line(LineKind::Deleted, static_cast<int>(i + 1), std::nullopt, a[i]));
            break;
        case OpTag::Insert:
            for (std::size_t j = op.j1; j < op.j2; ++j)
                lines.push_back(
                    make_line(LineKind::Added, std::nullopt, static_cast<int>(j + 1), b[j]));
            break;
        case OpTag::Replace:
            for (std::size_t i = op.i1; i < op.i2; ++i)
                lines.push_back(
                    make_line(LineKind::Deleted, static_cast<int>(i + 1), std::nullopt, a[i]));
            for (std::size_t j = op.j1; j < op.j2; ++j)
                lines.push_back(
                    make_line(LineKind::Added, std::nullopt, static_cast<int>(j + 1), b[j]));
            break;
        }
    }
    return lines;
}

DiffResult DiffEngine::compute(const Snapshot& old_snap, const Snapshot& new_snap) const {
    DiffResult result;
    result.path = new_snap.path.empty() ? old_snap.path : new_snap.path;

    if (!new_snap.exists && old_snap.exists) {
        result.has_diff = true;
        result.is_deleted = true;
        if (is_binary_content(old_snap.content)) {
            result.is_binary = true;
            result.unified = "Binary file " + old_snap.path + " deleted\n";
            return result;
        }
        result.unified = "--- " + old_snap.path + "\n+++ (deleted)\n";
        auto old_lines = split_lines(old_snap.content);
        result.lines.reserve(old_lines.size());
        for (std::size_t i = 0; i < old_lines.size(); ++i)
            result.lines.push_back(make_line(LineKind::Deleted, static_cast<int>(i + 1),
                                             std::nullopt, old_lines[i]));
        return result;
    }

    if (new_snap.exists && !old_snap.exists) {
        result.has_diff = true;
        result.is_new = true;
        if (is_binary_content(new_snap.content)) {
            result.is_binary = true;
            result.unified = "Binary file " + new_snap.path + " created\n";
            return result;
        }
        result.unified = "--- (new file)\n+++ " + new_snap.path + "\n";
        auto new_lines = split_lines(new_snap.content);
        result.lines.reserve(new_lines.size());
        for (std::size_t j = 0; j < new_lines.size(); ++j)
            result.lines.push_back(make_line(LineKind::Added, std::nullopt,
                                             static_cast<int>(j + 1), new_lines[j]));
        return result;
    }

    if (!old_snap.exists && !new_snap.exists)
        return result;

    const bool old_binary = is_binary_content(old_snap.content);
    const bool new_binary = is_binary_content(new_snap.content);
    if (old_binary || new_binary) {
        result.is_binary = true;
        if (old_snap.content == new_snap.content)
            return result;
        result.has_diff = true;
        if (old_binary && new_binary)
            result.unified = "Binary file " + result.path + " modified\n";
        else if (new_binary)
            result.unified = "File " + result.path + " changed from text to binary\n";
        else
            result.unified = "File " + result.path + " changed from binary to text\n";
        return result;
    }

    auto old_lines = split_compare_lines(old_snap.content);
    auto new_lines = split_compare_lines(new_snap.content);
    result.unified = unified_diff(old_lines, new_lines, old_snap.path, new_snap.path);
    result.has_diff = !result.unified.empty();

    SequenceMatcher matcher(old_lines, new_lines);
    result.lines = structured_diff(old_lines, new_lines, matcher.opcodes());
    return result;
}

} // namespace diff
