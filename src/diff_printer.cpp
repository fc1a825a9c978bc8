#include "diff_printer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

#include "time_utils.hpp"

namespace {

std::string number_column(const std::optional<int>& n) {
    std::ostringstream out;
    if (n)
        out << std::setw(5) << *n;
    else
        out << std::string(5, ' ');
    return out.str();
}

// Marks which lines survive folding: every changed line plus up to
// `context` unchanged lines on either side of it.
std::vector<bool> visible_lines(const std::vector<diff::DiffLine>& lines, std::size_t context) {
    std::vector<bool> keep(lines.size(), false);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].kind == diff::LineKind::Unchanged)
            continue;
        std::size_t lo = i > context ? i - context : 0;
        std::size_t hi = std::min(lines.size(), i + context + 1);
        for (std::size_t k = lo; k < hi; ++k)
            keep[k] = true;
    }
    return keep;
}

} // namespace

DiffColors make_diff_colors(bool no_colors) {
    if (no_colors)
        return DiffColors{};
    return DiffColors{"\033[0m", "\033[32m", "\033[31m", "\033[1;36m", "\033[90m", "\033[33m"};
}

std::string render_event(const Event& ev, const DiffColors& colors) {
    std::ostringstream out;
    out << colors.muted << "[" << format_clock_time(ev.timestamp) << "]" << colors.reset << " "
        << to_string(ev.op) << ": " << ev.path;
    return out.str();
}

std::string render_diff(const diff::DiffResult& result, const DiffColors& colors,
                        std::size_t max_lines, std::size_t context) {
    if (!result.has_diff)
        return {};
    std::ostringstream out;
    out << colors.header << result.path;
    if (result.is_new)
        out << " (new file)";
    else if (result.is_deleted)
        out << " (deleted)";
    out << colors.reset << "\n";

    if (result.is_binary) {
        out << colors.warning << result.unified << colors.reset;
        return out.str();
    }

    const auto keep = visible_lines(result.lines, context);
    std::size_t printed = 0;
    std::size_t hidden = 0;
    bool folded = false;
    for (std::size_t i = 0; i < result.lines.size(); ++i) {
        if (!keep[i]) {
            folded = true;
            continue;
        }
        if (max_lines > 0 && printed >= max_lines) {
            ++hidden;
            continue;
        }
        if (folded) {
            out << colors.muted << "  ..." << colors.reset << "\n";
            folded = false;
        }
        const auto& line = result.lines[i];
        const std::string& color = line.kind == diff::LineKind::Added     ? colors.added
                                   : line.kind == diff::LineKind::Deleted ? colors.deleted
                                                                          : colors.reset;
        char marker = line.kind == diff::LineKind::Added     ? '+'
                      : line.kind == diff::LineKind::Deleted ? '-'
                                                             : ' ';
        out << colors.muted << number_column(line.old_line) << number_column(line.new_line)
            << colors.reset << " " << color << marker << " " << line.content << colors.reset
            << "\n";
        ++printed;
    }
    if (hidden > 0)
        out << colors.muted << "... " << hidden << " more lines" << colors.reset << "\n";
    return out.str();
}

std::string render_outcome(const Event& ev, const ChangeOutcome& outcome,
                           const DiffColors& colors, std::size_t max_lines) {
    switch (outcome.status) {
    case ChangeStatus::Diffed:
        return render_event(ev, colors) + "\n" + render_diff(*outcome.result, colors, max_lines);
    case ChangeStatus::TooLarge:
    case ChangeStatus::Failed:
        return render_event(ev, colors) + "\n" + colors.warning + outcome.message +
               colors.reset + "\n";
    case ChangeStatus::Unchanged:
    case ChangeStatus::Ignored:
        break;
    }
    return {};
}
