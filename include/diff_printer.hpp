#ifndef DIFF_PRINTER_HPP
#define DIFF_PRINTER_HPP
#include <cstddef>
#include <string>

#include "change_processor.hpp"
#include "diff_engine.hpp"
#include "directory_watcher.hpp"

/**
 * @brief ANSI sequences used by the printer. Empty strings disable color.
 */
struct DiffColors {
    std::string reset;
    std::string added;
    std::string deleted;
    std::string header;
    std::string muted;
    std::string warning;
};

DiffColors make_diff_colors(bool no_colors);

/**
 * @brief One-line event summary: `[HH:MM:SS] op: path`.
 */
std::string render_event(const Event& ev, const DiffColors& colors);

/**
 * @brief Render a DiffResult for a terminal.
 *
 * Unchanged lines further than @p context lines from any change are folded
 * into a `...` marker. At most @p max_lines lines are printed; `0` means no
 * limit.
 */
std::string render_diff(const diff::DiffResult& result, const DiffColors& colors,
                        std::size_t max_lines = 0, std::size_t context = 3);

/**
 * @brief Render the outcome of one processed event, or nothing if there is
 *        nothing worth showing.
 */
std::string render_outcome(const Event& ev, const ChangeOutcome& outcome,
                           const DiffColors& colors, std::size_t max_lines = 0);

#endif // DIFF_PRINTER_HPP
