#ifndef DIFF_ENGINE_HPP
#define DIFF_ENGINE_HPP
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sequence_matcher.hpp"
#include "snapshot_store.hpp"

namespace diff {

enum class LineKind { Unchanged, Added, Deleted };

/**
 * @brief One line of a structured diff.
 *
 * Line numbers are 1-based. Deleted lines have no new number and added lines
 * have no old number.
 */
struct DiffLine {
    LineKind kind = LineKind::Unchanged;
    std::optional<int> old_line;
    std::optional<int> new_line;
    std::string content;
};

/**
 * @brief Outcome of comparing two snapshots of the same path.
 *
 * `is_binary` results never carry lines. At most one of `is_new` and
 * `is_deleted` is set.
 */
struct DiffResult {
    std::string path;
    std::vector<DiffLine> lines;
    bool has_diff = false;
    bool is_new = false;
    bool is_deleted = false;
    bool is_binary = false;
    std::string unified; ///< Conventional unified diff text, or a short notice.
};

/// Number of leading bytes inspected by is_binary_content().
constexpr std::size_t kBinarySampleSize = 8192;
/// Share of non-printable bytes above which content counts as binary.
constexpr double kBinaryThreshold = 0.30;
/// Context lines around each hunk of the unified text.
constexpr std::size_t kUnifiedContext = 3;

/**
 * @brief Guess whether @p content is binary.
 *
 * Looks at the first kBinarySampleSize bytes only. A NUL byte anywhere in
 * the sample means binary. Otherwise control bytes (except tab, LF and CR)
 * and bytes from 0x7F upwards are counted as non-printable and the content is
 * binary when they exceed kBinaryThreshold of the sample. This is a rough
 * heuristic, not a format detector: text that is mostly multi-byte UTF-8 can
 * be classified as binary. Empty content is text.
 */
bool is_binary_content(std::string_view content);

/**
 * @brief Split @p text on `\n`.
 *
 * A trailing newline ends the last line instead of opening an empty one and
 * empty text has no lines. Carriage returns stay in the line content.
 */
std::vector<std::string> split_lines(std::string_view text);

/**
 * @brief split_lines() for comparison.
 *
 * When non-empty @p text does not end in `\n` its last line keeps a trailing
 * `\n` as a marker, so `"a\nb"` and `"a\nb\n"` differ in their last line.
 */
std::vector<std::string> split_compare_lines(std::string_view text);

/**
 * @brief Render grouped opcodes as unified diff text.
 *
 * Produces nothing when the sequences are equal. An element ending in `\n`
 * (see split_compare_lines()) is printed without it, followed by
 * `\ No newline at end of file`.
 */
std::string unified_diff(const std::vector<std::string>& a, const std::vector<std::string>& b,
                         std::string_view from_path, std::string_view to_path,
                         std::size_t context = kUnifiedContext);

/**
 * @brief Turn an edit script into DiffLines in document order.
 *
 * Replace spans are emitted as the whole old block deleted followed by the
 * whole new block added. The end-of-file marker of split_compare_lines() is
 * stripped from the line content.
 */
std::vector<DiffLine> structured_diff(const std::vector<std::string>& a,
                                      const std::vector<std::string>& b,
                                      const std::vector<Opcode>& ops);

/**
 * @brief Computes structured diffs between snapshots.
 *
 * Stateless; one engine may be shared between threads.
 */
class DiffEngine {
  public:
    /**
     * @brief Compare @p old_snap against @p new_snap.
     *
     * Handles deletion, creation, binary content on either side, a regular
     * line diff, and the "neither exists" case which yields no diff.
     */
    DiffResult compute(const Snapshot& old_snap, const Snapshot& new_snap) const;
};

} // namespace diff

#endif // DIFF_ENGINE_HPP
