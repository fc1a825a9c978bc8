#ifndef SEQUENCE_MATCHER_HPP
#define SEQUENCE_MATCHER_HPP
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace diff {

enum class OpTag { Equal, Delete, Insert, Replace };

/**
 * @brief Aligned span pair. Indices are 0-based and half-open:
 *        `a[i1, i2)` corresponds to `b[j1, j2)`.
 */
struct Opcode {
    OpTag tag;
    std::size_t i1;
    std::size_t i2;
    std::size_t j1;
    std::size_t j2;

    bool operator==(const Opcode& o) const {
        return tag == o.tag && i1 == o.i1 && i2 == o.i2 && j1 == o.j1 && j2 == o.j2;
    }
};

/// `a[a, a + size)` equals `b[b, b + size)`.
struct MatchBlock {
    std::size_t a;
    std::size_t b;
    std::size_t size;
};

const char* to_string(OpTag tag);

/**
 * @brief Line sequence aligner built on longest matching blocks.
 *
 * Finds the longest contiguous matching run, then recurses on the pieces to
 * its left and right. When @p autojunk is set and `b` has 200 or more lines,
 * lines occurring in more than 1% of `b` are not used to seed matches; they
 * can still extend a match found through other lines.
 *
 * Both sequences are held by reference and must outlive the matcher.
 */
class SequenceMatcher {
  public:
    SequenceMatcher(const std::vector<std::string>& a, const std::vector<std::string>& b,
                    bool autojunk = true);

    /// Longest matching block within `a[alo, ahi)` and `b[blo, bhi)`.
    MatchBlock find_longest_match(std::size_t alo, std::size_t ahi, std::size_t blo,
                                  std::size_t bhi) const;

    /**
     * @brief Non-overlapping matching blocks in increasing order, adjacent
     *        blocks merged, terminated by a `{a.size(), b.size(), 0}` sentinel.
     */
    const std::vector<MatchBlock>& matching_blocks();

    /// Edit script turning `a` into `b`.
    const std::vector<Opcode>& opcodes();

    /**
     * @brief Opcodes split into hunks with at most @p context equal lines
     *        of context on each side.
     */
    std::vector<std::vector<Opcode>> grouped_opcodes(std::size_t context = 3);

  private:
    const std::vector<std::string>& a_;
    const std::vector<std::string>& b_;
    std::unordered_map<std::string_view, std::vector<std::size_t>> b2j_;
    std::unordered_set<std::string_view> popular_;
    std::optional<std::vector<MatchBlock>> matching_blocks_;
    std::optional<std::vector<Opcode>> opcodes_;
};

} // namespace diff

#endif // SEQUENCE_MATCHER_HPP
