#include "sequence_matcher.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace diff {

const char* to_string(OpTag tag) {
    switch (tag) {
    case OpTag::Equal:
        return "equal";
    case OpTag::Delete:
        return "delete";
    case OpTag::Insert:
        return "insert";
    case OpTag::Replace:
        return "replace";
    }
    return "equal";
}

SequenceMatcher::SequenceMatcher(const std::vector<std::string>& a,
                                 const std::vector<std::string>& b, bool autojunk)
    : a_(a), b_(b) {
    for (std::size_t j = 0; j < b_.size(); ++j)
        b2j_[std::string_view(b_[j])].push_back(j);

    const std::size_t n = b_.size();
    if (autojunk && n >= 200) {
        const std::size_t ntest = n / 100 + 1;
        for (auto it = b2j_.begin(); it != b2j_.end();) {
            if (it->second.size() > ntest) {
                popular_.insert(it->first);
                it = b2j_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

MatchBlock SequenceMatcher::find_longest_match(std::size_t alo, std::size_t ahi,
                                               std::size_t blo, std::size_t bhi) const {
    std::size_t besti = alo;
    std::size_t bestj = blo;
    std::size_t bestsize = 0;

    // j2len[j] = length of the match ending at a[i - 1] and b[j].
    std::unordered_map<std::size_t, std::size_t> j2len;
    std::unordered_map<std::size_t, std::size_t> newj2len;
    for (std::size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto hit = b2j_.find(std::string_view(a_[i]));
        if (hit != b2j_.end()) {
            for (std::size_t j : hit->second) {
                if (j < blo)
                    continue;
                if (j >= bhi)
                    break;
                std::size_t k = 1;
                if (j > 0) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end())
                        k = prev->second + 1;
                }
                newj2len[j] = k;
                if (k > bestsize) {
                    besti = i + 1 - k;
                    bestj = j + 1 - k;
                    bestsize = k;
                }
            }
        }
        std::swap(j2len, newj2len);
    }

    // Popular lines never seed a match but may extend one on either side.
    while (besti > alo && bestj > blo && a_[besti - 1] == b_[bestj - 1]) {
        --besti;
        --bestj;
        ++bestsize;
    }
    while (besti + bestsize < ahi && bestj + bestsize < bhi &&
           a_[besti + bestsize] == b_[bestj + bestsize])
        ++bestsize;

    return MatchBlock{besti, bestj, bestsize};
}

const std::vector<MatchBlock>& SequenceMatcher::matching_blocks() {
    if (matching_blocks_)
        return *matching_blocks_;

    const std::size_t la = a_.size();
    const std::size_t lb = b_.size();
    std::vector<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> queue;
    queue.emplace_back(0, la, 0, lb);
    std::vector<MatchBlock> found;
    while (!queue.empty()) {
        auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();
        MatchBlock m = find_longest_match(alo, ahi, blo, bhi);
        if (m.size == 0)
            continue;
        found.push_back(m);
        if (alo < m.a && blo < m.b)
            queue.emplace_back(alo, m.a, blo, m.b);
        if (m.a + m.size < ahi && m.b + m.size < bhi)
            queue.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
    }
    std::sort(found.begin(), found.end(), [](const MatchBlock& x, const MatchBlock& y) {
        return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
    });

    std::vector<MatchBlock> merged;
    for (const auto& m : found) {
        if (!merged.empty()) {
            MatchBlock& last = merged.back();
            if (last.a + last.size == m.a && last.b + last.size == m.b) {
                last.size += m.size;
                continue;
            }
        }
        merged.push_back(m);
    }
    merged.push_back(MatchBlock{la, lb, 0});
    matching_blocks_ = std::move(merged);
    return *matching_blocks_;
}

const std::vector<Opcode>& SequenceMatcher::opcodes() {
    if (opcodes_)
        return *opcodes_;

    std::vector<Opcode> out;
    std::size_t i = 0;
    std::size_t j = 0;
    for (const auto& m : matching_blocks()) {
        if (i < m.a && j < m.b)
            out.push_back(Opcode{OpTag::Replace, i, m.a, j, m.b});
        else if (i < m.a)
            out.push_back(Opcode{OpTag::Delete, i, m.a, j, m.b});
        else if (j < m.b)
            out.push_back(Opcode{OpTag::Insert, i, m.a, j, m.b});
        i = m.a + m.size;
        j = m.b + m.size;
        if (m.size > 0)
            out.push_back(Opcode{OpTag::Equal, m.a, i, m.b, j});
    }
    opcodes_ = std::move(out);
    return *opcodes_;
}

std::vector<std::vector<Opcode>> SequenceMatcher::grouped_opcodes(std::size_t context) {
    std::vector<Opcode> codes = opcodes();
    if (codes.empty())
        codes.push_back(Opcode{OpTag::Equal, 0, 1, 0, 1});

    Opcode& first = codes.front();
    if (first.tag == OpTag::Equal) {
        first.i1 = std::max(first.i1, first.i2 > context ? first.i2 - context : 0);
        first.j1 = std::max(first.j1, first.j2 > context ? first.j2 - context : 0);
    }
    Opcode& last = codes.back();
    if (last.tag == OpTag::Equal) {
        last.i2 = std::min(last.i2, last.i1 + context);
        last.j2 = std::min(last.j2, last.j1 + context);
    }

    const std::size_t nn = context + context;
    std::vector<std::vector<Opcode>> groups;
    std::vector<Opcode> group;
    for (Opcode op : codes) {
        if (op.tag == OpTag::Equal && op.i2 - op.i1 > nn) {
            group.push_back(Opcode{OpTag::Equal, op.i1, std::min(op.i2, op.i1 + context), op.j1,
                                   std::min(op.j2, op.j1 + context)});
            groups.push_back(std::move(group));
            group.clear();
            op.i1 = std::max(op.i1, op.i2 - context);
            op.j1 = std::max(op.j1, op.j2 - context);
        }
        group.push_back(op);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == OpTag::Equal))
        groups.push_back(std::move(group));
    return groups;
}

} // namespace diff
