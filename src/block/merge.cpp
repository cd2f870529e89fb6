#include "block.h"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <unordered_map>

namespace block
{
    const char* toString(BlockStrand s) noexcept
    {
        switch (s) {
            case BlockStrand::plus:  return "+";
            case BlockStrand::minus: return "-";
            case BlockStrand::mixed: return "+/-";
        }
        return "?";
    }

    static BlockStrand strandOf(const fragment::Fragment& f)
    {
        return f.is_rev ? BlockStrand::minus : BlockStrand::plus;
    }

    static std::string mtInterval(const fragment::Fragment& f)
    {
        return std::to_string(f.ref.start.value) + "-" + std::to_string(f.ref.end.value);
    }

    static Block seedBlock(const fragment::Fragment& f)
    {
        Block b;
        b.seq_name = f.seq_name;
        b.start = f.start;
        b.end = f.end;
        b.strand = strandOf(f);
        b.bit_score = f.bit_score;
        b.expect = f.expect;
        b.length = f.length;
        b.identity = f.identity;
        b.frag_nums.push_back(f.frag_num);
        b.mt_frag = mtInterval(f);
        b.frag_len = f.span();
        b.frag_gaps = 0;
        return b;
    }

    static bool canJoin(const Block& b, const fragment::Fragment& f, const MergeParams& params)
    {
        if (f.seq_name != b.seq_name) return false;
        if (f.start - b.end > params.fragmerge) return false;
        if (params.stranded && strandOf(f) != b.strand) return false;
        return true;
    }

    static void extendBlock(Block& b, const fragment::Fragment& f)
    {
        // 片段两两不重叠，gap 正常情况下 >= 0；相邻片段（start == end + 1）时为 0
        b.frag_gaps += f.start - b.end - 1;
        b.frag_len += f.span();

        b.end = std::max(b.end, f.end);
        b.start = std::min(b.start, f.start);
        if (strandOf(f) != b.strand) {
            b.strand = BlockStrand::mixed;
        }

        b.bit_score += f.bit_score;
        b.expect = std::min(b.expect, f.expect);
        b.length += f.length;
        b.identity += f.identity;
        b.frag_nums.push_back(f.frag_num);
        b.mt_frag += '|';
        b.mt_frag += mtInterval(f);
    }

    Blocks mergeBlocks(const fragment::FragmentTable& frags, const MergeParams& params)
    {
        Blocks blocks;
        if (frags.empty()) return blocks;

        std::vector<const fragment::Fragment*> order;
        order.reserve(frags.size());
        for (const auto& f : frags) order.push_back(&f);

        std::stable_sort(order.begin(), order.end(),
            [](const fragment::Fragment* a, const fragment::Fragment* b) {
                return std::tie(a->seq_name, a->start, a->end) < std::tie(b->seq_name, b->start, b->end);
            });

        Block current = seedBlock(*order.front());
        for (std::size_t i = 1; i < order.size(); ++i) {
            const auto& f = *order[i];
            if (canJoin(current, f, params)) {
                extendBlock(current, f);
            } else {
                blocks.push_back(std::move(current));
                current = seedBlock(f);
            }
        }
        blocks.push_back(std::move(current));

        std::size_t n_mixed = 0;
        std::size_t n_multi = 0;
        for (const auto& b : blocks) {
            if (b.strand == BlockStrand::mixed) ++n_mixed;
            if (b.fragCount() > 1) ++n_multi;
        }
        spdlog::info("Merged {} fragments into {} blocks (fragmerge={}, stranded={}); {} multi-fragment, {} mixed-strand",
                     frags.size(), blocks.size(), params.fragmerge, params.stranded, n_multi, n_mixed);
        return blocks;
    }

    fragment::FragmentTable assignBlocks(fragment::FragmentTable frags, const Blocks& blocks)
    {
        std::unordered_map<std::size_t, std::size_t> block_of;
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            for (const auto num : blocks[i].frag_nums) {
                block_of[num] = i + 1;
            }
        }

        for (auto& f : frags) {
            auto it = block_of.find(f.frag_num);
            if (it == block_of.end()) {
                throw std::runtime_error("fragment " + std::to_string(f.frag_num) + " on " + f.seq_name +
                                         " is not assigned to any block");
            }
            f.block_num = it->second;
        }
        return frags;
    }

} // namespace block
