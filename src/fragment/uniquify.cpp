// ==================================================================
// uniquify.cpp - 原始命中去重叠（AlignmentUniquifier）与参考坐标投影（CoordinateProjector）
// ==================================================================
//
// 背景：
// 加倍 mtDNA 作为 query 搜索组装时，同一段组装序列通常会同时命中两份拷贝（坐标相差 L），
// 且 BLAST 会报告大量相互重叠的局部比对。下游的 block 合并与覆盖度统计都要求
// 每个组装位置最多被一个片段解释，因此需要先得到一个两两不重叠的命中子集。
//
// 策略：
// - 排序键为“一致碱基数”而不是比对长度或 bit score：较长但一致性较差的比对不应压过较短但近乎完美的比对；
// - 稳定排序 + hit_index 保证相同输入得到相同输出；
// - 跨链不区分：正负链命中只要组装坐标重叠即视为冲突。
// ==================================================================

#include "fragment.h"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>

namespace fragment
{
    // 已接受区间的有序表：key 为 start，value 为 end（区间两两不重叠，因此按 start 有序时 end 也有序）
    using AcceptedIntervals = std::map<int_t, int_t>;

    // 判断 [start, end] 是否与已接受区间共享至少一个位置
    static bool overlapsAccepted(const AcceptedIntervals& accepted, int_t start, int_t end)
    {
        if (accepted.empty()) return false;

        // 第一个 start > end 的区间不可能重叠；只需检查它之前的那一个
        auto it = accepted.upper_bound(end);
        if (it == accepted.begin()) return false;
        --it;
        return it->second >= start;
    }

    hits::AlignmentHits uniquifyHits(hits::AlignmentHits hits)
    {
        if (hits.empty()) return hits;

        const std::size_t n_in = hits.size();

        // 先按 identity 降序稳定排序；hit_index 作为显式 tie-break，
        // 即使调用方传入的顺序与 hit_index 不一致结果也确定
        std::stable_sort(hits.begin(), hits.end(),
            [](const hits::AlignmentHit& a, const hits::AlignmentHit& b) {
                if (a.identity != b.identity) return a.identity > b.identity;
                return a.hit_index < b.hit_index;
            });

        std::map<std::string, AcceptedIntervals> accepted_by_seq;
        hits::AlignmentHits kept;
        kept.reserve(hits.size());

        for (auto& h : hits) {
            auto& accepted = accepted_by_seq[h.seq_name];
            if (overlapsAccepted(accepted, h.start, h.end)) {
                continue;
            }
            accepted.emplace(h.start, h.end);
            kept.push_back(std::move(h));
        }

        std::sort(kept.begin(), kept.end(),
            [](const hits::AlignmentHit& a, const hits::AlignmentHit& b) {
                return std::tie(a.seq_name, a.start) < std::tie(b.seq_name, b.start);
            });

        spdlog::info("Uniquified alignment hits: {} -> {} non-overlapping hits on {} sequences",
                     n_in, kept.size(), accepted_by_seq.size());
        return kept;
    }

    FragmentTable projectHits(hits::AlignmentHits hits, const coords::RefSpace& space)
    {
        FragmentTable frags;
        frags.reserve(hits.size());

        std::size_t n_wrapped = 0;
        for (auto& h : hits) {
            Fragment f;
            try {
                f.ref = space.project(coords::DoubledPos{h.ref_start}, coords::DoubledPos{h.ref_end});
            } catch (const std::out_of_range& e) {
                throw std::runtime_error("hit on " + h.seq_name + ":" + std::to_string(h.start) + "-" +
                                         std::to_string(h.end) + " has invalid mtDNA coordinates: " + e.what());
            }

            f.seq_name = std::move(h.seq_name);
            f.start = h.start;
            f.end = h.end;
            f.is_rev = h.is_rev;
            f.bit_score = h.bit_score;
            f.expect = h.expect;
            f.length = h.length;
            f.identity = h.identity;
            f.hit_index = h.hit_index;

            if (f.ref.wraps) {
                ++n_wrapped;
                spdlog::debug("Fragment {}:{}-{} spans the mtDNA origin ({}-{})",
                              f.seq_name, f.start, f.end, f.ref.start.value, f.ref.end.value);
            }
            frags.push_back(std::move(f));
        }

        if (space.isCircular()) {
            spdlog::info("Projected {} fragments onto mtDNA length {}; {} span the circular origin",
                         frags.size(), space.trueLength(), n_wrapped);
        }
        return frags;
    }

    FragmentTable numberFragments(FragmentTable frags)
    {
        std::sort(frags.begin(), frags.end(),
            [](const Fragment& a, const Fragment& b) {
                return std::tie(a.seq_name, a.start, a.end, a.is_rev) <
                       std::tie(b.seq_name, b.start, b.end, b.is_rev);
            });

        std::size_t num = 0;
        for (auto& f : frags) {
            f.frag_num = ++num;
        }
        return frags;
    }

    bool isNonOverlapping(const FragmentTable& frags)
    {
        std::vector<const Fragment*> sorted;
        sorted.reserve(frags.size());
        for (const auto& f : frags) sorted.push_back(&f);

        std::sort(sorted.begin(), sorted.end(),
            [](const Fragment* a, const Fragment* b) {
                return std::tie(a->seq_name, a->start) < std::tie(b->seq_name, b->start);
            });

        for (std::size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i]->seq_name == sorted[i - 1]->seq_name && sorted[i]->start <= sorted[i - 1]->end) {
                return false;
            }
        }
        return true;
    }

} // namespace fragment
