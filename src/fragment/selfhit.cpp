#include "selfhit.h"

#include <algorithm>
#include <cstdint>
#include <map>

namespace selfhit
{
    static double percentOf(int_t part, int_t total)
    {
        if (total <= 0) return 0.0;
        return 100.0 * static_cast<double>(part) / static_cast<double>(total);
    }

    static double identityPercent(int_t identical, int_t aligned)
    {
        if (aligned <= 0) return 0.0;
        return 100.0 * static_cast<double>(identical) / static_cast<double>(aligned);
    }

    double referenceCoverage(const std::vector<const fragment::Fragment*>& frags, const coords::RefSpace& space)
    {
        std::vector<coords::RefPiece> pieces;
        pieces.reserve(frags.size() * 2);
        for (const auto* f : frags) {
            auto p = space.split(f->ref);
            pieces.insert(pieces.end(), p.begin(), p.end());
        }
        return percentOf(coords::unionLength(pieces), space.trueLength());
    }

    SelfHitReport assessSequence(const std::vector<const fragment::Fragment*>& frags,
                                 const coords::RefSpace& space,
                                 const SelfHitParams& params)
    {
        SelfHitReport rep;
        if (frags.empty()) return rep;

        rep.seq_name = frags.front()->seq_name;

        // 全部片段的覆盖度达不到阈值时无需求 core
        const double total_cov = referenceCoverage(frags, space);
        if (total_cov < params.min_coverage) {
            int_t ident = 0;
            int_t len = 0;
            for (const auto* f : frags) {
                ident += f->identity;
                len += f->length;
            }
            rep.coverage = total_cov;
            rep.identity = identityPercent(ident, len);
            rep.extra_frags = frags.size();
            return rep;
        }

        // 按一致碱基数降序逐个加入，用位图增量统计新覆盖的位置
        std::vector<const fragment::Fragment*> order(frags.begin(), frags.end());
        std::stable_sort(order.begin(), order.end(),
            [](const fragment::Fragment* a, const fragment::Fragment* b) {
                if (a->identity != b->identity) return a->identity > b->identity;
                return a->hit_index < b->hit_index;
            });

        const int_t L = space.trueLength();
        std::vector<std::uint8_t> covered(static_cast<std::size_t>(L) + 1, 0);
        int_t n_covered = 0;
        int_t core_ident = 0;
        int_t core_len = 0;

        for (const auto* f : order) {
            for (const auto& [a, b] : space.split(f->ref)) {
                for (int_t pos = a; pos <= b; ++pos) {
                    auto& c = covered[static_cast<std::size_t>(pos)];
                    if (!c) {
                        c = 1;
                        ++n_covered;
                    }
                }
            }
            core_ident += f->identity;
            core_len += f->length;
            ++rep.core_frags;

            rep.coverage = percentOf(n_covered, L);
            if (rep.coverage >= params.min_coverage) break;
        }

        rep.identity = identityPercent(core_ident, core_len);
        rep.extra_frags = frags.size() - rep.core_frags;
        return rep;
    }

    SelfHitResult filterSelfHits(fragment::FragmentTable frags,
                                 const coords::RefSpace& space,
                                 const SelfHitParams& params,
                                 std::set<std::string> exclusion)
    {
        SelfHitResult result;

        std::map<std::string, std::vector<const fragment::Fragment*>> by_seq;
        for (const auto& f : frags) {
            by_seq[f.seq_name].push_back(&f);
        }

        for (const auto& [name, seq_frags] : by_seq) {
            SelfHitReport rep = assessSequence(seq_frags, space, params);
            const bool is_self = rep.core_frags > 0 &&
                                 rep.coverage >= params.min_coverage &&
                                 rep.identity >= params.min_identity;
            if (!is_self) continue;

            rep.excluded = params.auto_exclude || exclusion.count(name) > 0;
            if (params.auto_exclude) {
                exclusion.insert(name);
            }

            spdlog::info("Self-hit: {} covers {:.2f}% of mtDNA at {:.2f}% identity ({} core fragments){}",
                         name, rep.coverage, rep.identity, rep.core_frags,
                         rep.excluded ? "; excluded" : "; kept (auto-exclusion disabled)");
            if (rep.extra_frags > 0) {
                spdlog::warn("Self-hit sequence {} has {} additional fragments outside the mtDNA copy: "
                             "possible mtDNA + NUMT sequence{}",
                             name, rep.extra_frags, rep.excluded ? " (still excluded)" : "");
            }
            result.reports.push_back(std::move(rep));
        }

        // 排除集合确定之后统一丢弃；by_seq 中的指针在此之后不再使用
        const std::size_t before = frags.size();
        auto new_end = std::remove_if(frags.begin(), frags.end(),
            [&exclusion](const fragment::Fragment& f) {
                return exclusion.count(f.seq_name) > 0;
            });
        frags.erase(new_end, frags.end());

        result.dropped = before - frags.size();
        result.fragments = std::move(frags);
        result.exclusion = std::move(exclusion);

        spdlog::info("Self-hit filter: {} self-hit sequences; {} sequences excluded; {} fragments dropped",
                     result.reports.size(), result.exclusion.size(), result.dropped);
        return result;
    }

} // namespace selfhit
