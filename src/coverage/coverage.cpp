#include "coverage.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace coverage
{
    std::uint32_t CoverageProfile::at(int_t pos) const
    {
        if (pos < 1 || static_cast<std::uint64_t>(pos) > depth.size()) {
            throw std::out_of_range("coverage position " + std::to_string(pos) + " outside [1, " +
                                    std::to_string(depth.size()) + "]");
        }
        return depth[static_cast<std::size_t>(pos - 1)];
    }

    std::uint64_t CoverageProfile::total() const noexcept
    {
        return std::accumulate(depth.begin(), depth.end(), std::uint64_t{0});
    }

    CoverageSummary CoverageProfile::summary() const
    {
        CoverageSummary s;
        if (depth.empty()) return s;

        for (const auto d : depth) {
            if (d > 0) ++s.covered;
            s.max_depth = std::max(s.max_depth, d);
        }
        const double len = static_cast<double>(depth.size());
        s.covered_pct = 100.0 * static_cast<double>(s.covered) / len;
        s.mean_depth = static_cast<double>(total()) / len;
        return s;
    }

    CoverageJson toJson(const CoverageProfile& profile)
    {
        CoverageJson j;
        j.ref_id = profile.ref_id;
        j.ref_len = profile.ref_len;
        j.fragments = profile.fragments;
        j.summary = profile.summary();
        j.depth = profile.depth;
        return j;
    }

    CoverageProfile aggregateCoverage(const fragment::FragmentTable& frags,
                                      const coords::RefSpace& space,
                                      const std::string& ref_id)
    {
        const int_t L = space.trueLength();

        // 差分数组：diff[a] += 1, diff[b+1] -= 1，下标 1..L+1
        std::vector<std::int64_t> diff(static_cast<std::size_t>(L) + 2, 0);
        for (const auto& f : frags) {
            for (const auto& [a, b] : space.split(f.ref)) {
                if (a < 1 || b > L || b < a) {
                    throw std::runtime_error("fragment " + std::to_string(f.frag_num) + " on " + f.seq_name +
                                             " has reference interval outside [1, " + std::to_string(L) + "]");
                }
                diff[static_cast<std::size_t>(a)] += 1;
                diff[static_cast<std::size_t>(b) + 1] -= 1;
            }
        }

        CoverageProfile profile;
        profile.ref_id = ref_id;
        profile.ref_len = static_cast<std::uint64_t>(L);
        profile.fragments = frags.size();
        profile.depth.resize(static_cast<std::size_t>(L), 0);

        std::int64_t running = 0;
        for (int_t pos = 1; pos <= L; ++pos) {
            running += diff[static_cast<std::size_t>(pos)];
            profile.depth[static_cast<std::size_t>(pos - 1)] = static_cast<std::uint32_t>(running);
        }

        const auto s = profile.summary();
        spdlog::info("mtDNA coverage: {} fragments cover {}/{} positions ({:.2f}%), mean depth {:.3f}, max depth {}",
                     frags.size(), s.covered, L, s.covered_pct, s.mean_depth, s.max_depth);
        return profile;
    }

} // namespace coverage
