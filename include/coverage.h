#ifndef NUMTFINDER_COVERAGE_H
#define NUMTFINDER_COVERAGE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>

#include "config.hpp"
#include "coords.h"
#include "fragment.h"

// ================================================================
// coverage 命名空间：mtDNA 参考上的片段覆盖深度（CoverageAggregator）
// ================================================================
// 深度只在真实参考空间 [1, L] 上统计；跨原点片段在这里（且仅在这里）被拆成
// [start, L] 与 [1, end] 两段分别计数。
// 守恒：Σ depth == Σ 每个片段投影区间的覆盖位置数。
// ================================================================
namespace coverage
{
    struct CoverageSummary
    {
        std::uint64_t covered = 0;      // depth > 0 的位置数
        double covered_pct = 0.0;       // covered / L × 100
        double mean_depth = 0.0;        // Σ depth / L
        std::uint32_t max_depth = 0;

        template <class Archive>
        void serialize(Archive& ar)
        {
            ar(cereal::make_nvp("covered", covered),
               cereal::make_nvp("covered_pct", covered_pct),
               cereal::make_nvp("mean_depth", mean_depth),
               cereal::make_nvp("max_depth", max_depth));
        }
    };

    // CoverageProfile：depth[i] 是参考位置 i+1 的深度（向量长度恰为 L，不存储任何加倍空间位置）
    struct CoverageProfile
    {
        std::string ref_id;
        std::uint64_t ref_len = 0;
        std::uint64_t fragments = 0;    // 参与统计的片段数
        std::vector<std::uint32_t> depth;

        // 1-based 访问；越界抛出 std::out_of_range
        std::uint32_t at(int_t pos) const;

        // Σ depth
        std::uint64_t total() const noexcept;

        CoverageSummary summary() const;
    };

    // 序列化用的包装（profile + summary 一起写出）
    struct CoverageJson
    {
        std::string ref_id;
        std::uint64_t ref_len = 0;
        std::uint64_t fragments = 0;
        CoverageSummary summary;
        std::vector<std::uint32_t> depth;

        template <class Archive>
        void serialize(Archive& ar)
        {
            ar(cereal::make_nvp("ref_id", ref_id),
               cereal::make_nvp("ref_len", ref_len),
               cereal::make_nvp("fragments", fragments),
               cereal::make_nvp("summary", summary),
               cereal::make_nvp("depth", depth));
        }
    };

    CoverageJson toJson(const CoverageProfile& profile);

    // 由最终片段表计算覆盖深度（差分数组，O(n + L)）
    CoverageProfile aggregateCoverage(const fragment::FragmentTable& frags,
                                      const coords::RefSpace& space,
                                      const std::string& ref_id);

} // namespace coverage

#endif //NUMTFINDER_COVERAGE_H
