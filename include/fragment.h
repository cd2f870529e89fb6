#ifndef NUMTFINDER_FRAGMENT_H
#define NUMTFINDER_FRAGMENT_H

#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"
#include "coords.h"
#include "hits.h"

// ================================================================
// fragment 命名空间：从原始命中到 NUMT 片段（Fragment）
// ================================================================
// 数据流（每一步都是“输入表 -> 新表”的纯变换，不保留隐藏状态）：
//
//   AlignmentHits --uniquifyHits--> AlignmentHits（组装坐标两两不重叠）
//                 --projectHits---> FragmentTable（参考坐标投影到真实空间）
//                 --numberFragments-> FragmentTable（按组装位置排序并编号 frag_num）
//
// Fragment 的生命周期由片段表持有；block_num 只是指向所属 Block 的回指编号（0 表示尚未分配），
// 不表示所有权转移。
// ================================================================
namespace fragment
{
    struct Fragment
    {
        std::string seq_name;           // 组装序列名称
        int_t start{0};                 // 组装坐标（1-based 闭区间，start <= end）
        int_t end{0};
        bool is_rev{false};
        double bit_score{0.0};
        double expect{0.0};
        int_t length{0};                // 比对长度
        int_t identity{0};              // 一致碱基数
        coords::RefInterval ref;        // 真实参考空间坐标（可能跨原点）
        std::size_t hit_index{0};       // 来源命中在输入中的顺序
        std::size_t frag_num{0};        // 运行内唯一编号（1-based），numberFragments 之后有效
        std::size_t block_num{0};       // 所属 Block 编号（1-based），0 表示未分配

        int_t span() const noexcept { return end - start + 1; }
        char strand() const noexcept { return is_rev ? '-' : '+'; }
        bool wraps() const noexcept { return ref.wraps; }
    };

    using FragmentTable = std::vector<Fragment>;

    // ------------------------------------------------------------------
    // uniquifyHits - AlignmentUniquifier
    // ------------------------------------------------------------------
    // 对每条组装序列独立处理：
    // 1. 按一致碱基数（identity）降序做稳定排序，相同 identity 按输入顺序（hit_index）；
    // 2. 依次贪心接受命中；若与同一序列上已接受的任一命中在组装坐标上共享 >= 1 个位置，则拒绝；
    // 3. 结果按 (seq_name, start) 排序返回。
    //
    // 这是贪心的区间调度启发式：优先保留高一致性的命中，而不是最大化命中数或总覆盖长度。
    // 复杂度：O(n log n)；已接受区间用有序表维护，重叠检查 O(log n)。
    // 空输入返回空集合。
    // ------------------------------------------------------------------
    hits::AlignmentHits uniquifyHits(hits::AlignmentHits hits);

    // ------------------------------------------------------------------
    // projectHits - CoordinateProjector
    // ------------------------------------------------------------------
    // 把每个命中的加倍空间参考坐标投影到真实空间（见 coords::RefSpace::project），生成 Fragment。
    // 参考坐标越界属于输入错误：抛出 std::runtime_error（消息包含序列名与坐标）。
    // 跨原点的片段以 debug 级别逐条记录，并在结束时汇总为一条 info 日志。
    // ------------------------------------------------------------------
    FragmentTable projectHits(hits::AlignmentHits hits, const coords::RefSpace& space);

    // ------------------------------------------------------------------
    // numberFragments
    // ------------------------------------------------------------------
    // 按 (seq_name, start, end, strand) 排序，并从 1 开始依次分配 frag_num。
    // ------------------------------------------------------------------
    FragmentTable numberFragments(FragmentTable frags);

    // 检查同一序列上的片段是否两两不重叠（测试与调试辅助）
    bool isNonOverlapping(const FragmentTable& frags);

} // namespace fragment

#endif //NUMTFINDER_FRAGMENT_H
