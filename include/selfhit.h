#ifndef NUMTFINDER_SELFHIT_H
#define NUMTFINDER_SELFHIT_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "coords.h"
#include "fragment.h"

// ================================================================
// selfhit 命名空间：识别组装中“本身就是 mtDNA 拷贝”的序列（SelfHitFilter）
// ================================================================
// 组装里通常含有一条（近乎）完整的线粒体基因组序列；它对 mtDNA 的命中不是 NUMT，
// 需要从片段/Block 输出中排除，但要在报告中列出。
//
// 判定（对每条组装序列）：
// - coverage：该序列全部片段投影到真实参考后，并集覆盖 [1, L] 的百分比；
// - core：按一致碱基数降序（稳定）依次加入片段，直到并集覆盖达到 min_coverage 为止的最短前缀；
// - identity：core 片段的 Σidentity / Σlength × 100；
// - coverage >= min_coverage 且 identity >= min_identity 即为自身命中。
// core 之外还有片段的自身命中序列会产生一条警告（可能是 mtDNA + NUMT 的真实序列），
// 但只要 auto_exclude 为 true 仍然被排除。
// ================================================================
namespace selfhit
{
    struct SelfHitParams
    {
        double min_coverage = 99.0;     // mtmaxcov（%）
        double min_identity = 99.0;     // mtmaxid（%）
        bool auto_exclude = true;       // mtmaxexclude
    };

    struct SelfHitReport
    {
        std::string seq_name;
        double coverage{0.0};           // %
        double identity{0.0};           // %（core 片段）
        std::size_t core_frags{0};
        std::size_t extra_frags{0};     // core 之外的片段数
        bool excluded{false};
    };

    struct SelfHitResult
    {
        std::set<std::string> exclusion;        // 更新后的排除集合（含初始集合）
        std::vector<SelfHitReport> reports;     // 每条自身命中序列一条，按序列名排序
        fragment::FragmentTable fragments;      // 去除排除序列后的片段表
        std::size_t dropped{0};                 // 被丢弃的片段数
    };

    // 单条序列的覆盖度百分比（片段可来自任意序列，调用方负责预先分组）
    double referenceCoverage(const std::vector<const fragment::Fragment*>& frags, const coords::RefSpace& space);

    // 对单条序列求 core；未达到覆盖度阈值时 core_frags == 0 且 identity 为全部片段的一致性
    SelfHitReport assessSequence(const std::vector<const fragment::Fragment*>& frags,
                                 const coords::RefSpace& space,
                                 const SelfHitParams& params);

    // 完整的过滤阶段：识别自身命中 -> 更新排除集合 -> 丢弃排除序列的片段
    SelfHitResult filterSelfHits(fragment::FragmentTable frags,
                                 const coords::RefSpace& space,
                                 const SelfHitParams& params,
                                 std::set<std::string> exclusion);

} // namespace selfhit

#endif //NUMTFINDER_SELFHIT_H
