#ifndef NUMTFINDER_PIPELINE_H
#define NUMTFINDER_PIPELINE_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "block.h"
#include "config.hpp"
#include "coords.h"
#include "coverage.h"
#include "fragment.h"
#include "hits.h"
#include "selfhit.h"

// ================================================================
// pipeline：一次 NUMT 搜索运行的编排
// ================================================================
// processHits 是纯计算部分（不读写文件），runNumtFinder 在其外围完成
// mtDNA 载入、加倍、外部搜索、结果写出与序列输出。
// ================================================================
namespace pipeline
{
    struct CoreParams
    {
        hits::HitFilterParams filter;
        selfhit::SelfHitParams selfhit;
        block::MergeParams merge;
        std::set<std::string> exclude;      // 用户给出的初始排除集合
    };

    struct CoreResult
    {
        fragment::FragmentTable fragments;              // 最终片段（已编号并回填 block_num）
        block::Blocks blocks;
        std::vector<selfhit::SelfHitReport> selfhits;
        std::set<std::string> exclusion;                // 最终排除集合
        coverage::CoverageProfile coverage;

        std::size_t hits_in{0};                         // 进入过滤前的命中数
        std::size_t hits_filtered{0};                   // 通过 expect/长度过滤的命中数
        std::size_t hits_unique{0};                     // 去重叠后的命中数
    };

    // filter -> uniquify -> project -> self-hit filter -> number -> merge -> coverage
    CoreResult processHits(hits::AlignmentHits hits,
                           const coords::RefSpace& space,
                           const CoreParams& params,
                           const std::string& ref_id);

    // 由命令行参数构造核心参数
    CoreParams makeCoreParams(const Options& opt);

    // 输出文件路径：outdir/basefile + suffix
    FilePath outputPath(const Options& opt, const std::string& suffix);

    // 完整运行；任何输入错误以 std::runtime_error 抛出
    CoreResult runNumtFinder(const Options& opt);

} // namespace pipeline

#endif //NUMTFINDER_PIPELINE_H
