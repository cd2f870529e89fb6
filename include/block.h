#ifndef NUMTFINDER_BLOCK_H
#define NUMTFINDER_BLOCK_H

#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"
#include "fragment.h"

// ================================================================
// block 命名空间：把相邻的 NUMT 片段合并为 Block（BlockMerger）
// ================================================================
// 单次从左到右扫描（每条序列按 start 排序）：
// - 片段加入当前 Block 的条件：同一序列、start - blockEnd <= fragmerge、
//   且（非 stranded 模式，或与 Block 链方向相同）；
// - 否则关闭当前 Block，以该片段为种子开启新 Block。
//
// 聚合规则：
//   Start/End   成员组装坐标的 min/max
//   Strand      种子片段的链；非 stranded 模式下混入异链片段后为 "+/-"
//   BitScore    求和
//   Expect      取最小值
//   Length      比对长度求和
//   Identity    一致碱基数求和（一致性百分比 = Identity / Length）
//   mtFrag      成员参考区间 "mtStart-mtEnd"，按合并顺序以 '|' 连接
//   FragLen     成员组装跨度 (end - start + 1) 之和
//   FragGaps    每个后续成员累加 start - blockEnd - 1（单片段 Block 为 0）
//   FragNums    成员 frag_num，按合并顺序
// ================================================================
namespace block
{
    enum class BlockStrand
    {
        plus,
        minus,
        mixed
    };

    // "+" / "-" / "+/-"
    const char* toString(BlockStrand s) noexcept;

    struct Block
    {
        std::string seq_name;
        int_t start{0};
        int_t end{0};
        BlockStrand strand{BlockStrand::plus};
        double bit_score{0.0};
        double expect{0.0};
        int_t length{0};
        int_t identity{0};
        std::vector<std::size_t> frag_nums;     // 成员片段编号（合并顺序）
        std::string mt_frag;
        int_t frag_len{0};
        int_t frag_gaps{0};

        std::size_t fragCount() const noexcept { return frag_nums.size(); }
        int_t span() const noexcept { return end - start + 1; }
    };

    using Blocks = std::vector<Block>;

    struct MergeParams
    {
        int_t fragmerge = 8000;     // 最大合并距离 D（bp）
        bool stranded = false;      // 只合并同链片段
    };

    // 合并片段；输入顺序任意（内部按 (seq_name, start, end) 排序），不修改片段表。
    // 返回的 Block 按 (seq_name, start) 排列，编号即下标 + 1。
    Blocks mergeBlocks(const fragment::FragmentTable& frags, const MergeParams& params);

    // 根据 Block 的 frag_nums 回填每个片段的 block_num；
    // 片段必须已经编号，frag_num 不在任何 Block 中时抛出 std::runtime_error
    fragment::FragmentTable assignBlocks(fragment::FragmentTable frags, const Blocks& blocks);

} // namespace block

#endif //NUMTFINDER_BLOCK_H
